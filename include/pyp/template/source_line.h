/***
 * Name: pyp::tmpl::SourceLine
 * Purpose: One physical template line after preprocessing.
 * Inputs: Produced by Preprocess()
 * Outputs: Consumed (read-only) by the block parser
 * Theory of Operation: `line` is the 1-based physical line number in the original
 *   template. Placeholder lines stand in for newlines removed from a multi-line
 *   `${...}` expression; they keep line numbering 1:1 and never produce code.
 */
#pragma once

#include <string>

namespace pyp {
namespace tmpl {

struct SourceLine {
  std::string text{};
  int line{1};
  bool placeholder{false};
};

}  // namespace tmpl
}  // namespace pyp
