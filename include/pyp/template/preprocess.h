/***
 * Name: pyp::tmpl (preprocess)
 * Purpose: Split template text into numbered lines, folding multi-line `${...}`
 *   expressions onto one logical line.
 * Inputs: Raw template text
 * Outputs: One SourceLine per physical line of the input
 * Theory of Operation: Each newline removed from inside an expression is replaced
 *   by a space and compensated by one placeholder line directly after, so the
 *   output has exactly as many lines as the input and line i is SourceLine i.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pyp/template/source_line.h"

namespace pyp {
namespace tmpl {

/*** SplitLines: Split on '\n', dropping one trailing '\r' per line. */
std::vector<std::string> SplitLines(std::string_view text);

/*** Preprocess: Normalize expressions and number every physical line. */
std::vector<SourceLine> Preprocess(std::string_view text);

}  // namespace tmpl
}  // namespace pyp
