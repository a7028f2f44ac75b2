/***
 * Name: pyp::tmpl (parser)
 * Purpose: Recursive-descent block parser from preprocessed lines to a node tree.
 * Inputs: Preprocessed SourceLines
 * Outputs: ParseResult (root Sequence + LineMap); throws exceptions::ParseError
 * Theory of Operation: One top-to-bottom pass with no backtracking. Each control
 *   block is parsed by a recursive call that returns at its `%end<keyword>`, so
 *   recursion depth equals nesting depth.
 */
#pragma once

#include <memory>
#include <vector>

#include "pyp/template/line_map.h"
#include "pyp/template/node.h"
#include "pyp/template/source_line.h"

namespace pyp {
namespace tmpl {

struct ParseResult {
  std::unique_ptr<Sequence> root;
  LineMap line_map;
};

/*** ParseTemplate: Parse every line; throws ParseError on keyword mismatches. */
ParseResult ParseTemplate(const std::vector<SourceLine>& lines);

}  // namespace tmpl
}  // namespace pyp
