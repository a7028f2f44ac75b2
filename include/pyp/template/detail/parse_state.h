/***
 * Name: pyp::tmpl::detail (parser internals)
 * Purpose: Cursor and insertion-point types shared by the parser's translation units.
 * Inputs: N/A (declarations only)
 * Outputs: ParseState, BlockBuilder and the recursive entry points
 * Theory of Operation: ParseState owns the only cursor into the immutable line
 *   array and is passed by reference down the recursion. Each open block gets its
 *   own BlockBuilder naming the node list that receives new nodes; a middle
 *   clause re-points that builder at the new clause.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "pyp/template/line_map.h"
#include "pyp/template/node.h"
#include "pyp/template/source_line.h"

namespace pyp {
namespace tmpl {
namespace detail {

struct ParseState {
  const std::vector<SourceLine>& lines;
  std::size_t cursor{0};
  LineMap line_map{};
};

struct BlockBuilder {
  NodeList* target;
  ControlSequence* control;  // nullptr for the root sequence
  bool accumulates;
};

/*** ParseBody: Consume lines into builder until its end keyword (or input end at root). */
void ParseBody(ParseState& state, BlockBuilder& builder);

/*** AppendVerbatimBlock: Consume a `<% ... %>` block opened at start. */
void AppendVerbatimBlock(ParseState& state, BlockBuilder& builder, const SourceLine& start);

}  // namespace detail
}  // namespace tmpl
}  // namespace pyp
