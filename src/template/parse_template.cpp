/***
 * Name: pyp::tmpl::ParseTemplate
 * Purpose: Parse preprocessed template lines into a Sequence tree and LineMap.
 * Inputs:
 *   - lines: output of Preprocess()
 * Outputs:
 *   - ParseResult with the root Sequence and the generated->template LineMap
 * Theory of Operation: Creates the single cursor over `lines` and the root
 *   builder, then runs ParseBody until the input is exhausted. Throws
 *   exceptions::ParseError on any keyword-structure violation.
 */
#include "pyp/template/parser.h"

#include <utility>
#include <vector>

#include "pyp/template/detail/parse_state.h"

namespace pyp::tmpl {

auto ParseTemplate(const std::vector<SourceLine>& lines) -> ParseResult {
  auto root = make_node<Sequence>();
  detail::ParseState state{lines};
  detail::BlockBuilder builder{&root->nodes, nullptr, false};
  detail::ParseBody(state, builder);
  return ParseResult{std::move(root), std::move(state.line_map)};
}

}  // namespace pyp::tmpl
