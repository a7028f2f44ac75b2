/***
 * Name: pyp::tmpl::detail::ParseBody
 * Purpose: Consume template lines into the block described by `builder`.
 * Inputs:
 *   - state: shared cursor and LineMap
 *   - builder: insertion point of the open block (root when control == nullptr)
 * Outputs: Nodes appended under builder; cursor advanced past the block's end
 * Theory of Operation:
 *   Each line is tested in priority order: comment/placeholder, `<%` block,
 *   block start (recursive call), middle clause, block end (return), raw
 *   statement, literal text. Every line that produces code records one LineMap
 *   entry at the moment its node is appended, which is the order the code
 *   generator later emits it in. A block still open at end of input is
 *   reported at the last line; the message names the line that opened it.
 */
#include "pyp/template/detail/parse_state.h"

#include <string>
#include <utility>

#include "pyp/exceptions/parse_error.h"
#include "pyp/template/literal_line.h"
#include "pyp/template/syntax.h"

namespace pyp::tmpl::detail {

namespace {

std::string AccumulatorInit() { return std::string(kAccumulator) + " = []"; }

std::string AccumulatorReturn() { return "return '\\n'.join(" + std::string(kAccumulator) + ")"; }

std::string DescribeOpenBlock(const ControlSequence& control) {
  return "('" + control.blocks.front().header + "', line " + std::to_string(control.line) + ")";
}

void AppendSynthetic(ParseState& state, BlockBuilder& builder, std::string text) {
  add_child(*builder.target, make_node<StatementLine>(std::move(text)));
  state.line_map.Skip();
}

void AppendMapped(ParseState& state, BlockBuilder& builder, std::string text, int template_line) {
  add_child(*builder.target, make_node<StatementLine>(std::move(text)));
  state.line_map.Record(template_line);
}

void OpenControlBlock(ParseState& state, BlockBuilder& parent, const SourceLine& src, const ControlStart& start) {
  const bool is_pypdef = start.keyword == ControlKeyword::Pypdef;
  std::string header = start.statement;
  if (is_pypdef) {
    header.replace(0, KeywordName(ControlKeyword::Pypdef).size(), "def");
  }
  const bool accumulates = parent.accumulates || is_pypdef;
  auto control = make_node<ControlSequence>(start.keyword, src.line, accumulates);
  control->blocks.push_back(ControlBlock{header, std::string(KeywordName(start.keyword)), src.line, {}});
  state.line_map.Record(src.line);

  BlockBuilder child{&control->blocks.back().nodes, control.get(), accumulates};
  if (is_pypdef) {
    AppendSynthetic(state, child, AccumulatorInit());
  }
  ParseBody(state, child);
  add_child(*parent.target, std::move(control));
}

void OpenMiddleClause(ParseState& state, BlockBuilder& builder, const SourceLine& src, const ControlMiddle& middle) {
  const std::string word(MiddleKeywordName(middle.keyword));
  if (builder.control == nullptr) {
    throw exceptions::ParseError("Found middle control word (" + word + ") without starting word", src.text,
                                 src.line);
  }
  if (StartKeywordFor(middle.keyword) != builder.control->keyword) {
    throw exceptions::ParseError(
        "Middle control word (" + word + ") doesn't match current block " + DescribeOpenBlock(*builder.control),
        src.text, src.line);
  }
  state.line_map.Record(src.line);
  builder.control->blocks.push_back(ControlBlock{middle.statement, word, src.line, {}});
  builder.target = &builder.control->blocks.back().nodes;
}

void CheckControlEnd(const BlockBuilder& builder, const SourceLine& src, ControlKeyword keyword) {
  const std::string word = "end" + std::string(KeywordName(keyword));
  if (builder.control == nullptr) {
    throw exceptions::ParseError("Found end control word (" + word + ") without starting word", src.text, src.line);
  }
  if (keyword != builder.control->keyword) {
    throw exceptions::ParseError(
        "End control word (" + word + ") doesn't match current block " + DescribeOpenBlock(*builder.control),
        src.text, src.line);
  }
}

}  // namespace

void ParseBody(ParseState& state, BlockBuilder& builder) {  // NOLINT(readability-function-cognitive-complexity)
  while (state.cursor < state.lines.size()) {
    const SourceLine& src = state.lines[state.cursor++];
    if (src.placeholder || IsCommentLine(src.text)) {
      continue;
    }
    if (IsBlockStart(src.text)) {
      AppendVerbatimBlock(state, builder, src);
      continue;
    }
    if (const auto start = MatchControlStart(src.text)) {
      OpenControlBlock(state, builder, src, *start);
      continue;
    }
    if (const auto middle = MatchControlMiddle(src.text)) {
      OpenMiddleClause(state, builder, src, *middle);
      continue;
    }
    if (const auto end = MatchControlEnd(src.text)) {
      CheckControlEnd(builder, src, *end);
      if (*end == ControlKeyword::Pypdef) {
        AppendSynthetic(state, builder, AccumulatorReturn());
      }
      return;
    }
    if (auto statement = MatchStatement(src.text)) {
      AppendMapped(state, builder, std::move(*statement), src.line);
      continue;
    }
    const EmitTarget target = builder.accumulates ? EmitTarget::Accumulate : EmitTarget::Print;
    AppendMapped(state, builder, TransformLiteralLine(src.text, target), src.line);
  }

  if (builder.control != nullptr) {
    const ControlSequence& open = *builder.control;
    const SourceLine& last = state.lines.back();
    throw exceptions::ParseError("Reached end of input without end control word (end" +
                                     std::string(KeywordName(open.keyword)) + ") for block " +
                                     DescribeOpenBlock(open),
                                 last.text, last.line);
  }
}

}  // namespace pyp::tmpl::detail
