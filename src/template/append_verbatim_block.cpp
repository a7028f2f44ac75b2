/***
 * Name: pyp::tmpl::detail::AppendVerbatimBlock
 * Purpose: Consume a `<% ... %>` block of raw Python and append its lines.
 * Inputs:
 *   - state: cursor positioned just after the `<%` line
 *   - builder: insertion point
 *   - start: the `<%` line (for error reporting)
 * Outputs: One StatementLine (with its own LineMap entry) per block line
 * Theory of Operation:
 *   The block's common indentation is the leading-whitespace width of its first
 *   line that is neither blank nor a `#` comment. A line holding an odd number
 *   of `"""`/`'''` tokens flips the in-string state for the lines after it;
 *   lines read while in-string are kept verbatim. All other lines lose up to
 *   that many leading whitespace characters and are re-indented by codegen.
 */
#include "pyp/template/detail/parse_state.h"

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pyp/exceptions/parse_error.h"
#include "pyp/template/detail/scan.h"
#include "pyp/template/syntax.h"

namespace pyp::tmpl::detail {

namespace {

struct PendingLine {
  std::string text;
  int line;
  bool verbatim;
};

std::size_t CountTripleQuotes(std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos + 3 <= text.size()) {
    const std::string_view candidate = text.substr(pos, 3);
    if (candidate == R"(""")" || candidate == "'''") {
      ++count;
      pos += 3;
    } else {
      ++pos;
    }
  }
  return count;
}

std::size_t LeadingWhitespace(std::string_view text) {
  return text.size() - SkipBlanks(text).size();
}

bool IsBlankOrComment(std::string_view text) {
  const std::string_view rest = SkipBlanks(text);
  return rest.empty() || rest.front() == '#';
}

std::string StripIndent(const std::string& text, std::size_t width) {
  std::size_t count = 0;
  while (count < width && count < text.size() && std::isspace(static_cast<unsigned char>(text[count])) != 0) {
    ++count;
  }
  return text.substr(count);
}

}  // namespace

void AppendVerbatimBlock(ParseState& state, BlockBuilder& builder, const SourceLine& start) {
  std::vector<PendingLine> pending;
  std::optional<std::size_t> indent;
  bool in_string = false;
  bool closed = false;

  while (state.cursor < state.lines.size()) {
    const SourceLine& src = state.lines[state.cursor++];
    if (IsBlockEnd(src.text)) {
      closed = true;
      break;
    }
    if (src.placeholder) {
      continue;
    }
    const bool verbatim = in_string;
    if (CountTripleQuotes(src.text) % 2 != 0) {
      in_string = !in_string;
    }
    if (!indent && !IsBlankOrComment(src.text)) {
      indent = LeadingWhitespace(src.text);
    }
    pending.push_back(PendingLine{src.text, src.line, verbatim});
  }
  if (!closed) {
    throw exceptions::ParseError("Unterminated verbatim block (missing %>)", start.text, start.line);
  }

  for (auto& entry : pending) {
    std::string text = entry.verbatim ? std::move(entry.text) : StripIndent(entry.text, indent.value_or(0));
    add_child(*builder.target, make_node<StatementLine>(std::move(text), entry.verbatim));
    state.line_map.Record(entry.line);
  }
}

}  // namespace pyp::tmpl::detail
