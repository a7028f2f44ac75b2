/***
 * Name: pyp::tmpl (syntax)
 * Purpose: Recognize template markers: comments, `<% %>` blocks, `%` control
 *   directives, raw `%` statements and `${...}` expressions.
 * Inputs: One template line (string_view)
 * Outputs: Classification results; optional payloads for directives
 * Theory of Operation: Control keywords form a closed enum; every mapping is an
 *   exhaustive switch. A keyword must be a whole identifier, so `% format = 1`
 *   is a raw statement rather than a `for` block.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pyp {
namespace tmpl {

/*** ControlKeyword: Keywords that open a block closed by `%end<keyword>`. */
enum class ControlKeyword { For, If, Try, While, Def, Class, With, Pypdef };

/*** MiddleKeyword: Keywords that open a further clause of an open block. */
enum class MiddleKeyword { Elif, Else, Except, Finally };

inline constexpr std::string_view kPrintFunction = "_PRINT";
inline constexpr std::string_view kAccumulator = "_OUTPUT";

/*** KeywordName: Template spelling of a control keyword ("for", "pypdef", ...). */
std::string_view KeywordName(ControlKeyword keyword);

/*** MiddleKeywordName: Template spelling of a middle keyword ("elif", ...). */
std::string_view MiddleKeywordName(MiddleKeyword keyword);

/*** StartKeywordFor: The block keyword a middle keyword belongs to (elif -> if). */
ControlKeyword StartKeywordFor(MiddleKeyword keyword);

/*** ControlStart: `% for x in xs:` -> {For, "for x in xs:"}. */
struct ControlStart {
  ControlKeyword keyword;
  std::string statement;
};

/*** ControlMiddle: `% elif x:` -> {Elif, "elif x:"}. */
struct ControlMiddle {
  MiddleKeyword keyword;
  std::string statement;
};

/*** IsCommentLine: Line whose first non-blank characters are `##`. */
bool IsCommentLine(std::string_view line);

/*** IsBlockStart: Line whose first non-blank characters are `<%`. */
bool IsBlockStart(std::string_view line);

/*** IsBlockEnd: Line whose first non-blank characters are `%>`. */
bool IsBlockEnd(std::string_view line);

/*** MatchControlStart: `%` + start keyword + text ending in `:`. */
std::optional<ControlStart> MatchControlStart(std::string_view line);

/*** MatchControlMiddle: `%` + middle keyword + text ending in `:`. */
std::optional<ControlMiddle> MatchControlMiddle(std::string_view line);

/*** MatchControlEnd: `%end<keyword>`; returns the keyword being closed. */
std::optional<ControlKeyword> MatchControlEnd(std::string_view line);

/*** MatchStatement: Any other `%` line; returns the text after `%` and blanks. */
std::optional<std::string> MatchStatement(std::string_view line);

}  // namespace tmpl
}  // namespace pyp
