/***
 * Name: pyp::tmpl::detail (scan helpers)
 * Purpose: Small string_view scanners shared by the marker matchers.
 * Inputs: Template line fragments
 * Outputs: Trimmed views and keyword lookups
 * Theory of Operation: Whitespace follows std::isspace; identifiers are
 *   [A-Za-z0-9_]. Views returned always alias the input.
 */
#pragma once

#include <optional>
#include <string_view>

#include "pyp/template/syntax.h"

namespace pyp {
namespace tmpl {
namespace detail {

/*** SkipBlanks: Remove leading whitespace. */
std::string_view SkipBlanks(std::string_view text);

/*** StripDirective: For `<ws>%<ws>rest` return rest; nullopt if no leading `%`. */
std::optional<std::string_view> StripDirective(std::string_view line);

/*** LeadingIdentifier: Longest identifier prefix (possibly empty). */
std::string_view LeadingIdentifier(std::string_view text);

/*** KeywordFromName: "for" -> For; nullopt for anything else. */
std::optional<ControlKeyword> KeywordFromName(std::string_view name);

/*** MiddleKeywordFromName: "elif" -> Elif; nullopt for anything else. */
std::optional<MiddleKeyword> MiddleKeywordFromName(std::string_view name);

}  // namespace detail
}  // namespace tmpl
}  // namespace pyp
