/***
 * Name: pyp::diagnostics
 * Purpose: Template-level error reports: parse errors and execution failures
 *   resolved back to the template lines that caused them.
 * Inputs: ParseError, exec::Failure, LineMap, original template lines
 * Outputs: Diagnostic values and their printed form
 * Theory of Operation: Generated-line numbers are resolved through the LineMap
 *   only; a line without an entry stays unmapped and is reported as such. The
 *   text shown is always the original template line, never the preprocessed one.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "pyp/exceptions/parse_error.h"
#include "pyp/exec/failure.h"
#include "pyp/template/line_map.h"

namespace pyp {
namespace diagnostics {

/*** TemplateFrame: One program frame resolved to the template (line unset when unmapped). */
struct TemplateFrame {
  std::optional<int> line{};
  std::string text{};
};

struct Diagnostic {
  enum class Kind { Parse, Syntax, Runtime };
  Kind kind{Kind::Parse};
  std::string file{};
  std::optional<int> line{};  // template line; unset = could not be determined
  std::string line_text{};
  std::string type{};
  std::string message{};
  std::string detail{};
  std::string traceback{};
  std::vector<TemplateFrame> template_frames{};
};

/*** FromParseError: Diagnostic for a structural template error. */
Diagnostic FromParseError(const exceptions::ParseError& error, const std::vector<std::string>& template_lines,
                          const std::string& input_name);

/*** MapFailure: Resolve an execution failure's generated lines to template lines. */
Diagnostic MapFailure(const exec::Failure& failure, const tmpl::LineMap& line_map,
                      const std::vector<std::string>& template_lines, const std::string& input_name);

/*** PrintDiagnostic: Render the banner report; debug adds the raw and template tracebacks. */
void PrintDiagnostic(const Diagnostic& diag, std::ostream& out, bool debug);

}  // namespace diagnostics
}  // namespace pyp
