/***
 * Name: pyp::diagnostics::MapFailure
 * Purpose: Attribute an execution failure to template lines.
 * Inputs:
 *   - failure: generated-line based failure from the execution bridge
 *   - line_map: generated -> template line map built by the parser
 *   - template_lines: original template lines
 *   - input_name: template name
 * Outputs: Diagnostic of kind Syntax or Runtime
 * Theory of Operation: Exact LineMap lookups only. A failure without a line, or
 *   whose line has no entry (synthetic accumulator lines, lines past the end of
 *   the program), leaves Diagnostic::line unset.
 */
#include "pyp/diagnostics/diagnostic.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pyp::diagnostics {

static TemplateFrame Resolve(std::optional<int> generated_line, const tmpl::LineMap& line_map,
                             const std::vector<std::string>& template_lines) {
  TemplateFrame frame;
  if (!generated_line) {
    return frame;
  }
  const auto template_line = line_map.Lookup(*generated_line);
  if (!template_line || *template_line < 1 || static_cast<std::size_t>(*template_line) > template_lines.size()) {
    return frame;
  }
  frame.line = template_line;
  frame.text = template_lines[static_cast<std::size_t>(*template_line - 1)];
  return frame;
}

auto MapFailure(const exec::Failure& failure, const tmpl::LineMap& line_map,
                const std::vector<std::string>& template_lines, const std::string& input_name) -> Diagnostic {
  Diagnostic diag;
  diag.kind = failure.kind == exec::Failure::Kind::Syntax ? Diagnostic::Kind::Syntax : Diagnostic::Kind::Runtime;
  diag.file = input_name;
  diag.type = failure.type;
  diag.message = failure.message;
  diag.detail = failure.detail;
  diag.traceback = failure.traceback;

  const TemplateFrame innermost = Resolve(failure.line, line_map, template_lines);
  diag.line = innermost.line;
  diag.line_text = innermost.text;
  for (const int generated : failure.unit_frames) {
    diag.template_frames.push_back(Resolve(generated, line_map, template_lines));
  }
  return diag;
}

}  // namespace pyp::diagnostics
