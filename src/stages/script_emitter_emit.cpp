/***
 * Name: pyp::stages::ScriptEmitter::Emit
 * Purpose: Generate the program text and record line counters.
 * Inputs:
 *   - parsed: root Sequence and LineMap
 * Outputs:
 *   - out_script: generated lines joined with '\n'
 * Theory of Operation: The emitted line count must equal LineMap::next_line() - 1;
 *   both numbers are reported so a mismatch shows up in --metrics output.
 */
#include "pyp/stages/script_emitter.h"

#include <string>

#include "pyp/template/codegen.h"

namespace pyp::stages {

auto ScriptEmitter::Emit(const tmpl::ParseResult& parsed, std::string& out_script) -> void {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Generate);
  const auto lines = tmpl::GenerateLines(*parsed.root);
  out_script = tmpl::JoinLines(lines);
  metrics::Metrics::SetLineCounts(lines.size(), parsed.line_map.size());
}

}  // namespace pyp::stages
