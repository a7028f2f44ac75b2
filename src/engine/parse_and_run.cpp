/***
 * Name: pyp::engine::ParseAndRun
 * Purpose: Run the whole pipeline for one template.
 * Inputs:
 *   - text: template text
 *   - opts: names, paths, seed, template arguments, interpreter, debug flag
 * Outputs:
 *   - RunResult: ok, or the Diagnostic describing the failure
 * Theory of Operation: Frontend -> ScriptEmitter -> Runner. In debug mode the
 *   generated program is printed to stdout before it runs.
 */
#include "pyp/engine/engine.h"

#include <iostream>
#include <string>

#include "pyp/exceptions/parse_error.h"
#include "pyp/exec/runner.h"
#include "pyp/stages/frontend.h"
#include "pyp/stages/runner.h"
#include "pyp/stages/script_emitter.h"
#include "pyp/template/parser.h"
#include "pyp/template/preprocess.h"

namespace pyp::engine {

auto ParseAndRun(const std::string& text, const RunOptions& opts) -> RunResult {
  RunResult result;
  const auto template_lines = tmpl::SplitLines(text);

  tmpl::ParseResult parsed;
  try {
    stages::Frontend front;
    front.Build(text, parsed);
  } catch (const exceptions::ParseError& error) {
    result.diagnostic = diagnostics::FromParseError(error, template_lines, opts.input_name);
    return result;
  }

  stages::ScriptEmitter emitter;
  emitter.Emit(parsed, result.script);
  if (opts.debug) {
    std::cout << "PYTHON CODE:" << '\n' << result.script << '\n' << '\n';
    std::cout << '\n' << "EXECUTING PYTHON:" << '\n';
  }

  exec::ExecRequest request;
  request.script = result.script;
  request.input_name = opts.input_name;
  request.unit_path = opts.script_path;
  request.output_path = opts.output_path;
  request.seed = opts.seed;
  request.template_args = opts.template_args;
  request.python = opts.python;
  request.debug = opts.debug;

  stages::Runner runner;
  const auto outcome = runner.Run(request);
  if (outcome.ok) {
    result.ok = true;
    return result;
  }
  result.diagnostic = diagnostics::MapFailure(*outcome.failure, parsed.line_map, template_lines, opts.input_name);
  return result;
}

}  // namespace pyp::engine
