/***
 * Name: pyp::driver::RunOnce
 * Purpose: Execute one template end to end (read -> translate -> run).
 * Inputs:
 *   - opts: CLI options
 * Outputs:
 *   - int: 0 on success; 1 on a template failure with the diagnostic printed
 * Theory of Operation: Read errors raise exceptions::FileReadError; the
 *   interpreter comes from PYP_PYTHON (exceptions::ConfigError when empty).
 */
#include "pyp/driver/app.h"

#include <iostream>
#include <string>

#include "pyp/diagnostics/diagnostic.h"
#include "pyp/engine/engine.h"
#include "pyp/exceptions/file_read_error.h"
#include "pyp/exec/runner.h"
#include "pyp/stages/file_reader.h"

namespace pyp::driver {

auto RunOnce(const driver::CliOptions& opts) -> int {
  std::string text;
  std::string error_message;
  if (stages::FileReader reader; !reader.Read(opts.input, text, error_message)) {
    throw exceptions::FileReadError(error_message);
  }

  engine::RunOptions run;
  run.input_name = opts.input;
  run.output_path = opts.output;
  run.script_path = opts.python_file;
  run.debug = opts.debug;
  run.seed = opts.seed;
  run.template_args = opts.template_args;
  run.python = exec::ResolvePythonInterpreter();

  const auto result = engine::ParseAndRun(text, run);
  if (result.ok) {
    return 0;
  }
  std::cout.flush();
  diagnostics::PrintDiagnostic(*result.diagnostic, std::cerr, opts.debug);
  return 1;
}

}  // namespace pyp::driver
