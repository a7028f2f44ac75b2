/***
 * Name: pyp::exec (runner)
 * Purpose: Execute a generated program in a host Python interpreter.
 * Inputs: ExecRequest (program text, paths, seed, template arguments)
 * Outputs: ExecOutcome (success or a structured Failure)
 * Theory of Operation: The program is written to a unit file and a fixed
 *   bootstrap is run with `<python> -c`. The bootstrap provides `_PRINT`, runs
 *   the unit and writes a failure report that RunScript decodes. Infrastructure
 *   problems (no interpreter, unwritable files) throw exceptions::ExecError;
 *   template failures are returned as values.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pyp/exec/failure.h"

namespace pyp {
namespace exec {

struct ExecRequest {
  std::string script;                       // generated program text
  std::string input_name;                   // becomes sys.argv[0]
  std::string unit_path;                    // keep the program here; empty = temp file
  std::string output_path;                  // empty = stdout
  std::optional<long long> seed;            // random.seed(...) before running
  std::vector<std::string> template_args;   // sys.argv[1:]
  std::string python{"python3"};
  bool debug{false};
};

struct ExecOutcome {
  bool ok{false};
  std::optional<Failure> failure;
  std::string unit_path;
};

/*** RunScript: Run request.script; see header comment for the error contract. */
ExecOutcome RunScript(const ExecRequest& request);

/*** HostBootstrapSource: Python source passed to `<python> -c`. */
const char* HostBootstrapSource();

/*** ResolvePythonInterpreter: $PYP_PYTHON, or "python3" when unset. Throws ConfigError when set but empty. */
std::string ResolvePythonInterpreter();

}  // namespace exec
}  // namespace pyp
