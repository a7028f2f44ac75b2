/***
 * Name: pyp::exec::ResolvePythonInterpreter
 * Purpose: Choose the interpreter that runs generated programs.
 * Inputs: Environment variable PYP_PYTHON
 * Outputs: Interpreter name or path (searched on PATH by execvp)
 * Theory of Operation: Unset -> "python3". Set but empty is a configuration
 *   mistake and raises exceptions::ConfigError.
 */
#include "pyp/exec/runner.h"

#include <cstdlib>
#include <string>

#include "pyp/exceptions/config_error.h"

namespace pyp::exec {

auto ResolvePythonInterpreter() -> std::string {
  const char* value = std::getenv("PYP_PYTHON");  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr) {
    return "python3";
  }
  if (*value == '\0') {
    throw exceptions::ConfigError("PYP_PYTHON is set but empty");
  }
  return value;
}

}  // namespace pyp::exec
