/***
 * Name: pyp::exec (failure)
 * Purpose: Structured description of a template failure raised by the host
 *   interpreter while compiling or running a generated program.
 * Inputs: Report file written by the execution bootstrap
 * Outputs: Failure values consumed by diagnostics
 * Theory of Operation: Line numbers here are GENERATED-program lines; mapping them
 *   back to template lines is the job of diagnostics::MapFailure.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pyp {
namespace exec {

struct Failure {
  enum class Kind { Syntax, Runtime };
  Kind kind{Kind::Runtime};
  std::string type{};             // exception class name, e.g. "NameError"
  std::string message{};          // str(exception)
  std::optional<int> line{};      // innermost generated line, if any
  std::vector<int> unit_frames{};  // generated lines of every program frame, outermost first
  std::string detail{};           // syntax: exception text; runtime: innermost frame
  std::string traceback{};        // formatted frames, bootstrap frames removed
};

/***
 * Name: pyp::exec::ParseFailureReport
 * Purpose: Decode the bootstrap's failure report.
 * Inputs: text: `key<TAB>value` lines; values escape `\\`, `\n` and `\t`
 * Outputs: out on success; err on malformed input
 * Theory of Operation: Keys are kind, type, message, line, frame (repeated),
 *   detail and traceback. Unknown keys are ignored.
 */
bool ParseFailureReport(const std::string& text, Failure& out, std::string& err);

}  // namespace exec
}  // namespace pyp
