/***
 * Name: pyp::exec::detail (process helpers)
 * Purpose: Internal helpers to build argv and fork/exec/wait for the interpreter.
 * Inputs: Vector<string> for argv construction; argv for exec
 * Outputs: Mutable argv pointer array; child exit status
 * Theory of Operation: Keep RunScript small; all POSIX process handling lives here.
 */
#pragma once

#include <string>
#include <vector>

namespace pyp {
namespace exec {
namespace detail {

/*** kExecFailure: Exit status of a child whose execvp() failed. */
constexpr int kExecFailure = 127;

/*** kReportWritten: Exit status of the bootstrap after writing a failure report. */
constexpr int kReportWritten = 3;

/*** BuildArgvMutable: Build null-terminated argv pointers referencing args storage. */
std::vector<char*> BuildArgvMutable(std::vector<std::string>& args);

/*** SpawnAndWait: fork/execvp and wait; exit_code receives the child status (128+N if killed by signal N). */
bool SpawnAndWait(std::vector<char*>& argv, int& exit_code, std::string& err);

}  // namespace detail
}  // namespace exec
}  // namespace pyp
