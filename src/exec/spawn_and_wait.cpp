/***
 * Name: pyp::exec::detail::SpawnAndWait
 * Purpose: Run a command via execvp in a child process and collect its status.
 * Inputs: argv (mutable, null-terminated)
 * Outputs: exit_code; false and err when the child could not be created or reaped
 * Theory of Operation: POSIX fork/exec/waitpid. The child inherits stdout and
 *   stderr, so buffered C++ output is flushed first to keep ordering. A child
 *   that cannot exec exits with kExecFailure.
 */
#include "pyp/exec/detail/exec.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace pyp::exec::detail {

auto SpawnAndWait(std::vector<char*>& argv, int& exit_code, std::string& err) -> bool {
  std::cout.flush();
  std::cerr.flush();
  const auto pid = fork();
  if (pid < 0) {
    err = std::string("failed to fork() for ") + argv[0] + ": " + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    execvp(argv[0], argv.data());
    _exit(kExecFailure);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      err = std::string("failed to waitpid() for ") + argv[0] + ": " + std::strerror(errno);
      return false;
    }
  }
  constexpr int kSignalBase = 128;
  exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : kSignalBase + WTERMSIG(status);
  return true;
}

}  // namespace pyp::exec::detail
