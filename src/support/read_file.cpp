/***
 * Name: pyp::support::ReadFile
 * Purpose: Read the full contents of a text file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode so CR characters reach
 *   the preprocessor unchanged; checks stream state after the read.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyp/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace pyp::support {

auto ReadFile(const std::string& path, std::string& out, std::string& err) -> bool {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace pyp::support
