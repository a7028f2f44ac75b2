/***
 * Name: pyp::support::MakeTempFile
 * Purpose: Create a new empty file with a unique name in the temp directory.
 * Inputs:
 *   - prefix, suffix: name parts around the random component
 * Outputs:
 *   - out_path: created file path
 *   - err: error message on failure
 * Theory of Operation: mkstemps() under std::filesystem::temp_directory_path();
 *   the descriptor is closed immediately, the file stays.
 */
#include "pyp/support/fs.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <stdlib.h>  // NOLINT(modernize-deprecated-headers) - mkstemps is POSIX, not in <cstdlib>
#include <unistd.h>

namespace pyp::support {

auto MakeTempFile(const std::string& prefix, const std::string& suffix, std::string& out_path, std::string& err)
    -> bool {
  std::error_code ec;
  const auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    err = "failed to locate temp directory: " + ec.message();
    return false;
  }
  const std::string pattern = (dir / (prefix + "XXXXXX" + suffix)).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  const int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    err = "failed to create temp file " + pattern + ": " + std::strerror(errno);
    return false;
  }
  close(fd);
  out_path.assign(buffer.data());
  return true;
}

}  // namespace pyp::support
