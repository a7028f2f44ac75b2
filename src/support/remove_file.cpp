/***
 * Name: pyp::support::RemoveFile
 * Purpose: Remove a file, treating "already gone" as success.
 * Inputs: path
 * Outputs: err on failure
 */
#include "pyp/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace pyp::support {

auto RemoveFile(const std::string& path, std::string& err) -> bool {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    err = "failed to remove " + path + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace pyp::support
