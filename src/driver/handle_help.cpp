/***
 * Name: pyp::driver::detail::HandleHelpArg
 * Purpose: Recognize -h/--help and --version.
 * Inputs: current arg, destination options
 * Outputs: Handled when matched, otherwise NotMatched
 * Theory of Operation: No error cases.
 */
#include "pyp/driver/cli_parse.h"
#include "pyp/driver/cli.h"

#include <string>

namespace pyp::driver::detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  if (arg == "--version") {
    dst.show_version = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace pyp::driver::detail
