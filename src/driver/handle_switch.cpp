/***
 * Name: pyp::driver::detail::HandleSwitch
 * Purpose: Handle the boolean switch -debug/--debug.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 */
#include "pyp/driver/cli_parse.h"
#include "pyp/driver/cli.h"  // direct use of CliOptions

#include <string>

namespace pyp::driver::detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-debug" || arg == "--debug") {
    dst.debug = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace pyp::driver::detail
