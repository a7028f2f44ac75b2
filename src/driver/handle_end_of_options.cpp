/***
 * Name: pyp::driver::detail::HandleEndOfOptions
 * Purpose: Handle the "--" token.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (will be advanced to the end)
 *   - argc: total argument count
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Consumes "--"; the next token (even one starting with '-')
 *   is the template and the rest are its arguments.
 */
#include "pyp/driver/cli_parse.h"
#include "pyp/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace pyp::driver::detail {

auto HandleEndOfOptions(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst) -> OptResult {
  if (args[static_cast<std::size_t>(index)] != "--") {
    return OptResult::NotMatched;
  }
  ++index;
  if (index < argc) {
    TakeTemplateAndArgs(args, index, argc, dst);
  }
  return OptResult::Handled;
}

}  // namespace pyp::driver::detail
