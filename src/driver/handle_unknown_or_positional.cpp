/***
 * Name: pyp::driver::detail::HandleUnknownOrPositional
 * Purpose: Treat tokens beginning with '-' (not matched by previous handlers) as errors;
 *          otherwise take the token as the template path.
 * Inputs:
 *   - args, index, argc: argument vector and position
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for unknown option, OptResult::Handled otherwise.
 * Theory of Operation: This is the last handler evaluated by RunHandlers; it ensures
 *   every token is either handled or rejected. A lone "-" is a path, not an option.
 */
#include "pyp/driver/cli_parse.h"
#include "pyp/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace pyp::driver::detail {

auto HandleUnknownOrPositional(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                               std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (arg.size() > 1 && arg[0] == '-') {
    err << "pyp: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (arg.empty()) {
    err << "pyp: error: empty template path" << '\n';
    return OptResult::Error;
  }
  TakeTemplateAndArgs(args, index, argc, dst);
  return OptResult::Handled;
}

}  // namespace pyp::driver::detail
