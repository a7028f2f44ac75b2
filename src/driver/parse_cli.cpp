/***
 * Name: pyp::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Options are accepted until the template path; RunHandlers consumes the
 *   template and all of its arguments in one step. -h/--version short-circuit.
 */
#include "pyp/driver/cli.h"

#include <ostream>
#include <string>
#include <vector>

#include "pyp/driver/cli_parse.h"

namespace pyp::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};
  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);

  for (int index = 1; index < argc; ++index) {
    if (detail::RunHandlers(args, index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help || dst.show_version) {
      return true;
    }
  }

  if (dst.input.empty()) {
    err << "pyp: error: no template file" << '\n';
    return false;
  }
  return true;
}

}  // namespace pyp::driver
