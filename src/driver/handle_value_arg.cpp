/***
 * Name: pyp::driver::detail::HandleValueArg
 * Purpose: Handle options that take a single value, in spaced or `--name=value` form.
 * Inputs:
 *   - arg: current argument string
 *   - params: option spellings, argument vector, index (advanced when the value
 *     is the next token), argc, destination string and error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: A later occurrence of the same option overrides an earlier one.
 */
#include "pyp/driver/cli_parse.h"

#include <cstddef>
#include <string>

namespace pyp::driver::detail {

auto HandleValueArg(const std::string& arg, const ValueOptionParams& params) -> OptResult {
  for (const char* name : params.names) {
    const std::string option(name);
    if (arg == option) {
      if (params.index + 1 >= params.argc) {
        params.err << "pyp: error: missing value after '" << option << "'" << '\n';
        return OptResult::Error;
      }
      ++params.index;
      params.out = params.args[static_cast<std::size_t>(params.index)];
      return OptResult::Handled;
    }
    const std::string joined = option + "=";
    if (option.rfind("--", 0) == 0U && arg.rfind(joined, 0) == 0U) {
      params.out = arg.substr(joined.size());
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace pyp::driver::detail
