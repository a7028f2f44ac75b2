/***
 * Name: pyp::driver::detail::HandleSeedArg
 * Purpose: Handle -seed/--seed <int>.
 * Inputs: args, index (advanced past the value), argc, dst, err
 * Outputs: OptResult; dst.seed set on success
 * Theory of Operation: HandleValueArg extracts the text; ParseIntLiteralStrict
 *   validates it as a signed 64-bit integer.
 */
#include "pyp/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "pyp/support/parse.h"

namespace pyp::driver::detail {

auto HandleSeedArg(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                   std::ostream& err) -> OptResult {
  std::string text;
  const ValueOptionParams params{{"-seed", "--seed"}, args, index, argc, text, err};
  const OptResult result = HandleValueArg(args[static_cast<std::size_t>(index)], params);
  if (result != OptResult::Handled) {
    return result;
  }
  long long seed = 0;
  std::string detail;
  if (!support::ParseIntLiteralStrict(text, seed, &detail)) {
    err << "pyp: error: invalid seed '" << text << "': " << detail << '\n';
    return OptResult::Error;
  }
  dst.seed = seed;
  return OptResult::Handled;
}

}  // namespace pyp::driver::detail
