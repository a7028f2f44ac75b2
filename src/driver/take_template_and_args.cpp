/***
 * Name: pyp::driver::detail::TakeTemplateAndArgs
 * Purpose: Record the template path and pass every later token to the template.
 * Inputs: args, index (template position; advanced to argc), argc, dst
 * Outputs: dst.input and dst.template_args
 * Theory of Operation: Tokens after the template are never interpreted as pyp
 *   options, so `pyp page.pyp -o x` hands `-o x` to the template.
 */
#include "pyp/driver/cli_parse.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pyp::driver::detail {

void TakeTemplateAndArgs(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst) {
  dst.input = args[static_cast<std::size_t>(index)];
  for (++index; index < argc; ++index) {
    dst.template_args.emplace_back(args[static_cast<std::size_t>(index)]);
  }
}

}  // namespace pyp::driver::detail
