/***
 * Name: pyp::driver::PrintUsage
 * Purpose: Print CLI usage information for pyp.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "pyp/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace pyp::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"pyp"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] <template> [template args...]" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help                   Print this help and exit" << '\n'
      << "  --version                    Print the version and exit" << '\n'
      << "  -o, -output, --output <file> Write template output to <file> (default: stdout)" << '\n'
      << "  -p, -py, --py <file>         Keep the generated Python program in <file>" << '\n'
      << "  -debug, --debug              Print the generated program and full tracebacks" << '\n'
      << "  -seed, --seed <int>          Seed Python's random module" << '\n'
      << "  --metrics[=json|text]        Print per-phase metrics to stderr (default: text)" << '\n'
      << "  --                           End of options" << '\n'
      << '\n'
      << "Environment:" << '\n'
      << "  PYP_PYTHON                   Python interpreter to run templates (default: python3)" << '\n';
}

}  // namespace pyp::driver
