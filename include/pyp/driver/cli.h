/***
 * Name: pyp::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: `pyp [options] <template> [template args...]`. Everything
 *   after the template path belongs to the template. Definitions live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pyp {
namespace driver {

inline constexpr const char* kVersion = "0.12";

/***
 * Name: pyp::driver::CliOptions
 * Purpose: Hold parsed command-line options for a pyp invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunOnce.
 */
struct CliOptions {
  std::string input;                       // template path
  std::vector<std::string> template_args;  // sys.argv[1:] of the template
  std::string output;                      // -o <file>; empty = stdout
  std::string python_file;                 // -p <file>; keep the generated program
  bool debug = false;                      // -debug, --debug
  std::optional<long long> seed;           // -seed <int>
  bool show_help = false;                  // -h, --help
  bool show_version = false;               // --version
  bool metrics = false;                    // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;  // --metrics[=json|text]
};

/***
 * Name: pyp::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

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
 * Theory of Operation: Iterates arguments left-to-right through RunHandlers until
 *   the template path is found; the remaining tokens are template arguments.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: pyp::driver::PrintUsage
 * Purpose: Print CLI usage information for pyp.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace pyp
