/***
 * Name: pyp::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "pyp/driver/cli.h"

namespace pyp {
namespace driver {
namespace detail {

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/***
 * Name: pyp::driver::detail::ValueOptionParams
 * Purpose: Describe one option that takes a value: its spellings and destination.
 * Theory of Operation: Accepts `<name> <value>` for every spelling and
 *   `<name>=<value>` for spellings starting with `--`.
 */
struct ValueOptionParams {
  std::vector<const char*> names;
  const std::vector<std::string>& args;
  int& index;
  int argc;
  std::string& out;
  std::ostream& err;
};

/*** HandleValueArg: Handle an option that takes one value (-o, -p, -seed). */
OptResult HandleValueArg(const std::string& arg, const ValueOptionParams& params);

/*** HandleSeedArg: Handle -seed/--seed <int>. */
OptResult HandleSeedArg(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                        std::ostream& err);

/*** HandleSwitch: Handle the boolean -debug/--debug. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleEndOfOptions: Handle "--": the next token is the template, the rest its arguments. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise take the template and its arguments. */
OptResult HandleUnknownOrPositional(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                                    std::ostream& err);

/*** HandleHelpArg: Recognize -h/--help and --version. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** TakeTemplateAndArgs: Record args[index] as the template and the rest as its arguments. */
void TakeTemplateAndArgs(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace pyp
