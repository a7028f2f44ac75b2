/***
 * Name: pyp::main
 * Purpose: Entry point for the pyp template processor CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: 0 on success, 1 on a template failure, 2 on usage or infrastructure errors.
 * Theory of Operation:
 *   Parses the CLI, runs one template through the driver and reports metrics.
 *   Every infrastructure failure surfaces as a PypException and is printed here.
 */
#include <exception>
#include <iostream>

#include "pyp/driver/app.h"
#include "pyp/driver/cli.h"
#include "pyp/exceptions/pyp_exception.h"
#include "pyp/metrics/metrics.h"

using pyp::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using pyp::driver::ParseCli;
    using pyp::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    if (opts.show_version) {
      std::cout << "pyp " << pyp::driver::kVersion << '\n';
      return 0;
    }
    pyp::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = pyp::driver::RunOnce(opts);
    pyp::driver::ReportMetricsIfRequested(opts);
    return ret_code;
  } catch (const pyp::exceptions::PypException& ex) {
    std::cerr << "pyp: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pyp: internal error: " << ex.what() << '\n';
    return 2;
  }
}
