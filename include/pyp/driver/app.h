/***
 * Name: pyp::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options
 * Outputs: Status codes; metrics reports
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units.
 */
#pragma once

#include "pyp/driver/cli.h"

namespace pyp {
namespace driver {

/***
 * Name: pyp::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format to stderr if enabled.
 * Inputs: opts (CLI options)
 * Outputs: None
 * Theory of Operation: Reads the global Metrics registry and prints either JSON or
 *   text. stdout may carry template output, so metrics go to stderr.
 */
void ReportMetricsIfRequested(const driver::CliOptions& opts);

/***
 * Name: pyp::driver::RunOnce
 * Purpose: Process one template end to end.
 * Inputs: opts (CLI options)
 * Outputs: 0 on success, 1 on a template failure (diagnostic printed to stderr)
 * Theory of Operation: Read -> ParseAndRun -> PrintDiagnostic. Infrastructure
 *   errors propagate as exceptions::PypException for main() to report.
 */
int RunOnce(const driver::CliOptions& opts);

}  // namespace driver
}  // namespace pyp
