/***
 * Name: pyp::driver::ReportMetricsIfRequested
 * Purpose: Print metrics to stderr if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 * Outputs: None
 * Theory of Operation: Reads Metrics registry and prints text or JSON.
 */
#include "pyp/driver/app.h"
#include "pyp/metrics/metrics.h"

#include <iostream>

namespace pyp::driver {

auto ReportMetricsIfRequested(const driver::CliOptions& opts) -> void {
  if (!opts.metrics) {
    return;
  }
  const auto& reg = metrics::Metrics::GetRegistry();
  if (opts.metrics_format == driver::CliOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, std::cerr);
  } else {
    metrics::Metrics::PrintMetrics(reg, std::cerr);
  }
}

}  // namespace pyp::driver
