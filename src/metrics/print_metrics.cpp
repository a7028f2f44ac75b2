/***
 * Name: pyp::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations, template geometry, line counts).
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters.
 */
#include "pyp/metrics/metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace pyp::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& entry : reg.durations_ns) {
    const double milliseconds = static_cast<double>(entry.second) / 1'000'000.0;
    out << "  " << PhaseName(entry.first) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  Template: nodes=" << reg.template_geom.node_count << ", max_depth=" << reg.template_geom.max_depth
      << "\n";
  out << "  Lines: generated=" << reg.generated_lines << ", mapped=" << reg.mapped_lines << "\n";
}

}  // namespace pyp::metrics
