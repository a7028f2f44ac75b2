/***
 * Name: pyp::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Hand-written JSON; every value is a number or a fixed
 *   phase name, so no string escaping is needed.
 */
#include "pyp/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace pyp::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{";
  // durations
  out << "\n  \"durations_ns\": [";
  for (std::size_t i = 0; i < reg.durations_ns.size(); ++i) {
    const auto& item = reg.durations_ns[i];
    out << (i != 0U ? ",\n    {" : "\n    {")
        << R"("phase": ")" << PhaseName(item.first) << R"(", "ns": )" << item.second << "}";
  }
  out << "\n  ],";
  out << "\n  \"template\": { \"nodes\": " << reg.template_geom.node_count
      << ", \"max_depth\": " << reg.template_geom.max_depth << " },";
  out << "\n  \"lines\": { \"generated\": " << reg.generated_lines << ", \"mapped\": " << reg.mapped_lines
      << " }\n}\n";
}

}  // namespace pyp::metrics
