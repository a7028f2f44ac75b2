/***
 * Name: pyp::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across stages.
 */
#include "pyp/metrics/metrics.h"

namespace pyp::metrics {

Metrics::Registry Metrics::reg_{};

}  // namespace pyp::metrics
