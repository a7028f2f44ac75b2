/***
 * Name: pyp::metrics::Metrics::PhaseName
 * Purpose: Display name of a pipeline phase.
 * Inputs: phase
 * Outputs: Static string
 */
#include "pyp/metrics/metrics.h"

namespace pyp::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::Preprocess: return "Preprocess";
    case Phase::Parse: return "Parse";
    case Phase::Generate: return "Generate";
    case Phase::Execute: return "Execute";
  }
  return "Unknown";
}

}  // namespace pyp::metrics
