/***
 * Name: pyp::stages::Runner::Run
 * Purpose: Execute a generated program with Execute-phase timing.
 * Inputs: request
 * Outputs: ExecOutcome from exec::RunScript
 */
#include "pyp/stages/runner.h"

namespace pyp::stages {

auto Runner::Run(const exec::ExecRequest& request) -> exec::ExecOutcome {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Execute);
  return exec::RunScript(request);
}

}  // namespace pyp::stages
