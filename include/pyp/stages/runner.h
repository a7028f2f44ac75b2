/***
 * Name: pyp::stages::Runner
 * Purpose: Stage class for executing a generated program.
 * Inputs: exec::ExecRequest
 * Outputs: exec::ExecOutcome
 * Theory of Operation: Wraps exec::RunScript with Execute-phase timing.
 */
#pragma once

#include "pyp/exec/runner.h"
#include "pyp/metrics/metrics.h"

namespace pyp {
namespace stages {

class Runner : public metrics::Metrics {
 public:
  /*** Run: Execute the program described by request. Throws exceptions::ExecError. */
  exec::ExecOutcome Run(const exec::ExecRequest& request);
};

}  // namespace stages
}  // namespace pyp
