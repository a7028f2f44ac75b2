/***
 * Name: pyp::stages::ScriptEmitter
 * Purpose: Stage class for projecting the parsed template onto Python text.
 * Inputs: Parse result
 * Outputs: Generated program text
 * Theory of Operation: Wraps tmpl::GenerateLines with timing and line counters.
 */
#pragma once

#include <string>

#include "pyp/metrics/metrics.h"
#include "pyp/template/parser.h"

namespace pyp {
namespace stages {

class ScriptEmitter : public metrics::Metrics {
 public:
  /*** Emit: Generate the program for parsed into out_script. */
  void Emit(const tmpl::ParseResult& parsed, std::string& out_script);
};

}  // namespace stages
}  // namespace pyp
