/***
 * Name: pyp::stages::Frontend
 * Purpose: Stage class for preprocessing and block parsing.
 * Inputs: Template text
 * Outputs: Sequence tree, LineMap and metrics (geometry)
 * Theory of Operation: Runs Preprocess then ParseTemplate under separate timers.
 *   Structural template errors propagate as exceptions::ParseError.
 */
#pragma once

#include <string_view>

#include "pyp/metrics/metrics.h"
#include "pyp/template/parser.h"

namespace pyp {
namespace stages {

class Frontend : public metrics::Metrics {
 public:
  /*** Build: Parse text into out. Throws exceptions::ParseError. */
  void Build(std::string_view text, tmpl::ParseResult& out);
};

}  // namespace stages
}  // namespace pyp
