/***
 * Name: pyp::engine
 * Purpose: Single entry point of the translation pipeline: parse a template,
 *   generate its program, run it and report the outcome.
 * Inputs: Template text and RunOptions
 * Outputs: RunResult (success, or a Diagnostic)
 * Theory of Operation: Parse errors stop the pipeline before generation. Template
 *   failures come back as Diagnostics; only infrastructure problems (no
 *   interpreter, unwritable files) escape as exceptions::PypException.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pyp/diagnostics/diagnostic.h"

namespace pyp {
namespace engine {

struct RunOptions {
  std::string input_name{"<template>"};    // shown in diagnostics and as sys.argv[0]
  std::string output_path{};               // empty = stdout
  std::string script_path{};               // keep the generated program here; empty = temp file
  bool debug{false};
  std::optional<long long> seed{};
  std::vector<std::string> template_args{};
  std::string python{"python3"};
};

struct RunResult {
  bool ok{false};
  std::optional<diagnostics::Diagnostic> diagnostic{};
  std::string script{};  // generated program (empty after a parse error)
};

/*** ParseAndRun: Translate text and execute it according to opts. */
RunResult ParseAndRun(const std::string& text, const RunOptions& opts);

}  // namespace engine
}  // namespace pyp
