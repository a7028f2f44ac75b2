/***
 * Name: pyp::stages::FileReader
 * Purpose: Stage class for reading a template file.
 * Inputs: Filesystem path
 * Outputs: Template text
 * Theory of Operation: Wraps support::ReadFile and instruments metrics via RAII.
 */
#pragma once

#include <string>

#include "pyp/metrics/metrics.h"

namespace pyp {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  /*** Read: Read file at path into out_src. */
  static bool Read(const std::string& path, std::string& out_src, std::string& err);
};

}  // namespace stages
}  // namespace pyp
