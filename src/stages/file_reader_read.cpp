/***
 * Name: pyp::stages::FileReader::Read
 * Purpose: Read a template from disk and record metrics for the ReadFile phase.
 * Inputs:
 *   - path: file path
 * Outputs:
 *   - out_src: populated with contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses support::ReadFile; timings via Metrics::ScopedTimer.
 */
#include "pyp/stages/file_reader.h"

#include "pyp/metrics/metrics.h"  // direct use of Metrics::ScopedTimer
#include "pyp/support/fs.h"

#include <string>

namespace pyp::stages {

auto FileReader::Read(const std::string& path, std::string& out_src, std::string& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::ReadFile);
  return support::ReadFile(path, out_src, err);
}

}  // namespace pyp::stages
