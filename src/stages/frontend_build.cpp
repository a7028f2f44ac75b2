/***
 * Name: pyp::stages::Frontend::Build
 * Purpose: Preprocess and parse a template; record geometry and timing.
 * Inputs:
 *   - text: template text
 * Outputs:
 *   - out: root Sequence and LineMap
 * Theory of Operation: Each sub-phase has its own timer; geometry is computed
 *   only after a successful parse.
 */
#include "pyp/stages/frontend.h"

#include <string_view>
#include <utility>
#include <vector>

#include "pyp/template/geometry.h"
#include "pyp/template/preprocess.h"

namespace pyp::stages {

auto Frontend::Build(std::string_view text, tmpl::ParseResult& out) -> void {
  std::vector<tmpl::SourceLine> lines;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Preprocess);
    lines = tmpl::Preprocess(text);
  }
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
    out = tmpl::ParseTemplate(lines);
  }
  tmpl::TemplateGeometry geometry{};
  tmpl::ComputeGeometry(*out.root, geometry);
  metrics::Metrics::SetTemplateGeometry(geometry);
}

}  // namespace pyp::stages
