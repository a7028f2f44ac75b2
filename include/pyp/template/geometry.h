/***
 * Name: pyp::tmpl (geometry)
 * Purpose: Size and control-nesting statistics of a parsed template.
 * Inputs: Root Sequence
 * Outputs: TemplateGeometry
 * Theory of Operation: DFS counting every node; depth increases by one per
 *   ControlSequence, so a template without directives has max_depth 0.
 */
#pragma once

#include <cstddef>

#include "pyp/template/node.h"

namespace pyp {
namespace tmpl {

struct TemplateGeometry {
  std::size_t node_count{0};
  std::size_t max_depth{0};
};

/*** ComputeGeometry: Populate node_count and max_depth for a given root. */
void ComputeGeometry(const Sequence& root, TemplateGeometry& out);

}  // namespace tmpl
}  // namespace pyp
