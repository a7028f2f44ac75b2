/***
 * Name: pyp::tmpl::ComputeGeometry
 * Purpose: Count nodes and control nesting of a parsed template.
 * Inputs:
 *   - root: parsed template
 * Outputs:
 *   - out: node_count (root excluded) and max_depth
 */
#include "pyp/template/geometry.h"

#include <algorithm>
#include <cstddef>

namespace pyp::tmpl {

static void Visit(const NodeList& nodes, std::size_t depth, TemplateGeometry& out) {
  for (const auto& child : nodes) {
    ++out.node_count;
    if (child->kind != NodeKind::ControlSequence) {
      continue;
    }
    const auto& control = static_cast<const ControlSequence&>(*child);  // NOLINT(cppcoreguidelines-pro-type-static-cast-downcast)
    out.max_depth = std::max(out.max_depth, depth + 1);
    for (const auto& block : control.blocks) {
      Visit(block.nodes, depth + 1, out);
    }
  }
}

void ComputeGeometry(const Sequence& root, TemplateGeometry& out) {
  out = TemplateGeometry{};
  Visit(root.nodes, 0, out);
}

}  // namespace pyp::tmpl
