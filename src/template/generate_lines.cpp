/***
 * Name: pyp::tmpl::GenerateLines
 * Purpose: Emit the generated Python program one line at a time.
 * Inputs:
 *   - root: parsed template
 * Outputs: Lines in generation order (no trailing newlines)
 * Theory of Operation: Recursive DFS. Depth starts at 0 for the root; each
 *   ControlBlock header is written at the current depth and its body at depth+1.
 *   Verbatim statements are written without indentation.
 */
#include "pyp/template/codegen.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pyp::tmpl {

static constexpr std::size_t kIndentWidth = 4;

static void EmitNodes(const NodeList& nodes, std::size_t depth, std::vector<std::string>& out);

static void EmitNode(const Node& node, std::size_t depth, std::vector<std::string>& out) {
  switch (node.kind) {
    case NodeKind::Statement: {
      const auto& stmt = static_cast<const StatementLine&>(node);  // NOLINT(cppcoreguidelines-pro-type-static-cast-downcast)
      out.push_back(stmt.verbatim ? stmt.text : std::string(depth * kIndentWidth, ' ') + stmt.text);
      break;
    }
    case NodeKind::Sequence:
      EmitNodes(static_cast<const Sequence&>(node).nodes, depth, out);  // NOLINT(cppcoreguidelines-pro-type-static-cast-downcast)
      break;
    case NodeKind::ControlSequence: {
      const auto& control = static_cast<const ControlSequence&>(node);  // NOLINT(cppcoreguidelines-pro-type-static-cast-downcast)
      for (const auto& block : control.blocks) {
        out.push_back(std::string(depth * kIndentWidth, ' ') + block.header);
        EmitNodes(block.nodes, depth + 1, out);
      }
      break;
    }
  }
}

static void EmitNodes(const NodeList& nodes, std::size_t depth, std::vector<std::string>& out) {
  for (const auto& child : nodes) {
    EmitNode(*child, depth, out);
  }
}

auto GenerateLines(const Sequence& root) -> std::vector<std::string> {
  std::vector<std::string> out;
  EmitNodes(root.nodes, 0, out);
  return out;
}

}  // namespace pyp::tmpl
