/***
 * Name: pyp::tmpl::LineMap::Lookup
 * Purpose: Resolve a generated line to the template line it came from.
 * Inputs: generated_line (1-based)
 * Outputs: Template line, or nullopt for synthetic or out-of-range lines
 * Theory of Operation: Exact lookup only; no nearest-line guessing.
 */
#include "pyp/template/line_map.h"

#include <optional>

namespace pyp::tmpl {

auto LineMap::Lookup(int generated_line) const -> std::optional<int> {
  const auto found = entries_.find(generated_line);
  if (found == entries_.end()) {
    return std::nullopt;
  }
  return found->second;
}

}  // namespace pyp::tmpl
