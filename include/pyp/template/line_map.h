/***
 * Name: pyp::tmpl::LineMap
 * Purpose: Generated-line -> template-line correspondence used for diagnostics.
 * Inputs: One call per generated line, in generation order
 * Outputs: Lookup of the template line behind a generated line
 * Theory of Operation: The parser appends nodes in exactly the order the code
 *   generator emits them, so a running counter identifies each generated line.
 *   Synthetic lines (`_OUTPUT = []`, the accumulator return) advance the counter
 *   without an entry; looking them up yields nullopt.
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>

namespace pyp {
namespace tmpl {

class LineMap {
 public:
  /*** Record: Map the next generated line to template_line and advance. */
  void Record(int template_line) { entries_[next_line_++] = template_line; }

  /*** Skip: Advance past a synthetic generated line. */
  void Skip() { ++next_line_; }

  /*** Lookup: Template line for generated_line, if it came from the template. */
  std::optional<int> Lookup(int generated_line) const;

  int next_line() const { return next_line_; }
  std::size_t size() const { return entries_.size(); }
  const std::map<int, int>& entries() const { return entries_; }

 private:
  int next_line_{1};
  std::map<int, int> entries_{};
};

}  // namespace tmpl
}  // namespace pyp
