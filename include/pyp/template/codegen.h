/***
 * Name: pyp::tmpl (codegen)
 * Purpose: Project the node tree onto indented Python source text.
 * Inputs: Root Sequence
 * Outputs: Generated lines / script text
 * Theory of Operation: Depth-first walk. Statements are indented four spaces per
 *   depth unless verbatim; each ControlBlock header is emitted at the current
 *   depth with its body one level deeper. Generated line k (1-based) is the k-th
 *   line the parser recorded in the LineMap.
 */
#pragma once

#include <string>
#include <vector>

#include "pyp/template/node.h"

namespace pyp {
namespace tmpl {

/*** GenerateLines: One string per generated line. */
std::vector<std::string> GenerateLines(const Sequence& root);

/*** JoinLines: lines joined with '\n', no trailing newline. */
std::string JoinLines(const std::vector<std::string>& lines);

/*** GenerateScript: Generated lines joined with '\n'. */
std::string GenerateScript(const Sequence& root);

}  // namespace tmpl
}  // namespace pyp
