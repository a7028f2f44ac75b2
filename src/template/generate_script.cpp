/***
 * Name: pyp::tmpl::GenerateScript
 * Purpose: Generated program as a single text.
 * Inputs: root
 * Outputs: GenerateLines(root) joined with '\n'
 * Theory of Operation: A body-less block (e.g. `%if x:` immediately followed by
 *   `%endif`) is left as is; the host reports it as a syntax failure at the
 *   block's header.
 */
#include "pyp/template/codegen.h"

#include <string>

namespace pyp::tmpl {

auto GenerateScript(const Sequence& root) -> std::string { return JoinLines(GenerateLines(root)); }

}  // namespace pyp::tmpl
