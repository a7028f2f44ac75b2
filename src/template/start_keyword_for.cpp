/***
 * Name: pyp::tmpl::StartKeywordFor
 * Purpose: Pair each middle keyword with the block keyword it continues.
 * Inputs: keyword
 * Outputs: elif/else -> if; except/finally -> try
 */
#include "pyp/template/syntax.h"

namespace pyp::tmpl {

auto StartKeywordFor(MiddleKeyword keyword) -> ControlKeyword {
  switch (keyword) {
    case MiddleKeyword::Elif:
    case MiddleKeyword::Else:
      return ControlKeyword::If;
    case MiddleKeyword::Except:
    case MiddleKeyword::Finally:
      return ControlKeyword::Try;
  }
  return ControlKeyword::If;
}

}  // namespace pyp::tmpl
