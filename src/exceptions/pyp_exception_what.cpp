/***
 * Name: pyp::exceptions::PypException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pyp/exceptions/pyp_exception.h"

namespace pyp::exceptions {

const char* PypException::what() const noexcept { return message_.c_str(); }

}  // namespace pyp::exceptions
