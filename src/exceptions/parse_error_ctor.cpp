/***
 * Name: pyp::exceptions::ParseError::ParseError
 * Purpose: Construct a parse error with its template location.
 * Inputs:
 *   - msg: diagnostic text (e.g. "End control word (endfor) doesn't match ...")
 *   - line: offending template line text
 *   - line_number: 1-based template line number
 * Outputs: Initialized exception object
 * Theory of Operation: what() returns msg alone; location is exposed separately.
 */
#include "pyp/exceptions/parse_error.h"

#include <utility>

namespace pyp::exceptions {

ParseError::ParseError(std::string msg, std::string line, int line_number) noexcept
    : PypException(std::move(msg)), line_(std::move(line)), line_number_(line_number) {}

}  // namespace pyp::exceptions
