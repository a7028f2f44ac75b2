/***
 * Name: pyp::exceptions::PypException::PypException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pyp/exceptions/pyp_exception.h"

#include <utility>

namespace pyp {
namespace exceptions {

PypException::PypException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyp
