/***
 * Name: pyp::exceptions::ExecError
 * Purpose: Exception for failures to run the host interpreter (spawn, unit write, report read).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PypException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyp/exceptions/pyp_exception.h"

namespace pyp {
namespace exceptions {

class ExecError : public PypException {
 public:
  explicit ExecError(std::string msg) noexcept : PypException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyp
