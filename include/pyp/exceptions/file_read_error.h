/***
 * Name: pyp::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public PypException {
 public:
  explicit FileReadError(std::string msg) noexcept : PypException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyp
