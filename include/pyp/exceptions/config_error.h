/***
 * Name: pyp::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public PypException {
 public:
  explicit ConfigError(std::string msg) noexcept : PypException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyp
