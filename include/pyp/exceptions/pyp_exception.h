/***
 * Name: pyp::exceptions::PypException
 * Purpose: Base class for all pyp exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pyp must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pyp {
namespace exceptions {

class PypException : public std::exception {
 public:
  virtual ~PypException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PypException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyp
