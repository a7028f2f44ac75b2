/***
 * Name: pyp::exceptions::ParseError
 * Purpose: Exception for structural template errors (mismatched or unclosed blocks).
 * Inputs: Diagnostic message, offending template line text, 1-based template line number
 * Outputs: Exception object
 * Theory of Operation: Carries the location so the caller can render a parse report
 *   without re-reading the template.
 */
#pragma once

#include <string>

#include "pyp/exceptions/pyp_exception.h"

namespace pyp {
namespace exceptions {

class ParseError : public PypException {
 public:
  ParseError(std::string msg, std::string line, int line_number) noexcept;

  const std::string& line() const noexcept { return line_; }
  int line_number() const noexcept { return line_number_; }

 private:
  std::string line_;
  int line_number_;
};

}  // namespace exceptions
}  // namespace pyp
