/***
 * Name: pyp::exec::ParseFailureReport
 * Purpose: Decode the failure report written by the host bootstrap.
 * Inputs:
 *   - text: report file contents
 * Outputs:
 *   - out: populated Failure
 *   - err: reason when the report is malformed
 * Theory of Operation: One `key<TAB>value` pair per line. Values are unescaped
 *   (`\\`, `\n`, `\t`); `line` and `frame` must be integers. A report without a
 *   `kind` is malformed.
 */
#include "pyp/exec/failure.h"

#include <cstddef>
#include <sstream>
#include <string>

#include "pyp/support/parse.h"

namespace pyp::exec {

static std::string Unescape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 == value.size()) {
      out += value[i];
      continue;
    }
    const char next = value[++i];
    switch (next) {
      case 'n': out += '\n'; break;
      case 't': out += '\t'; break;
      default: out += next; break;
    }
  }
  return out;
}

static bool ParseLineNumber(const std::string& value, int& out, std::string& err) {
  long long number = 0;
  std::string detail;
  if (!support::ParseIntLiteralStrict(value, number, &detail) || number < 0) {
    err = "invalid line number in failure report: '" + value + "'";
    return false;
  }
  out = static_cast<int>(number);
  return true;
}

auto ParseFailureReport(const std::string& text, Failure& out, std::string& err) -> bool {  // NOLINT(readability-function-cognitive-complexity)
  out = Failure{};
  bool has_kind = false;
  std::istringstream stream(text);
  std::string record;
  while (std::getline(stream, record)) {
    if (record.empty()) {
      continue;
    }
    const auto tab = record.find('\t');
    if (tab == std::string::npos) {
      err = "malformed failure report line: '" + record + "'";
      return false;
    }
    const std::string key = record.substr(0, tab);
    const std::string value = Unescape(record.substr(tab + 1));
    if (key == "kind") {
      has_kind = true;
      if (value == "syntax") {
        out.kind = Failure::Kind::Syntax;
      } else if (value == "runtime") {
        out.kind = Failure::Kind::Runtime;
      } else {
        err = "unknown failure kind in report: '" + value + "'";
        return false;
      }
    } else if (key == "type") {
      out.type = value;
    } else if (key == "message") {
      out.message = value;
    } else if (key == "line") {
      if (!value.empty()) {
        int number = 0;
        if (!ParseLineNumber(value, number, err)) {
          return false;
        }
        out.line = number;
      }
    } else if (key == "frame") {
      int number = 0;
      if (!ParseLineNumber(value, number, err)) {
        return false;
      }
      out.unit_frames.push_back(number);
    } else if (key == "detail") {
      out.detail = value;
    } else if (key == "traceback") {
      out.traceback = value;
    }
  }
  if (!has_kind) {
    err = "failure report has no kind";
    return false;
  }
  return true;
}

}  // namespace pyp::exec
