/***
 * Name: pyp::exec::RunScript
 * Purpose: Write the generated program to disk and run it in the host interpreter.
 * Inputs:
 *   - request: program text, unit/output paths, seed, template args, interpreter
 * Outputs:
 *   - ExecOutcome: ok, or the decoded Failure
 * Theory of Operation:
 *   1. The unit goes to request.unit_path (kept) or a temp `*.py` (removed).
 *   2. Output is written by the child to `<output>.tmp`, renamed over the output
 *      on success and removed on any failure.
 *   3. Child exit status: 0 ok; kReportWritten -> decode the report;
 *      kExecFailure -> the interpreter could not be started (ExecError);
 *      anything else is a runtime failure without a program line.
 */
#include "pyp/exec/runner.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pyp/exceptions/exec_error.h"
#include "pyp/exec/detail/exec.h"
#include "pyp/support/fs.h"

namespace pyp::exec {

namespace {

/*** ScratchFile: Removes a temporary file when the run finishes. */
class ScratchFile {
 public:
  ScratchFile() = default;
  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;
  ~ScratchFile() {
    if (path_.empty()) {
      return;
    }
    std::string err;
    if (!support::RemoveFile(path_, err)) {
      std::cerr << "pyp: warning: " << err << '\n';
    }
  }

  void Create(const std::string& prefix, const std::string& suffix) {
    std::string err;
    if (!support::MakeTempFile(prefix, suffix, path_, err)) {
      throw exceptions::ExecError(err);
    }
  }
  void Adopt(std::string path) { path_ = std::move(path); }
  const std::string& path() const { return path_; }

 private:
  std::string path_{};
};

Failure ProcessExitFailure(const std::string& python, int exit_code) {
  Failure failure;
  failure.kind = Failure::Kind::Runtime;
  failure.type = "ProcessExit";
  failure.message = python + " exited with status " + std::to_string(exit_code);
  return failure;
}

}  // namespace

auto RunScript(const ExecRequest& request) -> ExecOutcome {  // NOLINT(readability-function-size)
  ExecOutcome outcome;
  std::string err;

  ScratchFile temp_unit;
  outcome.unit_path = request.unit_path;
  if (outcome.unit_path.empty()) {
    temp_unit.Create("pyp_", ".py");
    outcome.unit_path = temp_unit.path();
  }
  if (!support::WriteFile(outcome.unit_path, request.script + "\n", err)) {
    throw exceptions::ExecError(err);
  }
  if (request.debug) {
    std::cout << "Python executable: " << outcome.unit_path << '\n';
  }

  ScratchFile report;
  report.Create("pyp_report_", ".txt");

  ScratchFile partial_output;
  std::string child_output = "-";
  if (!request.output_path.empty()) {
    child_output = request.output_path + ".tmp";
    partial_output.Adopt(child_output);
  }

  std::vector<std::string> args{request.python, "-c", HostBootstrapSource(), outcome.unit_path, report.path(),
                                child_output, request.seed ? std::to_string(*request.seed) : "-",
                                request.input_name};
  args.insert(args.end(), request.template_args.begin(), request.template_args.end());
  auto argv = detail::BuildArgvMutable(args);

  int exit_code = 0;
  if (!detail::SpawnAndWait(argv, exit_code, err)) {
    throw exceptions::ExecError(err);
  }
  if (exit_code == detail::kExecFailure) {
    throw exceptions::ExecError("failed to execute python interpreter '" + request.python + "'");
  }

  if (exit_code == 0) {
    if (!request.output_path.empty()) {
      std::error_code ec;
      std::filesystem::rename(child_output, request.output_path, ec);
      if (ec) {
        throw exceptions::ExecError("failed to rename " + child_output + " to " + request.output_path + ": " +
                                    ec.message());
      }
      partial_output.Adopt("");
    }
    outcome.ok = true;
    return outcome;
  }

  if (exit_code != detail::kReportWritten) {
    outcome.failure = ProcessExitFailure(request.python, exit_code);
    return outcome;
  }
  std::string report_text;
  if (!support::ReadFile(report.path(), report_text, err)) {
    throw exceptions::ExecError(err);
  }
  Failure failure;
  if (!ParseFailureReport(report_text, failure, err)) {
    throw exceptions::ExecError(err);
  }
  outcome.failure = std::move(failure);
  return outcome;
}

}  // namespace pyp::exec
