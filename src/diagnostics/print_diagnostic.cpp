/***
 * Name: pyp::diagnostics::PrintDiagnostic
 * Purpose: Render a Diagnostic as a banner report.
 * Inputs:
 *   - diag: diagnostic to print
 *   - out: destination stream (stderr from the driver)
 *   - debug: include the raw traceback and the template traceback
 * Outputs: None
 * Theory of Operation: Every report is `banner / location / Type: message / footer`;
 *   syntax reports add the interpreter's own text, runtime reports print the raw
 *   innermost frame when the template line is unknown.
 */
#include "pyp/diagnostics/diagnostic.h"

#include <ostream>
#include <string>

namespace pyp::diagnostics {

static constexpr const char* kParseBanner = "====== PARSE ERROR =========";
static constexpr const char* kParseFooter = "============================";
static constexpr const char* kSyntaxBanner = "======= SYNTAX ERROR =============";
static constexpr const char* kRuntimeBanner = "======= ERROR INFO ================";
static constexpr const char* kFooter = "===================================";

static void PrintLocation(const Diagnostic& diag, std::ostream& out) {
  if (diag.line) {
    out << "File \"" << diag.file << "\", line " << *diag.line << '\n';
    out << "  " << diag.line_text << '\n';
    return;
  }
  out << "Sorry, could not find pyp source line" << '\n';
  if (diag.kind == Diagnostic::Kind::Runtime && !diag.detail.empty()) {
    out << diag.detail;
    if (diag.detail.back() != '\n') {
      out << '\n';
    }
  }
}

static void PrintTemplateTraceback(const Diagnostic& diag, std::ostream& out) {
  out << '\n' << "TRACEBACK:" << '\n' << diag.traceback;
  if (!diag.traceback.empty() && diag.traceback.back() != '\n') {
    out << '\n';
  }
  out << '\n' << "PYP TRACEBACK:" << '\n';
  for (const auto& frame : diag.template_frames) {
    if (frame.line) {
      out << "  File \"" << diag.file << "\", line " << *frame.line << '\n';
      out << "    " << frame.text << '\n';
    } else {
      out << "(Unknown pyp line)" << '\n';
    }
  }
}

void PrintDiagnostic(const Diagnostic& diag, std::ostream& out, bool debug) {
  out << '\n';
  switch (diag.kind) {
    case Diagnostic::Kind::Parse:
      out << kParseBanner << '\n';
      PrintLocation(diag, out);
      out << diag.type << ": " << diag.message << '\n';
      out << kParseFooter << '\n';
      return;
    case Diagnostic::Kind::Syntax:
      out << kSyntaxBanner << '\n';
      PrintLocation(diag, out);
      out << diag.type << ": " << diag.message << '\n';
      out << '\n' << "DETAILED SYNTAX ERROR:" << '\n' << diag.detail;
      if (diag.detail.empty() || diag.detail.back() != '\n') {
        out << '\n';
      }
      out << kFooter << '\n';
      return;
    case Diagnostic::Kind::Runtime:
      out << kRuntimeBanner << '\n';
      PrintLocation(diag, out);
      out << diag.type << ": " << diag.message << '\n';
      if (debug) {
        PrintTemplateTraceback(diag, out);
      }
      out << kFooter << '\n';
      return;
  }
}

}  // namespace pyp::diagnostics
