/***
 * Name: pyp::tests::PrintDiagnostic
 * Purpose: Validate the banner reports for parse, syntax and runtime failures.
 * Inputs: Diagnostic values
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pyp/diagnostics/diagnostic.h"

using pyp::diagnostics::Diagnostic;
using pyp::diagnostics::PrintDiagnostic;
using pyp::diagnostics::TemplateFrame;

static std::string Render(const Diagnostic& diag, bool debug) {
  std::ostringstream out;
  PrintDiagnostic(diag, out, debug);
  return out.str();
}

TEST(PrintDiagnostic, ParseBanner) {
  Diagnostic diag;
  diag.kind = Diagnostic::Kind::Parse;
  diag.file = "a.pyp";
  diag.line = 4;
  diag.line_text = "%else:";
  diag.type = "ParseError";
  diag.message = "Found middle control word (else) without starting word";
  const std::string expected =
      "\n"
      "====== PARSE ERROR =========\n"
      "File \"a.pyp\", line 4\n"
      "  %else:\n"
      "ParseError: Found middle control word (else) without starting word\n"
      "============================\n";
  EXPECT_EQ(expected, Render(diag, false));
}

TEST(PrintDiagnostic, SyntaxIncludesInterpreterDetail) {
  Diagnostic diag;
  diag.kind = Diagnostic::Kind::Syntax;
  diag.file = "a.pyp";
  diag.line = 2;
  diag.line_text = "%for x in:";
  diag.type = "SyntaxError";
  diag.message = "invalid syntax";
  diag.detail = "  File \"<pyp>\", line 1\n    for x in:\n            ^\n";
  const std::string expected =
      "\n"
      "======= SYNTAX ERROR =============\n"
      "File \"a.pyp\", line 2\n"
      "  %for x in:\n"
      "SyntaxError: invalid syntax\n"
      "\n"
      "DETAILED SYNTAX ERROR:\n"
      "  File \"<pyp>\", line 1\n    for x in:\n            ^\n"
      "===================================\n";
  EXPECT_EQ(expected, Render(diag, false));
}

TEST(PrintDiagnostic, UnmappedRuntimeShowsRawFrame) {
  Diagnostic diag;
  diag.kind = Diagnostic::Kind::Runtime;
  diag.file = "a.pyp";
  diag.type = "ZeroDivisionError";
  diag.message = "division by zero";
  diag.detail = "  File \"<pyp>\", line 7, in <module>";
  const std::string expected =
      "\n"
      "======= ERROR INFO ================\n"
      "Sorry, could not find pyp source line\n"
      "  File \"<pyp>\", line 7, in <module>\n"
      "ZeroDivisionError: division by zero\n"
      "===================================\n";
  EXPECT_EQ(expected, Render(diag, false));
}

TEST(PrintDiagnostic, DebugAddsBothTracebacks) {
  Diagnostic diag;
  diag.kind = Diagnostic::Kind::Runtime;
  diag.file = "a.pyp";
  diag.line = 5;
  diag.line_text = "${boom()}";
  diag.type = "RuntimeError";
  diag.message = "boom";
  diag.traceback = "Traceback (most recent call last):\n  File \"<pyp>\", line 9, in <module>\n";
  diag.template_frames = {TemplateFrame{5, "${boom()}"}, TemplateFrame{}};
  const std::string rendered = Render(diag, true);
  EXPECT_NE(std::string::npos, rendered.find("\nTRACEBACK:\nTraceback (most recent call last):\n"));
  EXPECT_NE(std::string::npos,
            rendered.find("\nPYP TRACEBACK:\n  File \"a.pyp\", line 5\n    ${boom()}\n(Unknown pyp line)\n"));
  EXPECT_EQ(std::string::npos, Render(diag, false).find("TRACEBACK"));
}
