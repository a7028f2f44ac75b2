/***
 * Name: pyp::tests::MapFailure
 * Purpose: Validate attribution of generated-line failures to template lines.
 * Inputs: Hand-built LineMap and Failure values
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pyp/diagnostics/diagnostic.h"

using namespace pyp;

namespace {

// Generated 1 <- template 1, generated 2 synthetic, generated 3 <- template 3.
tmpl::LineMap SampleMap() {
  tmpl::LineMap map;
  map.Record(1);
  map.Skip();
  map.Record(3);
  return map;
}

const std::vector<std::string> kTemplate = {"%pypdef f():", "%endpypdef", "${undefined_name}"};

}  // namespace

TEST(MapFailure, RuntimeLineResolvesToTemplateText) {
  exec::Failure failure;
  failure.kind = exec::Failure::Kind::Runtime;
  failure.type = "NameError";
  failure.message = "name 'undefined_name' is not defined";
  failure.line = 3;
  failure.unit_frames = {3};
  const auto diag = diagnostics::MapFailure(failure, SampleMap(), kTemplate, "page.pyp");
  EXPECT_EQ(diagnostics::Diagnostic::Kind::Runtime, diag.kind);
  EXPECT_EQ("page.pyp", diag.file);
  ASSERT_TRUE(diag.line.has_value());
  EXPECT_EQ(3, *diag.line);
  EXPECT_EQ("${undefined_name}", diag.line_text);
  EXPECT_EQ("NameError", diag.type);
  ASSERT_EQ(1u, diag.template_frames.size());
  EXPECT_EQ(3, diag.template_frames[0].line.value_or(-1));
}

TEST(MapFailure, SyntheticAndMissingLinesStayUnmapped) {
  exec::Failure failure;
  failure.kind = exec::Failure::Kind::Runtime;
  failure.type = "TypeError";
  failure.line = 2;
  failure.unit_frames = {3, 2, 40};
  const auto diag = diagnostics::MapFailure(failure, SampleMap(), kTemplate, "page.pyp");
  EXPECT_FALSE(diag.line.has_value());
  EXPECT_TRUE(diag.line_text.empty());
  ASSERT_EQ(3u, diag.template_frames.size());
  EXPECT_TRUE(diag.template_frames[0].line.has_value());
  EXPECT_FALSE(diag.template_frames[1].line.has_value());
  EXPECT_FALSE(diag.template_frames[2].line.has_value());
}

TEST(MapFailure, SyntaxFailureWithoutLine) {
  exec::Failure failure;
  failure.kind = exec::Failure::Kind::Syntax;
  failure.type = "SyntaxError";
  const auto diag = diagnostics::MapFailure(failure, SampleMap(), kTemplate, "page.pyp");
  EXPECT_EQ(diagnostics::Diagnostic::Kind::Syntax, diag.kind);
  EXPECT_FALSE(diag.line.has_value());
}

TEST(FromParseError, UsesOriginalTemplateLine) {
  const std::vector<std::string> lines = {"%for x in y:", "  ${x}"};
  const exceptions::ParseError error("Reached end of input without end control word (endfor)", "${x}", 2);
  const auto diag = diagnostics::FromParseError(error, lines, "loop.pyp");
  EXPECT_EQ(diagnostics::Diagnostic::Kind::Parse, diag.kind);
  EXPECT_EQ(2, diag.line.value_or(-1));
  EXPECT_EQ("  ${x}", diag.line_text);
  EXPECT_EQ("ParseError", diag.type);
  EXPECT_EQ("Reached end of input without end control word (endfor)", diag.message);
}

TEST(FromParseError, FallsBackToErrorTextOutsideTemplate) {
  const exceptions::ParseError error("bad", "joined text", 9);
  const auto diag = diagnostics::FromParseError(error, {"only line"}, "t.pyp");
  EXPECT_EQ("joined text", diag.line_text);
}
