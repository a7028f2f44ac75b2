/***
 * Name: pyp::tests::FailureReport
 * Purpose: Validate decoding of the bootstrap's failure report.
 * Inputs: Report text
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyp/exec/failure.h"

using pyp::exec::Failure;
using pyp::exec::ParseFailureReport;

TEST(FailureReport, DecodesRuntimeReport) {
  const std::string text =
      "kind\truntime\n"
      "type\tKeyError\n"
      "message\t'missing'\n"
      "line\t12\n"
      "frame\t4\n"
      "frame\t12\n"
      "detail\t  File \"<pyp>\", line 12, in row\n"
      "traceback\tTraceback:\\n\\tline one\\n back\\\\slash\n";
  Failure failure;
  std::string err;
  ASSERT_TRUE(ParseFailureReport(text, failure, err)) << err;
  EXPECT_EQ(Failure::Kind::Runtime, failure.kind);
  EXPECT_EQ("KeyError", failure.type);
  EXPECT_EQ("'missing'", failure.message);
  EXPECT_EQ(12, failure.line.value_or(-1));
  ASSERT_EQ(2u, failure.unit_frames.size());
  EXPECT_EQ(4, failure.unit_frames[0]);
  EXPECT_EQ("Traceback:\n\tline one\n back\\slash", failure.traceback);
}

TEST(FailureReport, EmptyLineMeansNoLine) {
  Failure failure;
  std::string err;
  ASSERT_TRUE(ParseFailureReport("kind\tsyntax\ntype\tSyntaxError\nline\t\nextra\tignored\n", failure, err)) << err;
  EXPECT_EQ(Failure::Kind::Syntax, failure.kind);
  EXPECT_FALSE(failure.line.has_value());
}

TEST(FailureReport, RejectsMalformedReports) {
  Failure failure;
  std::string err;
  EXPECT_FALSE(ParseFailureReport("type\tNameError\n", failure, err));
  EXPECT_EQ("failure report has no kind", err);
  EXPECT_FALSE(ParseFailureReport("kind\truntime\nno tab here\n", failure, err));
  EXPECT_FALSE(ParseFailureReport("kind\tweird\n", failure, err));
  EXPECT_FALSE(ParseFailureReport("kind\truntime\nline\tseven\n", failure, err));
  EXPECT_EQ("invalid line number in failure report: 'seven'", err);
}
