/***
 * Name: pyp::tests::Preprocess
 * Purpose: Validate line splitting and folding of multi-line expressions.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Compare Preprocess() output against SplitLines() to check
 *   that line numbering always follows the physical input.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pyp/template/preprocess.h"

using namespace pyp::tmpl;

TEST(Preprocess, SplitLinesKeepsTrailingEmptyLine) {
  const auto lines = SplitLines("a\r\nb\n");
  ASSERT_EQ(3u, lines.size());
  EXPECT_EQ("a", lines[0]);
  EXPECT_EQ("b", lines[1]);
  EXPECT_EQ("", lines[2]);
}

TEST(Preprocess, FoldsMultiLineExpressionAndPadsLines) {
  const auto lines = Preprocess("head\nvalue ${compute(\n  1,\n  2)}\ntail");
  ASSERT_EQ(5u, lines.size());
  EXPECT_EQ("value ${compute(   1,   2)}", lines[1].text);
  EXPECT_FALSE(lines[1].placeholder);
  EXPECT_TRUE(lines[2].placeholder);
  EXPECT_TRUE(lines[3].placeholder);
  EXPECT_EQ("tail", lines[4].text);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    EXPECT_EQ(static_cast<int>(i) + 1, lines[i].line);
  }
}

TEST(Preprocess, TextAfterExpressionStaysOnItsPhysicalLine) {
  const auto lines = Preprocess("a ${x +\ny} b");
  ASSERT_EQ(2u, lines.size());
  EXPECT_EQ("a ${x + y}", lines[0].text);
  EXPECT_EQ(" b", lines[1].text);
  EXPECT_FALSE(lines[1].placeholder);
}

TEST(Preprocess, UnclosedExpressionIsLiteralText) {
  const auto lines = Preprocess("cost ${oops\nnext");
  ASSERT_EQ(2u, lines.size());
  EXPECT_EQ("cost ${oops", lines[0].text);
  EXPECT_EQ("next", lines[1].text);
}

TEST(Preprocess, LineCountMatchesPhysicalLines) {
  const std::vector<std::string> inputs{
      "",
      "one line",
      "a\nb\nc\n",
      "${a\n\n\nb} x ${c\nd}\n%for i in y:\n${i\n}\n%endfor",
      "crlf\r\n${a\r\nb}\r\n",
  };
  for (const auto& text : inputs) {
    EXPECT_EQ(SplitLines(text).size(), Preprocess(text).size()) << text;
  }
}

TEST(Preprocess, StripsCarriageReturns) {
  const auto lines = Preprocess("x\r\ny");
  ASSERT_EQ(2u, lines.size());
  EXPECT_EQ("x", lines[0].text);
}
