/***
 * Name: pyp::tests::ParseAndRun
 * Purpose: Translate and run whole templates, checking rendered output and
 *   failures attributed to template lines.
 * Inputs: Template text
 * Outputs: Pass/fail test results (skipped without a host interpreter).
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "common/host_python.h"
#include "pyp/engine/engine.h"

using pyp::diagnostics::Diagnostic;
using pyp::engine::ParseAndRun;
using pyp::engine::RunOptions;

namespace {

class ParseAndRunTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!pyp_test::HostPythonAvailable()) {
      GTEST_SKIP() << "no host python interpreter";
    }
  }

  RunOptions Options(const std::string& output_name) const {
    RunOptions opts;
    opts.input_name = "page.pyp";
    opts.output_path = dir_.file(output_name);
    opts.python = pyp_test::HostPython();
    return opts;
  }

  pyp_test::ScratchDir dir_{std::string("parse_and_run_") +
                           ::testing::UnitTest::GetInstance()->current_test_info()->name()};
};

}  // namespace

TEST_F(ParseAndRunTest, RendersTemplate) {
  const std::string text =
      "<%\n"
      "    names = ['ada', 'grace']\n"
      "%>\n"
      "%pypdef greet(who):\n"
      "Hello, ${who.title()}!\n"
      "%endpypdef\n"
      "%for n in names:\n"
      "${greet(n)}\n"
      "%endfor\n"
      "Total: ${len(names)} (100%)";
  const auto opts = Options("render.txt");
  const auto result = ParseAndRun(text, opts);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ("Hello, Ada!\nHello, Grace!\nTotal: 2 (100%)\n", pyp_test::ReadAll(opts.output_path));
}

TEST_F(ParseAndRunTest, RuntimeErrorMapsToTemplateLine) {
  const auto result = ParseAndRun("first\n${missing}\n", Options("runtime.txt"));
  ASSERT_FALSE(result.ok);
  ASSERT_TRUE(result.diagnostic.has_value());
  EXPECT_EQ(Diagnostic::Kind::Runtime, result.diagnostic->kind);
  EXPECT_EQ("NameError", result.diagnostic->type);
  EXPECT_EQ(2, result.diagnostic->line.value_or(-1));
  EXPECT_EQ("${missing}", result.diagnostic->line_text);
}

TEST_F(ParseAndRunTest, ErrorInsidePypdefMapsThroughEveryFrame) {
  const std::string text =
      "%pypdef f():\n"
      "${1 / 0}\n"
      "%endpypdef\n"
      "${f()}";
  const auto result = ParseAndRun(text, Options("pypdef.txt"));
  ASSERT_TRUE(result.diagnostic.has_value());
  EXPECT_EQ("ZeroDivisionError", result.diagnostic->type);
  EXPECT_EQ(2, result.diagnostic->line.value_or(-1));
  ASSERT_EQ(2u, result.diagnostic->template_frames.size());
  EXPECT_EQ(4, result.diagnostic->template_frames[0].line.value_or(-1));
  EXPECT_EQ(2, result.diagnostic->template_frames[1].line.value_or(-1));
}

TEST_F(ParseAndRunTest, SyntaxErrorMapsToDirective) {
  const auto result = ParseAndRun("%for x in:\nhi\n%endfor", Options("syntax.txt"));
  ASSERT_TRUE(result.diagnostic.has_value());
  EXPECT_EQ(Diagnostic::Kind::Syntax, result.diagnostic->kind);
  EXPECT_EQ(1, result.diagnostic->line.value_or(-1));
  EXPECT_EQ("%for x in:", result.diagnostic->line_text);
}

TEST_F(ParseAndRunTest, ParseErrorSkipsExecution) {
  const auto opts = Options("parse.txt");
  const auto result = ParseAndRun("text\n%endfor\n", opts);
  ASSERT_TRUE(result.diagnostic.has_value());
  EXPECT_EQ(Diagnostic::Kind::Parse, result.diagnostic->kind);
  EXPECT_EQ(2, result.diagnostic->line.value_or(-1));
  EXPECT_TRUE(result.script.empty());
  EXPECT_FALSE(std::filesystem::exists(opts.output_path));
}
