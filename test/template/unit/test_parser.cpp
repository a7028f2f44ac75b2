/***
 * Name: pyp::tests::Parser
 * Purpose: Validate block parsing: nesting, middle clauses, error locations and
 *   the generated -> template line map.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Parse small templates and inspect the tree, the LineMap
 *   and the ParseError thrown for malformed keyword structure.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pyp/exceptions/parse_error.h"
#include "pyp/template/geometry.h"
#include "pyp/template/parser.h"
#include "pyp/template/preprocess.h"

using namespace pyp;
using namespace pyp::tmpl;

static ParseResult ParseText(const std::string& text) { return ParseTemplate(Preprocess(text)); }

static int ParseErrorLine(const std::string& text, std::string* message = nullptr) {
  try {
    (void)ParseText(text);
  } catch (const exceptions::ParseError& error) {
    if (message != nullptr) {
      *message = error.what();
    }
    return error.line_number();
  }
  return 0;
}

static std::size_t MaxDepth(const std::string& text) {
  const auto parsed = ParseText(text);
  TemplateGeometry geometry;
  ComputeGeometry(*parsed.root, geometry);
  return geometry.max_depth;
}

TEST(Parser, FlatTemplateHasOneStatementPerLiteralLine) {
  const auto parsed = ParseText("a\nb ${x}\nc");
  ASSERT_EQ(3u, parsed.root->nodes.size());
  for (const auto& node : parsed.root->nodes) {
    EXPECT_EQ(NodeKind::Statement, node->kind);
  }
  EXPECT_EQ(3u, parsed.line_map.size());
}

TEST(Parser, DepthEqualsControlNesting) {
  EXPECT_EQ(0u, MaxDepth("plain\n${x}"));
  EXPECT_EQ(1u, MaxDepth("%for i in xs:\n${i}\n%endfor"));
  EXPECT_EQ(3u, MaxDepth("%for i in xs:\n%if i:\n%while i:\n% i -= 1\n%endwhile\n%endif\n%endfor"));
  EXPECT_EQ(2u, MaxDepth("%if a:\n%for i in b:\nx\n%endfor\n%else:\n%with c:\ny\n%endwith\n%endif\n"
                         "%try:\nz\n%except ValueError:\nw\n%finally:\nv\n%endtry"));
}

TEST(Parser, MiddleClausesShareOneControlSequence) {
  const auto parsed = ParseText("%if a:\n1\n%elif b:\n2\n%else:\n3\n%endif");
  ASSERT_EQ(1u, parsed.root->nodes.size());
  ASSERT_EQ(NodeKind::ControlSequence, parsed.root->nodes[0]->kind);
  const auto& control = static_cast<const ControlSequence&>(*parsed.root->nodes[0]);
  ASSERT_EQ(3u, control.blocks.size());
  EXPECT_EQ("if a:", control.blocks[0].header);
  EXPECT_EQ("elif b:", control.blocks[1].header);
  EXPECT_EQ("else:", control.blocks[2].header);
  EXPECT_EQ(5, control.blocks[2].line);
  for (const auto& block : control.blocks) {
    EXPECT_EQ(1u, block.nodes.size());
  }
}

TEST(Parser, MismatchedEndReportsThatLine) {
  std::string message;
  EXPECT_EQ(4, ParseErrorLine("%for x in xs:\n%if x:\na\n%endfor\n%endif\n%endfor", &message));
  EXPECT_EQ("End control word (endfor) doesn't match current block ('if x:', line 2)", message);
  EXPECT_EQ(2, ParseErrorLine("text\n%endwhile"));
}

TEST(Parser, EndWithoutStart) {
  std::string message;
  EXPECT_EQ(1, ParseErrorLine("%endif", &message));
  EXPECT_EQ("Found end control word (endif) without starting word", message);
}

TEST(Parser, MiddleWithoutOrOutsideItsBlock) {
  std::string message;
  EXPECT_EQ(2, ParseErrorLine("x\n%else:\ny", &message));
  EXPECT_EQ("Found middle control word (else) without starting word", message);
  EXPECT_EQ(3, ParseErrorLine("%for x in y:\nz\n%except KeyError:\n%endfor", &message));
  EXPECT_EQ("Middle control word (except) doesn't match current block ('for x in y:', line 1)", message);
}

TEST(Parser, LoopElseIsNotAClause) {
  std::string message;
  EXPECT_EQ(3, ParseErrorLine("%for x in y:\nz\n%else:\nnone\n%endfor", &message));
  EXPECT_EQ("Middle control word (else) doesn't match current block ('for x in y:', line 1)", message);
  EXPECT_EQ(3, ParseErrorLine("%try:\nz\n% else:\nw\n%endtry", &message));
}

TEST(Parser, UnclosedBlockReportsLastLineAndNamesOpener) {
  std::string message;
  EXPECT_EQ(6, ParseErrorLine("top\n%for x in xs:\n  %if x:\nbody\n  %endif\n", &message));
  EXPECT_NE(std::string::npos, message.find("endfor"));
  try {
    (void)ParseText("top\n%for x in xs:\nbody\nlast line");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& error) {
    EXPECT_EQ(4, error.line_number());
    EXPECT_EQ("last line", error.line());
    EXPECT_STREQ("Reached end of input without end control word (endfor) for block ('for x in xs:', line 2)",
                 error.what());
  }
}

TEST(Parser, ParseErrorCarriesLineText) {
  try {
    (void)ParseText("a\n  %endtry  ");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& error) {
    EXPECT_EQ(2, error.line_number());
    EXPECT_EQ("  %endtry  ", error.line());
  }
}

TEST(Parser, CommentsAndPlaceholdersProduceNoNodes) {
  const auto parsed = ParseText("## header\nv ${f(\n1)}\n## tail");
  ASSERT_EQ(1u, parsed.root->nodes.size());
  EXPECT_EQ(1u, parsed.line_map.size());
  EXPECT_EQ(2, parsed.line_map.Lookup(1));
}

TEST(Parser, RawStatementIsKeptVerbatim) {
  const auto parsed = ParseText("% total = sum(x for x in range(3))");
  ASSERT_EQ(1u, parsed.root->nodes.size());
  const auto& stmt = static_cast<const StatementLine&>(*parsed.root->nodes[0]);
  EXPECT_EQ("total = sum(x for x in range(3))", stmt.text);
  EXPECT_FALSE(stmt.verbatim);
}

TEST(Parser, LineMapSkipsAccumulatorLines) {
  const auto parsed = ParseText("before\n%pypdef greet(n):\nHi ${n}\n%endpypdef\nafter");
  const auto& map = parsed.line_map;
  EXPECT_EQ(1, map.Lookup(1));
  EXPECT_EQ(2, map.Lookup(2));
  EXPECT_FALSE(map.Lookup(3).has_value());
  EXPECT_EQ(3, map.Lookup(4));
  EXPECT_FALSE(map.Lookup(5).has_value());
  EXPECT_EQ(5, map.Lookup(6));
  EXPECT_FALSE(map.Lookup(7).has_value());
  EXPECT_EQ(7, map.next_line());
}

TEST(Parser, LineMapIsMonotonic) {
  const auto parsed = ParseText("%for a in b:\n%if a:\nx\n%elif c:\n<%\ny = 1\nz = 2\n%>\n%endif\n%endfor\nlast");
  int previous = 0;
  for (const auto& [generated, original] : parsed.line_map.entries()) {
    EXPECT_GT(original, previous) << "generated line " << generated;
    previous = original;
  }
  EXPECT_EQ(7u, parsed.line_map.size());
}
