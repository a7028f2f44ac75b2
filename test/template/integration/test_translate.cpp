/***
 * Name: pyp::tests::Translate
 * Purpose: Translate a realistic template end to end (without execution).
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Runs the Frontend and ScriptEmitter stages on a report
 *   template mixing every construct and checks the full program text and the
 *   template lines behind selected program lines.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyp/stages/frontend.h"
#include "pyp/stages/script_emitter.h"
#include "pyp/template/codegen.h"
#include "pyp/template/parser.h"

using namespace pyp;

static const char* const kReport =
    "## inventory report\n"
    "<%\n"
    "    import json\n"
    "    items = json.loads('[[\"bolt\", 3], [\"nut\", 0]]')\n"
    "%>\n"
    "%pypdef row(name, qty):\n"
    "| ${name} | ${qty} |\n"
    "%endpypdef\n"
    "Report: ${len(items)} items, ${\n"
    "  sum(q for _, q in items)} units\n"
    "%for name, qty in items:\n"
    "  %if qty:\n"
    "${row(name, qty)}\n"
    "  %else:\n"
    "${name} is out of stock (100%)\n"
    "  %endif\n"
    "%endfor\n";

TEST(Translate, ReportTemplate) {
  tmpl::ParseResult parsed;
  stages::Frontend front;
  front.Build(kReport, parsed);
  std::string script;
  stages::ScriptEmitter emitter;
  emitter.Emit(parsed, script);
  EXPECT_EQ(tmpl::GenerateScript(*parsed.root), script);

  const std::string expected =
      "import json\n"
      "items = json.loads('[[\"bolt\", 3], [\"nut\", 0]]')\n"
      "def row(name, qty):\n"
      "    _OUTPUT = []\n"
      "    _OUTPUT.append('| %s | %s |' % ((name),(qty),))\n"
      "    return '\\n'.join(_OUTPUT)\n"
      "_PRINT('Report: %s items, %s' % ((len(items)),(   sum(q for _, q in items)),))\n"
      "_PRINT(' units')\n"
      "for name, qty in items:\n"
      "    if qty:\n"
      "        _PRINT('%s' % ((row(name, qty)),))\n"
      "    else:\n"
      "        _PRINT('%s is out of stock (100%%)' % ((name),))\n"
      "_PRINT('')";
  EXPECT_EQ(expected, script);

  const auto& map = parsed.line_map;
  EXPECT_EQ(3, map.Lookup(1));
  EXPECT_EQ(6, map.Lookup(3));
  EXPECT_FALSE(map.Lookup(4).has_value());
  EXPECT_EQ(9, map.Lookup(7));
  EXPECT_EQ(10, map.Lookup(8));
  EXPECT_EQ(12, map.Lookup(10));
  EXPECT_EQ(15, map.Lookup(13));
  EXPECT_EQ(18, map.Lookup(14));
}
