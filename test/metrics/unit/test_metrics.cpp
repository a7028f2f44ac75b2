/***
 * Name: pyp::tests::Metrics
 * Purpose: Validate phase timing, template geometry and the text/JSON reports.
 * Inputs: A small nested template run through the Frontend and ScriptEmitter
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pyp/metrics/metrics.h"
#include "pyp/stages/frontend.h"
#include "pyp/stages/script_emitter.h"

using pyp::metrics::Metrics;

namespace {

constexpr const char* kNested =
    "%for i in range(2):\n"
    "  %if i:\n"
    "${i}\n"
    "  %endif\n"
    "%endfor";

class MetricsTest : public ::testing::Test {
 protected:
  void SetUp() override { Metrics::Reset(); }
  void TearDown() override { Metrics::Reset(); }

  static void Translate() {
    pyp::tmpl::ParseResult parsed;
    pyp::stages::Frontend front;
    front.Build(kNested, parsed);
    std::string script;
    pyp::stages::ScriptEmitter emitter;
    emitter.Emit(parsed, script);
  }
};

}  // namespace

TEST_F(MetricsTest, DisabledRegistryRecordsNothing) {
  Translate();
  const auto& reg = Metrics::GetRegistry();
  EXPECT_TRUE(reg.durations_ns.empty());
  EXPECT_EQ(0u, reg.template_geom.node_count);
  std::ostringstream out;
  Metrics::PrintMetrics(reg, out);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(MetricsTest, EnabledRegistryRecordsPhasesAndGeometry) {
  Metrics::Enable(true);
  Translate();
  const auto& reg = Metrics::GetRegistry();
  ASSERT_EQ(3u, reg.durations_ns.size());
  EXPECT_EQ(Metrics::Phase::Preprocess, reg.durations_ns[0].first);
  EXPECT_EQ(Metrics::Phase::Parse, reg.durations_ns[1].first);
  EXPECT_EQ(Metrics::Phase::Generate, reg.durations_ns[2].first);
  EXPECT_EQ(3u, reg.template_geom.node_count);
  EXPECT_EQ(2u, reg.template_geom.max_depth);
  EXPECT_EQ(3u, reg.generated_lines);
  EXPECT_EQ(3u, reg.mapped_lines);

  std::ostringstream text;
  Metrics::PrintMetrics(reg, text);
  EXPECT_EQ(0u, text.str().find("== Metrics ==\n"));
  EXPECT_NE(std::string::npos, text.str().find("  Parse: "));
  EXPECT_NE(std::string::npos, text.str().find("  Template: nodes=3, max_depth=2\n"));
  EXPECT_NE(std::string::npos, text.str().find("  Lines: generated=3, mapped=3\n"));
}

TEST_F(MetricsTest, JsonReportCarriesAllSections) {
  Metrics::Enable(true);
  Translate();
  std::ostringstream json;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), json);
  const std::string out = json.str();
  EXPECT_EQ('{', out.front());
  EXPECT_NE(std::string::npos, out.find("\"durations_ns\": ["));
  EXPECT_NE(std::string::npos, out.find("{\"phase\": \"Generate\", \"ns\": "));
  EXPECT_NE(std::string::npos, out.find("\"template\": { \"nodes\": 3, \"max_depth\": 2 }"));
  EXPECT_NE(std::string::npos, out.find("\"lines\": { \"generated\": 3, \"mapped\": 3 }"));
}

TEST(MetricsPhaseName, NamesEveryPhase) {
  EXPECT_STREQ("ReadFile", Metrics::PhaseName(Metrics::Phase::ReadFile));
  EXPECT_STREQ("Execute", Metrics::PhaseName(Metrics::Phase::Execute));
}
