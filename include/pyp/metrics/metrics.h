/***
 * Name: pyp::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Pipeline stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and payloads (template geometry, line counts)
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

#include "pyp/template/geometry.h"

namespace pyp {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Preprocess, Parse, Generate, Execute };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    tmpl::TemplateGeometry template_geom{};
    std::size_t generated_lines{0};
    std::size_t mapped_lines{0};
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static void Reset() { reg_ = Registry{}; }
  static Registry& GetRegistry() { return reg_; }
  static void SetTemplateGeometry(const tmpl::TemplateGeometry& g) { if (reg_.enabled) reg_.template_geom = g; }
  static void SetLineCounts(std::size_t generated, std::size_t mapped) {
    if (!reg_.enabled) return;
    reg_.generated_lines = generated;
    reg_.mapped_lines = mapped;
  }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace pyp
