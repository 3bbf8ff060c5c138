/**
 * @file debug.h
 * @brief Tracing and timing for csvexpr codecs.
 */

#ifndef CSVEXPR_DEBUG_H
#define CSVEXPR_DEBUG_H

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace csvexpr {

struct DebugConfig {
  bool verbose = false;
  bool timing = false;
  FILE* output = nullptr; // stderr when null

  static DebugConfig all() {
    DebugConfig config;
    config.verbose = true;
    config.timing = true;
    return config;
  }

  bool enabled() const { return verbose || timing; }
};

struct PhaseTime {
  std::string name;
  std::chrono::nanoseconds duration;
  size_t records = 0;

  double seconds() const { return duration.count() / 1e9; }

  double records_per_second() const {
    if (records == 0 || duration.count() == 0)
      return 0.0;
    return records / seconds();
  }
};

/**
 * @class DebugTrace
 * @brief printf-style logging of bind-time decisions and per-record recovery.
 *
 * @note Not thread-safe. A trace belongs to one codec instance, which is only
 *       ever driven by one thread at a time.
 */
class DebugTrace {
public:
  explicit DebugTrace(const DebugConfig& config = DebugConfig()) : config_(config) {}

  bool enabled() const { return config_.enabled(); }
  bool verbose() const { return config_.verbose; }
  bool timing() const { return config_.timing; }

  // Format attribute index 2: 'this' is the implicit first parameter
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void log(const char* fmt, ...) const {
    if (!config_.verbose)
      return;
    FILE* out = stream();
    fprintf(out, "[csvexpr] ");
    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);
    fprintf(out, "\n");
    fflush(out);
  }

  // No format interpretation; use for user-provided strings.
  void log_str(const char* msg) const {
    if (!config_.verbose)
      return;
    FILE* out = stream();
    fprintf(out, "[csvexpr] %s\n", msg);
    fflush(out);
  }

  void log_decision(const char* decision, const char* reason) const {
    if (!config_.verbose)
      return;
    FILE* out = stream();
    fprintf(out, "[csvexpr] DECISION: %s | Reason: %s\n", decision, reason);
    fflush(out);
  }

  void start_phase(const char* phase_name) {
    if (!config_.timing)
      return;
    current_phase_ = phase_name;
    phase_start_ = std::chrono::steady_clock::now();
  }

  void end_phase(size_t records = 0) {
    if (!config_.timing)
      return;
    auto end = std::chrono::steady_clock::now();
    PhaseTime pt;
    pt.name = current_phase_;
    pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
    pt.records = records;
    phase_times_.push_back(pt);
  }

  void print_timing_summary() const {
    if (!config_.timing || phase_times_.empty())
      return;
    FILE* out = stream();
    fprintf(out, "[csvexpr] TIMING:\n");
    for (const auto& pt : phase_times_) {
      fprintf(out, "  %-20s %10.3f ms", pt.name.c_str(), pt.seconds() * 1000.0);
      if (pt.records > 0) {
        fprintf(out, "  (%zu records, %.0f records/s)", pt.records, pt.records_per_second());
      }
      fprintf(out, "\n");
    }
    fflush(out);
  }

  const std::vector<PhaseTime>& phase_times() const { return phase_times_; }

private:
  FILE* stream() const { return config_.output ? config_.output : stderr; }

  DebugConfig config_;
  std::string current_phase_;
  std::chrono::steady_clock::time_point phase_start_;
  std::vector<PhaseTime> phase_times_;
};

} // namespace csvexpr

#endif // CSVEXPR_DEBUG_H
