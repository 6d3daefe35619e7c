#pragma once
// orr/core/timer.h
//
// Timing for aggregation runs.
//  - Stopwatch: steady-clock elapsed time since construction.
//  - PhaseRecorder: per-phase totals (discover, load, reduce), reported in
//    the order each phase first ran; ScopedPhase adds one timed scope.

#include "orr/core/types.h"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orr {

class Stopwatch {
 public:
  using Clock = std::chrono::steady_clock;

  Stopwatch() : start_(Clock::now()) {}

  u64 ElapsedNanos() const {
    return static_cast<u64>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count());
  }

  double ElapsedMillis() const { return static_cast<double>(ElapsedNanos()) / 1e6; }

 private:
  Clock::time_point start_;
};

class PhaseRecorder {
 public:
  // A phase recorded twice (e.g. two "load" scopes) accumulates.
  void Add(std::string_view name, u64 nanos) {
    for (auto& p : phases_) {
      if (p.first == name) {
        p.second += nanos;
        return;
      }
    }
    phases_.emplace_back(std::string(name), nanos);
  }

  // {"discover_ms":1.204,"load_ms":40.513,"reduce_ms":0.871}
  std::string ToJsonMillis() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << "{";
    for (usize i = 0; i < phases_.size(); ++i) {
      if (i) oss << ",";
      oss << "\"" << phases_[i].first << "_ms\":" << static_cast<double>(phases_[i].second) / 1e6;
    }
    oss << "}";
    return oss.str();
  }

  class ScopedPhase {
   public:
    ScopedPhase(PhaseRecorder* rec, std::string_view name) : rec_(rec), name_(name) {}

    ScopedPhase(const ScopedPhase&) = delete;
    ScopedPhase& operator=(const ScopedPhase&) = delete;

    ~ScopedPhase() {
      if (rec_) rec_->Add(name_, sw_.ElapsedNanos());
    }

   private:
    PhaseRecorder* rec_;
    std::string_view name_;
    Stopwatch sw_;
  };

 private:
  // At most a handful of phases per run.
  std::vector<std::pair<std::string, u64>> phases_;
};

}  // namespace orr
