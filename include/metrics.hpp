#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Bounded bitrate sample window. Touched from the tick and from the transport
// callback path, so it carries its own lock.
class BitrateHistory {
public:
  static constexpr size_t kDefaultCapacity = 20;

  explicit BitrateHistory(size_t cap = kDefaultCapacity) : cap_(cap) {}

  void add(int64_t bps) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(bps);
  }
  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    vals_.clear();
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }
  std::vector<int64_t> values() const {
    std::lock_guard<std::mutex> g(mu_);
    return {vals_.begin(), vals_.end()};
  }

  // Mean of samples > 0; 0 when there are none.
  int64_t average_nonzero() const;

  // Population variance and coefficient of variation (stddev / mean) over
  // nonzero samples. Empty when fewer than min_samples are held or fewer than
  // min_nonzero of them are > 0.
  struct Dispersion {
    double variance{0.0};
    double mean{0.0};
    double cv{0.0};
  };
  std::optional<Dispersion> dispersion(size_t min_samples, size_t min_nonzero) const;

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<int64_t> vals_;
};

struct WatchdogStats {
  bool running{false};
  TimePoint start_time{};
  uint64_t total_checks{0};
  uint64_t effective_checks{0};  // ticks evaluated while RUNNING
  uint64_t skipped_checks{0};    // ticks skipped while STOPPED
  uint64_t anomalies_detected{0};
  TimePoint last_check_time{};
  int64_t current_bitrate{0};
  int64_t average_bitrate{0};
  std::vector<int64_t> bitrate_history;
  std::optional<TimePoint> last_anomaly_time;
  std::string last_anomaly_type;
};

std::string prometheus_text(const WatchdogStats& s);
