#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "event_loop.hpp"
#include "run_state.hpp"
#include "types.hpp"

enum class ReconnectMode { FIXED, EXPONENTIAL };

struct ReconnectPolicy {
  ReconnectMode mode{ReconnectMode::FIXED};
  Millis fixed_delay{3000};
  Millis base_delay{3000};
  Millis max_delay{std::chrono::hours(1)};
  bool jitter{true};  // up to +25% on exponential delays
  std::chrono::hours max_retry_window{24 * 30};
};

struct BackoffState {
  uint32_t attempts{0};
  std::optional<TimePoint> first_failure;
  Millis last_delay{0};
};

constexpr double kMaxJitterFraction = 0.25;

// min(base * 2^attempt * (1 + jitter_fraction), max_delay) for exponential
// policies, fixed_delay otherwise.
Millis compute_backoff_delay(const ReconnectPolicy& p, uint32_t attempt, double jitter_fraction);

// Tears a session down and rebuilds it after a delay. Only one attempt is in
// flight at a time; scheduling retires whatever was pending.
class ReconnectCoordinator {
public:
  // release and exhausted run synchronously inside schedule_reconnect() on the
  // caller's thread. rebuild runs on the engine executor and receives the
  // generation it was scheduled under.
  using ReleaseFn = std::function<void()>;
  using RebuildFn = std::function<bool(uint64_t generation)>;
  using ExhaustedFn = std::function<void(const std::string& reason)>;

  ReconnectCoordinator(const RunStateGate& gate, Executor& engine, const ClockSource& clock,
                       ReconnectPolicy policy, uint32_t seed = std::random_device{}());
  ~ReconnectCoordinator();

  void set_handlers(ReleaseFn release, RebuildFn rebuild, ExhaustedFn exhausted);

  bool schedule_reconnect(const std::string& reason);
  void cancel_reconnect();
  void reset_backoff();

  bool pending() const;
  bool is_current(uint64_t generation) const { return generation == generation_.load(); }
  BackoffState backoff_state() const;

  ReconnectPolicy policy() const;
  void update_policy(const ReconnectPolicy& p);

private:
  void cancel_locked();
  Millis next_delay_locked();
  void run_attempt(uint64_t generation, const std::string& reason);

  const RunStateGate& gate_;
  Executor& engine_;
  const ClockSource& clock_;

  ReleaseFn release_;
  RebuildFn rebuild_;
  ExhaustedFn exhausted_;

  mutable std::mutex mu_;
  ReconnectPolicy policy_;
  BackoffState backoff_;
  std::optional<TaskId> task_;
  std::atomic<uint64_t> generation_{0};
  std::mt19937 rng_;
};
