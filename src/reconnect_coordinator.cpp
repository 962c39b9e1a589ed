#include "reconnect_coordinator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

using namespace std::chrono;

Millis compute_backoff_delay(const ReconnectPolicy& p, uint32_t attempt, double jitter_fraction) {
  if (p.mode == ReconnectMode::FIXED) return p.fixed_delay;

  const double jitter = std::clamp(jitter_fraction, 0.0, kMaxJitterFraction);
  const double cap = static_cast<double>(p.max_delay.count());
  // 2^62 ms is far beyond any sane cap; keeps ldexp finite
  const double raw = std::ldexp(static_cast<double>(p.base_delay.count()),
                                static_cast<int>(std::min<uint32_t>(attempt, 62)));
  const double delay = std::min(raw * (1.0 + jitter), cap);
  return Millis{static_cast<Millis::rep>(delay)};
}

ReconnectCoordinator::ReconnectCoordinator(const RunStateGate& gate, Executor& engine,
                                           const ClockSource& clock, ReconnectPolicy policy,
                                           uint32_t seed)
    : gate_(gate), engine_(engine), clock_(clock), policy_(policy), rng_(seed) {}

ReconnectCoordinator::~ReconnectCoordinator() { cancel_reconnect(); }

void ReconnectCoordinator::set_handlers(ReleaseFn release, RebuildFn rebuild,
                                        ExhaustedFn exhausted) {
  release_ = std::move(release);
  rebuild_ = std::move(rebuild);
  exhausted_ = std::move(exhausted);
}

bool ReconnectCoordinator::schedule_reconnect(const std::string& reason) {
  Millis delay{0};
  uint32_t attempt = 0;
  uint64_t generation = 0;
  bool exhausted = false;
  hours window{0};
  {
    std::lock_guard<std::mutex> g(mu_);
    cancel_locked();
    if (gate_.is_stopped()) {
      spdlog::debug("Run state STOPPED, not scheduling reconnect ({})", reason);
      return false;
    }

    const TimePoint now = clock_.now();
    if (!backoff_.first_failure) backoff_.first_failure = now;
    window = policy_.max_retry_window;
    if (now - *backoff_.first_failure > window) {
      exhausted = true;
    } else {
      delay = next_delay_locked();
      attempt = ++backoff_.attempts;
      backoff_.last_delay = delay;
      generation = generation_.load();
    }
  }

  if (exhausted) {
    const std::string msg = fmt::format("reconnect window of {}h exhausted after {} attempt(s)",
                                        window.count(), backoff_state().attempts);
    spdlog::error("{}", msg);
    if (exhausted_) exhausted_(msg);
    return false;
  }

  spdlog::info("Scheduling reconnect #{} in {}ms: {}", attempt, delay.count(), reason);

  if (release_) {
    try {
      release_();
    } catch (const std::exception& e) {
      spdlog::warn("Release before reconnect failed: {}", e.what());
    }
  }

  std::lock_guard<std::mutex> g(mu_);
  if (generation != generation_.load()) {
    spdlog::debug("Reconnect cancelled during release");
    return false;
  }
  task_ = engine_.post_delayed(delay, [this, generation, reason] { run_attempt(generation, reason); });
  return true;
}

void ReconnectCoordinator::cancel_reconnect() {
  std::lock_guard<std::mutex> g(mu_);
  cancel_locked();
}

// Retires the generation first so an attempt already dequeued by the engine
// executor sees itself as stale.
void ReconnectCoordinator::cancel_locked() {
  ++generation_;
  if (task_) {
    engine_.cancel(*task_);
    task_.reset();
    spdlog::debug("Pending reconnect cancelled");
  }
}

void ReconnectCoordinator::reset_backoff() {
  std::lock_guard<std::mutex> g(mu_);
  backoff_ = BackoffState{};
}

bool ReconnectCoordinator::pending() const {
  std::lock_guard<std::mutex> g(mu_);
  return task_.has_value();
}

BackoffState ReconnectCoordinator::backoff_state() const {
  std::lock_guard<std::mutex> g(mu_);
  return backoff_;
}

ReconnectPolicy ReconnectCoordinator::policy() const {
  std::lock_guard<std::mutex> g(mu_);
  return policy_;
}

void ReconnectCoordinator::update_policy(const ReconnectPolicy& p) {
  std::lock_guard<std::mutex> g(mu_);
  policy_ = p;
}

Millis ReconnectCoordinator::next_delay_locked() {
  double jitter = 0.0;
  if (policy_.mode == ReconnectMode::EXPONENTIAL && policy_.jitter) {
    std::uniform_real_distribution<double> dist(0.0, kMaxJitterFraction);
    jitter = dist(rng_);
  }
  return compute_backoff_delay(policy_, backoff_.attempts, jitter);
}

void ReconnectCoordinator::run_attempt(uint64_t generation, const std::string& reason) {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (generation != generation_.load()) return;
    task_.reset();
  }
  if (gate_.is_stopped()) {
    spdlog::info("Run state STOPPED during reconnect wait, aborting");
    return;
  }

  spdlog::info("Reconnecting ({})", reason);
  const bool ok = rebuild_ ? rebuild_(generation) : false;
  if (!ok) {
    spdlog::warn("Reconnect attempt did not produce a session, leaving recovery to the watchdog");
  }
}
