#include "health_monitor.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <limits>

using namespace std::chrono;

namespace {
constexpr uint64_t kCounterMax = std::numeric_limits<uint64_t>::max();

void saturating_inc(uint64_t& c) {
  if (c < kCounterMax) ++c;
}

long long ms(Millis d) { return static_cast<long long>(d.count()); }
}  // namespace

HealthMonitor::HealthMonitor(const RunStateGate& gate, Executor& control,
                             AnomalyCallback on_anomaly)
    : gate_(gate), control_(control), on_anomaly_(std::move(on_anomaly)),
      stats_(std::make_shared<WatchdogStats>()) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start(const WatchdogConfig& cfg, const ClockSource& clock) {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (active_) {
      spdlog::debug("Watchdog already running, ignoring start request");
      return;
    }
    config_ = cfg;
    clock_ = &clock;
    active_ = true;
    ++epoch_;
    start_time_ = clock.now();
    reset_monitoring();
    if (session_) session_start_ = start_time_;

    schedule_next_tick();
    publish_stats();
  }
  spdlog::info("Watchdog started (interval {}ms, bitrate timeout {}ms, zero<{}bps, min<{}bps)",
               ms(cfg.check_interval), ms(cfg.bitrate_timeout), cfg.zero_bitrate_threshold_bps,
               cfg.min_bitrate_threshold_bps);
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!active_) return;
    active_ = false;
    ++epoch_;
    if (timer_) {
      control_.cancel(*timer_);
      timer_.reset();
    }
    session_.reset();
    session_start_.reset();
    reset_monitoring();
    publish_stats();
  }
  spdlog::info("Watchdog stopped");
}

bool HealthMonitor::is_active() const {
  std::lock_guard<std::mutex> g(mu_);
  return active_;
}

void HealthMonitor::on_bitrate_sample(int64_t bps) {
  std::lock_guard<std::mutex> g(mu_);
  if (!clock_) {
    spdlog::debug("Bitrate sample {}bps before watchdog start, ignored", bps);
    return;
  }
  const TimePoint now = clock_->now();
  current_bitrate_ = bps;
  last_sample_time_ = now;
  history_.add(bps);

  if (bps < config_.zero_bitrate_threshold_bps) {
    if (!zero_since_) zero_since_ = now;
  } else {
    zero_since_.reset();
  }

  if (bps >= config_.zero_bitrate_threshold_bps && bps < config_.min_bitrate_threshold_bps) {
    if (!low_since_) low_since_ = now;
  } else {
    low_since_.reset();
  }
}

void HealthMonitor::set_session_handle(std::shared_ptr<SessionHandle> handle) {
  std::lock_guard<std::mutex> g(mu_);
  session_ = std::move(handle);
  if (session_) {
    session_start_ = clock_ ? std::optional<TimePoint>(clock_->now()) : std::nullopt;
    reset_monitoring();
    spdlog::debug("Session handle set, detection state reset");
  } else {
    session_start_.reset();
    spdlog::debug("Session handle cleared");
  }
}

void HealthMonitor::update_config(const WatchdogConfig& cfg) {
  std::lock_guard<std::mutex> g(mu_);
  config_ = cfg;
  spdlog::debug("Watchdog config updated (interval {}ms)", ms(cfg.check_interval));
}

WatchdogConfig HealthMonitor::config() const {
  std::lock_guard<std::mutex> g(mu_);
  return config_;
}

WatchdogStats HealthMonitor::stats() const {
  std::lock_guard<std::mutex> g(stats_mu_);
  return *stats_;
}

void HealthMonitor::set_stats_listener(std::function<void(const WatchdogStats&)> fn) {
  std::lock_guard<std::mutex> g(stats_mu_);
  stats_listener_ = std::move(fn);
}

void HealthMonitor::seed_total_checks(uint64_t n) {
  std::lock_guard<std::mutex> g(mu_);
  total_checks_ = n;
}

// Requires mu_.
void HealthMonitor::schedule_next_tick() {
  const uint64_t epoch = epoch_.load();
  timer_ = control_.post_delayed(config_.check_interval, [this, epoch] { tick(epoch); });
}

void HealthMonitor::tick(uint64_t epoch) {
  std::shared_ptr<const WatchdogStats> snap;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!active_ || epoch != epoch_.load()) return;
    timer_.reset();
    perform_check(clock_->now());
    snap = publish_stats();
    schedule_next_tick();
  }

  std::function<void(const WatchdogStats&)> listener;
  {
    std::lock_guard<std::mutex> g(stats_mu_);
    listener = stats_listener_;
  }
  if (listener) listener(*snap);
}

template <typename Fn>
void HealthMonitor::guarded(const char* what, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    spdlog::error("{} health check failed: {}", what, e.what());
    report(anomaly::EncoderError{std::string("health check failed: ") + e.what()},
           clock_->now());
  }
}

void HealthMonitor::perform_check(TimePoint now) {
  if (total_checks_ == kCounterMax) {
    spdlog::warn("Watchdog total checks reached its maximum, resetting counters");
    reset_counters(now);
  } else {
    ++total_checks_;
  }
  last_check_time_ = now;

  if (gate_.is_stopped()) {
    saturating_inc(skipped_checks_);
    spdlog::trace("Run state STOPPED, skipping check #{}", total_checks_);
    return;
  }

  saturating_inc(effective_checks_);
  spdlog::debug("Health check #{} (total {})", effective_checks_, total_checks_);

  if (!session_) {
    spdlog::warn("No session while RUNNING");
    report(anomaly::CameraDisconnected{}, now);
    return;
  }
  const SessionHandle& session = *session_;

  if (config_.enable_bitrate_monitoring) guarded("bitrate", [&] { check_bitrate(now); });
  if (config_.enable_connection_monitoring)
    guarded("connection", [&] { check_connection(session, now); });
  if (config_.enable_encoder_monitoring) guarded("encoder", [&] { check_encoder(session, now); });
}

Millis HealthMonitor::since_session_start(TimePoint now) const {
  if (!session_start_) return Millis{0};
  return duration_cast<Millis>(now - *session_start_);
}

void HealthMonitor::check_bitrate(TimePoint now) {
  const Millis elapsed = since_session_start(now);
  if (elapsed <= config_.startup_grace) {
    spdlog::debug("Bitrate check: waiting for startup ({}ms <= {}ms)", ms(elapsed),
                  ms(config_.startup_grace));
    return;
  }

  if (!last_sample_time_) {
    if (elapsed > config_.first_bitrate_timeout) {
      spdlog::warn("No bitrate received {}ms after session start", ms(elapsed));
      report(anomaly::ZeroBitrate{elapsed}, now);
    }
    return;
  }

  const Millis age = duration_cast<Millis>(now - *last_sample_time_);
  if (age > config_.bitrate_timeout) {
    report(anomaly::ZeroBitrate{age}, now);
    return;
  }

  if (current_bitrate_ < config_.zero_bitrate_threshold_bps) {
    if (!zero_since_) zero_since_ = now;
    const Millis run = duration_cast<Millis>(now - *zero_since_);
    if (run > config_.zero_bitrate_duration) {
      report(anomaly::ZeroBitrate{run}, now);
      return;
    }
  } else if (current_bitrate_ < config_.min_bitrate_threshold_bps) {
    if (!low_since_) low_since_ = now;
    const Millis run = duration_cast<Millis>(now - *low_since_);
    if (run > config_.low_bitrate_duration) {
      report(anomaly::LowBitrate{current_bitrate_, config_.min_bitrate_threshold_bps}, now);
    }
  }

  if (!config_.enable_fluctuation_check) return;
  const auto d = history_.dispersion(kFluctuationMinSamples, kFluctuationMinNonzero);
  if (d && d->cv > config_.fluctuation_cv_threshold) {
    report(anomaly::BitrateFluctuation{d->variance}, now);
  }
}

void HealthMonitor::check_connection(const SessionHandle& session, TimePoint now) {
  const bool live = session.is_streaming();
  const Millis elapsed = since_session_start(now);

  if (!live) {
    // Negotiation may legitimately take a few seconds.
    if (elapsed <= config_.connection_grace) return;
    if (!stuck_since_) {
      stuck_since_ = now;
      spdlog::debug("Connection stuck detection started");
      return;
    }
    const Millis stuck = duration_cast<Millis>(now - *stuck_since_);
    if (stuck > config_.connection_stuck_duration) {
      spdlog::warn("Connection stuck for {}ms", ms(stuck));
      report(anomaly::ConnectionStuck{stuck}, now);
      return;
    }
  } else {
    stuck_since_.reset();
  }

  if (last_sample_time_) {
    const Millis silent = duration_cast<Millis>(now - *last_sample_time_);
    if (silent > config_.connection_timeout) {
      report(anomaly::StreamingTimeout{silent}, now);
    }
  }
}

void HealthMonitor::check_encoder(const SessionHandle& session, TimePoint now) {
  if (!session.is_capturing()) {
    report(anomaly::CameraDisconnected{}, now);
    return;
  }
  if (!session.is_streaming() && since_session_start(now) > config_.connection_grace) {
    report(anomaly::EncoderError{"encoder not running"}, now);
  }
}

void HealthMonitor::report(const Anomaly& a, TimePoint now) {
  if (gate_.is_stopped()) {
    spdlog::debug("Run state became STOPPED, dropping anomaly: {}", a.description());
    return;
  }

  // Debounced kinds are reported at most once per debounce_interval per kind
  if (a.debounced()) {
    const std::string key = a.name();
    auto it = debounce_.find(key);
    if (it != debounce_.end() && now - it->second < config_.debounce_interval) {
      spdlog::trace("Anomaly debounced: {}", a.description());
      return;
    }
    debounce_[key] = now;
  }

  saturating_inc(anomalies_detected_);
  last_anomaly_time_ = now;
  last_anomaly_type_ = a.name();
  spdlog::warn("Anomaly detected: {} ({})", a.description(), severity_name(a.severity()));

  const uint64_t epoch = epoch_.load();
  control_.post([this, a, epoch] {
    // stop() may have happened between detection and dispatch
    if (epoch != epoch_.load() || !gate_.is_running()) {
      spdlog::debug("Run state changed before dispatch, dropping anomaly: {}", a.description());
      return;
    }
    if (on_anomaly_) on_anomaly_(a);
  });
}

void HealthMonitor::reset_monitoring() {
  current_bitrate_ = 0;
  last_sample_time_.reset();
  zero_since_.reset();
  low_since_.reset();
  stuck_since_.reset();
  debounce_.clear();
  last_anomaly_time_.reset();
  last_anomaly_type_.clear();
  history_.clear();
}

void HealthMonitor::reset_counters(TimePoint now) {
  total_checks_ = 0;
  effective_checks_ = 0;
  skipped_checks_ = 0;
  anomalies_detected_ = 0;
  start_time_ = now;
  spdlog::info("Watchdog counters reset by overflow protection");
}

// Requires mu_.
std::shared_ptr<const WatchdogStats> HealthMonitor::publish_stats() {
  auto s = std::make_shared<WatchdogStats>();
  s->running = active_;
  s->start_time = start_time_;
  s->total_checks = total_checks_;
  s->effective_checks = effective_checks_;
  s->skipped_checks = skipped_checks_;
  s->anomalies_detected = anomalies_detected_;
  s->last_check_time = last_check_time_;
  s->current_bitrate = current_bitrate_;
  s->average_bitrate = history_.average_nonzero();
  s->bitrate_history = history_.values();
  s->last_anomaly_time = last_anomaly_time_;
  s->last_anomaly_type = last_anomaly_type_;

  std::lock_guard<std::mutex> g(stats_mu_);
  stats_ = s;
  return s;
}
