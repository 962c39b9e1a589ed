#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "anomaly.hpp"
#include "event_loop.hpp"
#include "metrics.hpp"
#include "run_state.hpp"
#include "session_handle.hpp"
#include "types.hpp"

struct WatchdogConfig {
  Millis check_interval{5000};
  Millis startup_grace{10000};          // no bitrate checks right after a session is set
  Millis first_bitrate_timeout{15000};  // no sample at all since session start
  Millis bitrate_timeout{30000};        // age of the last sample
  int64_t zero_bitrate_threshold_bps{10000};
  int64_t min_bitrate_threshold_bps{100000};
  Millis zero_bitrate_duration{30000};
  Millis low_bitrate_duration{15000};
  Millis connection_grace{5000};
  Millis connection_stuck_duration{10000};
  Millis connection_timeout{60000};
  Millis debounce_interval{30000};
  double fluctuation_cv_threshold{0.5};

  bool enable_bitrate_monitoring{true};
  bool enable_connection_monitoring{true};
  bool enable_encoder_monitoring{true};
  bool enable_fluctuation_check{true};
};

// Watchdog. Ticks on the control executor for as long as it is started and
// evaluates session health only while the gate is RUNNING. Anomalies are
// delivered to the callback on the control executor.
class HealthMonitor {
public:
  using AnomalyCallback = std::function<void(const Anomaly&)>;

  static constexpr size_t kFluctuationMinSamples = 10;
  static constexpr size_t kFluctuationMinNonzero = 5;

  HealthMonitor(const RunStateGate& gate, Executor& control, AnomalyCallback on_anomaly);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void start(const WatchdogConfig& cfg, const ClockSource& clock);
  void stop();
  bool is_active() const;

  void on_bitrate_sample(int64_t bps);
  void set_session_handle(std::shared_ptr<SessionHandle> handle);
  void update_config(const WatchdogConfig& cfg);

  WatchdogConfig config() const;
  WatchdogStats stats() const;

  // Observer for the snapshot published after every tick.
  void set_stats_listener(std::function<void(const WatchdogStats&)> fn);

  // Overwrites the cumulative tick counter (overflow protection drills).
  void seed_total_checks(uint64_t n);

private:
  void schedule_next_tick();
  void tick(uint64_t epoch);
  void perform_check(TimePoint now);
  void check_bitrate(TimePoint now);
  void check_connection(const SessionHandle& session, TimePoint now);
  void check_encoder(const SessionHandle& session, TimePoint now);
  template <typename Fn>
  void guarded(const char* what, Fn&& fn);

  void report(const Anomaly& a, TimePoint now);

  void reset_monitoring();
  void reset_counters(TimePoint now);
  std::shared_ptr<const WatchdogStats> publish_stats();
  Millis since_session_start(TimePoint now) const;

  const RunStateGate& gate_;
  Executor& control_;
  AnomalyCallback on_anomaly_;

  mutable std::mutex mu_;
  WatchdogConfig config_;
  const ClockSource* clock_{nullptr};
  bool active_{false};
  std::atomic<uint64_t> epoch_{0};
  std::optional<TaskId> timer_;
  std::shared_ptr<SessionHandle> session_;

  // Cumulative counters, survive session restarts
  TimePoint start_time_{};
  uint64_t total_checks_{0};
  uint64_t effective_checks_{0};
  uint64_t skipped_checks_{0};
  uint64_t anomalies_detected_{0};
  TimePoint last_check_time_{};

  // Per-session detection state
  std::optional<TimePoint> session_start_;
  int64_t current_bitrate_{0};
  std::optional<TimePoint> last_sample_time_;
  std::optional<TimePoint> zero_since_;
  std::optional<TimePoint> low_since_;
  std::optional<TimePoint> stuck_since_;
  std::unordered_map<std::string, TimePoint> debounce_;
  std::optional<TimePoint> last_anomaly_time_;
  std::string last_anomaly_type_;
  BitrateHistory history_;

  mutable std::mutex stats_mu_;
  std::shared_ptr<const WatchdogStats> stats_;
  std::function<void(const WatchdogStats&)> stats_listener_;
};
