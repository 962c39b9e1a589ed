#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "anomaly.hpp"
#include "event_loop.hpp"
#include "health_monitor.hpp"
#include "metrics.hpp"
#include "reconnect_coordinator.hpp"
#include "run_state.hpp"
#include "session_handle.hpp"
#include "types.hpp"

// Public entry point of the supervision subsystem. Owns the run-state gate,
// the watchdog and the reconnect coordinator, and turns transport callbacks
// into session state transitions.
//
// Each session reports through its own listener tagged with a session id.
// Events may arrive on any thread; they are re-posted to the control executor
// and dropped there unless they belong to the session currently accepted.
// Delayed reconnect attempts and off-loop resource release run on the engine
// executor. Both executors must outlive the orchestrator
// or be stopped before it is destroyed.
class SessionOrchestrator {
public:
  // Invoked with the orchestrator lock held; must not call back into it.
  using StateListener = std::function<void(const SessionState&, const std::string& status)>;

  SessionOrchestrator(SessionFactory factory, Executor& control, Executor& engine,
                      const ClockSource& clock, WatchdogConfig watchdog, ReconnectPolicy reconnect,
                      StreamSettings settings = {});
  ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  // The watchdog runs from here until shutdown(), whether or not a session
  // is active.
  void start_monitoring();
  void shutdown();

  bool start(const std::string& url);
  void stop();
  void update_settings(const StreamSettings& settings);
  void update_watchdog_config(const WatchdogConfig& config);

  void switch_camera();
  void toggle_mute();
  bool toggle_flash();
  // False when no session is active or kbps is outside (0, kMaxBitrateKbps].
  bool set_bitrate(int kbps);

  SessionState state() const;
  std::string status_text() const;
  bool is_muted() const;
  bool is_flash_on() const;
  CameraFacing facing() const;
  std::string current_url() const;
  StreamSettings settings() const;
  bool is_streaming() const;
  bool reconnect_pending() const { return coordinator_.pending(); }
  BackoffState backoff_state() const { return coordinator_.backoff_state(); }
  WatchdogStats watchdog_stats() const { return monitor_.stats(); }
  const RunStateGate& gate() const { return gate_; }

  void set_state_listener(StateListener listener);

private:
  class SessionEvents;

  void handle_connection_started(uint64_t id, const std::string& url);
  void handle_connection_succeeded(uint64_t id);
  void handle_connection_failed(uint64_t id, const std::string& reason);
  void handle_bitrate_sample(uint64_t id, int64_t bps);
  void handle_disconnected(uint64_t id);
  void handle_auth_error(uint64_t id);
  void handle_anomaly(const Anomaly& a);

  std::shared_ptr<SessionHandle> open_session(uint64_t id, const std::string& url,
                                              const StreamSettings& settings,
                                              CameraFacing facing);
  bool rebuild_session(uint64_t generation);

  // The *_locked helpers require mu_.
  bool accepts_locked(uint64_t id, const char* event) const;
  void install_session_locked(std::shared_ptr<SessionHandle> session);
  void restore_controls_locked();
  void release_session_locked(bool off_loop);
  void exhaust_locked(const std::string& reason);
  void transition_locked(SessionState next, std::string status);
  void set_status_locked(std::string status);

  SessionFactory factory_;
  Executor& control_;
  Executor& engine_;
  const ClockSource& clock_;
  WatchdogConfig watchdog_config_;

  RunStateGate gate_;
  HealthMonitor monitor_;
  ReconnectCoordinator coordinator_;

  mutable std::mutex mu_;
  StreamSettings settings_;
  std::string url_;
  std::shared_ptr<SessionHandle> session_;
  uint64_t next_session_id_{0};
  uint64_t active_id_{0};  // session whose transport events are honoured; 0 = none
  SessionState state_{session_state::Idle{}};
  std::string status_{"idle"};
  uint64_t epoch_{0};  // bumped by every start/stop/fatal error
  bool muted_{false};
  bool flash_on_{false};
  CameraFacing facing_{CameraFacing::BACK};
  StateListener listener_;
};

// Best-effort teardown: every step runs even if an earlier one throws.
void release_session_handle(SessionHandle& session);
