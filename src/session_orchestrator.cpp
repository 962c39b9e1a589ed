#include "session_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

void release_session_handle(SessionHandle& session) {
  try {
    session.stop_transport();
  } catch (const std::exception& e) {
    spdlog::warn("stop_transport failed: {}", e.what());
  }
  try {
    session.stop_capture();
  } catch (const std::exception& e) {
    spdlog::warn("stop_capture failed: {}", e.what());
  }
  try {
    session.release();
  } catch (const std::exception& e) {
    spdlog::warn("release failed: {}", e.what());
  }
}

// Listener handed to one session. Tags every event with the id the session was
// opened under so the control loop can tell a retired session from the
// current one.
class SessionOrchestrator::SessionEvents : public TransportListener {
public:
  SessionEvents(SessionOrchestrator& owner, uint64_t id) : owner_(&owner), id_(id) {}

  void on_connection_started(const std::string& url) override {
    spdlog::debug("Connection started: {} (session {})", url, id_);
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id, url] { o->handle_connection_started(id, url); });
  }

  void on_connection_succeeded() override {
    spdlog::debug("Connection succeeded (session {})", id_);
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id] { o->handle_connection_succeeded(id); });
  }

  void on_connection_failed(const std::string& reason) override {
    spdlog::error("Connection failed: {} (session {})", reason, id_);
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id, reason] { o->handle_connection_failed(id, reason); });
  }

  void on_bitrate_sample(int64_t bps) override {
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id, bps] { o->handle_bitrate_sample(id, bps); });
  }

  void on_disconnected() override {
    spdlog::debug("Disconnected (session {})", id_);
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id] { o->handle_disconnected(id); });
  }

  void on_auth_error() override {
    spdlog::error("Authentication error (session {})", id_);
    auto* o = owner_;
    uint64_t id = id_;
    o->control_.post([o, id] { o->handle_auth_error(id); });
  }

  void on_auth_succeeded() override { spdlog::debug("Authentication succeeded (session {})", id_); }

private:
  SessionOrchestrator* owner_;
  uint64_t id_;
};

SessionOrchestrator::SessionOrchestrator(SessionFactory factory, Executor& control,
                                         Executor& engine, const ClockSource& clock,
                                         WatchdogConfig watchdog, ReconnectPolicy reconnect,
                                         StreamSettings settings)
    : factory_(std::move(factory)), control_(control), engine_(engine), clock_(clock),
      watchdog_config_(watchdog),
      monitor_(gate_, control, [this](const Anomaly& a) { handle_anomaly(a); }),
      coordinator_(gate_, engine, clock, reconnect), settings_(settings),
      facing_(settings.facing) {
  coordinator_.set_handlers([this] { release_session_locked(true); },
                            [this](uint64_t generation) { return rebuild_session(generation); },
                            [this](const std::string& reason) { exhaust_locked(reason); });
}

SessionOrchestrator::~SessionOrchestrator() { shutdown(); }

void SessionOrchestrator::start_monitoring() { monitor_.start(watchdog_config_, clock_); }

void SessionOrchestrator::shutdown() {
  stop();
  monitor_.stop();
}

bool SessionOrchestrator::start(const std::string& url) {
  StreamSettings settings;
  CameraFacing facing;
  uint64_t epoch;
  uint64_t id;
  {
    std::lock_guard<std::mutex> g(mu_);
    spdlog::info("Start requested: {}", url);
    if (gate_.is_running() && !holds<session_state::Error>(state_)) {
      spdlog::warn("Session already running, ignoring start request");
      return false;
    }
    if (url.empty()) {
      spdlog::error("Cannot start a session without a URL");
      return false;
    }

    coordinator_.cancel_reconnect();
    coordinator_.reset_backoff();
    release_session_locked(false);

    url_ = url;
    epoch = ++epoch_;
    id = ++next_session_id_;
    active_id_ = id;
    gate_.set(RunState::RUNNING);
    transition_locked(session_state::Preparing{}, "preparing");
    settings = settings_;
    facing = facing_;
  }

  auto session = open_session(id, url, settings, facing);

  std::lock_guard<std::mutex> g(mu_);
  // active_id_ moves on if the session already failed while it was prepared
  if (epoch != epoch_ || gate_.is_stopped() || active_id_ != id) {
    spdlog::info("Session stopped or failed while preparing, discarding new session");
    if (active_id_ == id) active_id_ = 0;
    if (session) release_session_handle(*session);
    return false;
  }
  if (!session) {
    active_id_ = 0;
    gate_.set(RunState::STOPPED);
    ++epoch_;
    transition_locked(session_state::Error{"stream start failed"}, "stream start failed");
    return false;
  }

  install_session_locked(std::move(session));
  if (holds<session_state::Preparing>(state_)) {
    transition_locked(session_state::Connecting{}, "connecting");
  }
  spdlog::info("Session initialised, connecting to {}", url);
  return true;
}

void SessionOrchestrator::stop() {
  std::lock_guard<std::mutex> g(mu_);
  coordinator_.cancel_reconnect();
  if (gate_.is_stopped() && holds<session_state::Idle>(state_) && !session_) {
    spdlog::debug("Already stopped, ignoring stop request");
    return;
  }
  gate_.set(RunState::STOPPED);
  ++epoch_;
  release_session_locked(false);
  coordinator_.reset_backoff();
  transition_locked(session_state::Idle{}, "stopped");
  spdlog::info("Session stopped");
}

void SessionOrchestrator::update_settings(const StreamSettings& settings) {
  std::lock_guard<std::mutex> g(mu_);
  if (!valid_bitrate_kbps(settings.video_bitrate_kbps) ||
      !valid_bitrate_kbps(settings.audio_bitrate_kbps)) {
    spdlog::error("Rejecting settings: bitrates must be in 1..{}kbps (video {}, audio {})",
                  kMaxBitrateKbps, settings.video_bitrate_kbps, settings.audio_bitrate_kbps);
    return;
  }
  settings_ = settings;
  if (!gate_.is_running() || !session_) return;
  try {
    session_->set_bitrate(settings.video_bitrate_kbps * 1000);
  } catch (const std::exception& e) {
    spdlog::warn("Failed to apply bitrate on the fly: {}", e.what());
  }
}

void SessionOrchestrator::update_watchdog_config(const WatchdogConfig& config) {
  {
    std::lock_guard<std::mutex> g(mu_);
    watchdog_config_ = config;
  }
  monitor_.update_config(config);
}

void SessionOrchestrator::switch_camera() {
  std::lock_guard<std::mutex> g(mu_);
  if (!session_) return;
  try {
    session_->switch_facing();
    facing_ = facing_ == CameraFacing::FRONT ? CameraFacing::BACK : CameraFacing::FRONT;
    flash_on_ = false;
    spdlog::info("Camera switched to {}", facing_name(facing_));
  } catch (const std::exception& e) {
    spdlog::error("Failed to switch camera: {}", e.what());
  }
}

void SessionOrchestrator::toggle_mute() {
  std::lock_guard<std::mutex> g(mu_);
  if (!session_) return;
  const bool next = !muted_;
  try {
    session_->set_audio_muted(next);
    muted_ = next;
    spdlog::info("Mute toggled: {}", muted_);
  } catch (const std::exception& e) {
    spdlog::error("Failed to toggle mute: {}", e.what());
  }
}

bool SessionOrchestrator::toggle_flash() {
  std::lock_guard<std::mutex> g(mu_);
  if (!session_ || facing_ != CameraFacing::BACK) return false;
  try {
    if (!session_->torch_supported()) return false;
    session_->set_torch(!flash_on_);
    flash_on_ = session_->torch_enabled();
    spdlog::info("Flash toggled: {}", flash_on_);
    return flash_on_;
  } catch (const std::exception& e) {
    spdlog::error("Failed to toggle flash: {}", e.what());
  }
  return false;
}

bool SessionOrchestrator::set_bitrate(int kbps) {
  std::lock_guard<std::mutex> g(mu_);
  if (!valid_bitrate_kbps(kbps)) {
    spdlog::warn("Bitrate {}kbps out of range 1..{}", kbps, kMaxBitrateKbps);
    return false;
  }
  if (!session_) return false;
  try {
    session_->set_bitrate(kbps * 1000);
    settings_.video_bitrate_kbps = kbps;
    spdlog::info("Bitrate set to {}kbps", kbps);
    return true;
  } catch (const std::exception& e) {
    spdlog::warn("Failed to set bitrate: {}", e.what());
  }
  return false;
}

SessionState SessionOrchestrator::state() const {
  std::lock_guard<std::mutex> g(mu_);
  return state_;
}

std::string SessionOrchestrator::status_text() const {
  std::lock_guard<std::mutex> g(mu_);
  return status_;
}

bool SessionOrchestrator::is_muted() const {
  std::lock_guard<std::mutex> g(mu_);
  return muted_;
}

bool SessionOrchestrator::is_flash_on() const {
  std::lock_guard<std::mutex> g(mu_);
  return flash_on_;
}

CameraFacing SessionOrchestrator::facing() const {
  std::lock_guard<std::mutex> g(mu_);
  return facing_;
}

std::string SessionOrchestrator::current_url() const {
  std::lock_guard<std::mutex> g(mu_);
  return url_;
}

StreamSettings SessionOrchestrator::settings() const {
  std::lock_guard<std::mutex> g(mu_);
  return settings_;
}

bool SessionOrchestrator::is_streaming() const {
  std::lock_guard<std::mutex> g(mu_);
  try {
    return session_ && session_->is_streaming();
  } catch (const std::exception& e) {
    spdlog::warn("is_streaming query failed: {}", e.what());
  }
  return false;
}

void SessionOrchestrator::set_state_listener(StateListener listener) {
  std::lock_guard<std::mutex> g(mu_);
  listener_ = std::move(listener);
}

// ==================== transport events ====================

void SessionOrchestrator::handle_connection_started(uint64_t id, const std::string& url) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "connection started") || gate_.is_stopped()) return;
  transition_locked(session_state::Connecting{}, "connecting to " + url);
}

void SessionOrchestrator::handle_connection_succeeded(uint64_t id) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "connection succeeded") || gate_.is_stopped()) return;

  transition_locked(session_state::Streaming{0}, "streaming");
  coordinator_.reset_backoff();
  // A session still being installed gets its controls restored on install
  restore_controls_locked();
}

void SessionOrchestrator::handle_connection_failed(uint64_t id, const std::string& reason) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "connection failed")) return;
  // Drop the half-open connection right away
  release_session_locked(true);
  if (gate_.is_stopped()) return;

  // Recovery is left to the watchdog, which sees the missing session next tick
  transition_locked(session_state::Error{"connection failed: " + reason},
                    "connection failed, waiting for retry");
}

void SessionOrchestrator::handle_bitrate_sample(uint64_t id, int64_t bps) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "bitrate sample") || gate_.is_stopped()) return;
  monitor_.on_bitrate_sample(bps);
  if (holds<session_state::Streaming>(state_)) {
    transition_locked(session_state::Streaming{bps}, "streaming");
  }
}

void SessionOrchestrator::handle_disconnected(uint64_t id) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "disconnected")) return;
  release_session_locked(true);
  if (gate_.is_stopped()) {
    spdlog::debug("Disconnect after stop, ignoring");
    return;
  }
  // Reconciliation only: connection_failed is the terminal event and may
  // already have reported this loss.
  if (holds<session_state::Error>(state_)) {
    spdlog::debug("Disconnect for a session already in error, ignoring");
    return;
  }
  set_status_locked("disconnected, waiting for reconnect");
}

void SessionOrchestrator::handle_auth_error(uint64_t id) {
  std::lock_guard<std::mutex> g(mu_);
  if (!accepts_locked(id, "auth error")) return;
  release_session_locked(true);
  if (gate_.is_stopped()) return;
  coordinator_.cancel_reconnect();
  gate_.set(RunState::STOPPED);
  ++epoch_;
  transition_locked(session_state::Error{"authentication failed"}, "authentication failed");
}

void SessionOrchestrator::handle_anomaly(const Anomaly& a) {
  std::lock_guard<std::mutex> g(mu_);
  spdlog::warn("Watchdog anomaly: {} ({})", a.description(), severity_name(a.severity()));
  if (gate_.is_stopped()) {
    spdlog::debug("Run state STOPPED, ignoring anomaly");
    return;
  }

  if (a.severity() == Severity::WARNING) {
    set_status_locked("stream degraded: " + a.description());
    return;
  }

  if (coordinator_.pending()) {
    spdlog::debug("Reconnect already pending, ignoring {}", a.name());
    return;
  }
  transition_locked(session_state::Reconnecting{}, "anomaly detected, reconnecting");
  coordinator_.schedule_reconnect(a.description());
}

// ==================== session construction ====================

std::shared_ptr<SessionHandle> SessionOrchestrator::open_session(uint64_t id,
                                                                 const std::string& url,
                                                                 const StreamSettings& s,
                                                                 CameraFacing facing) {
  if (!valid_bitrate_kbps(s.video_bitrate_kbps)) {
    spdlog::error("Video bitrate {}kbps out of range 1..{}", s.video_bitrate_kbps,
                  kMaxBitrateKbps);
    return nullptr;
  }
  std::shared_ptr<SessionHandle> session;
  try {
    session = factory_(std::make_shared<SessionEvents>(*this, id));
    if (!session) {
      spdlog::error("Session factory returned no session");
      return nullptr;
    }

    // Engine expects landscape dimensions
    int width = s.video_width;
    int height = s.video_height;
    if (width < height) std::swap(width, height);
    spdlog::debug("Video params: {}x{}@{} {}kbps rotation={}", width, height, s.video_fps,
                  s.video_bitrate_kbps, s.rotation_deg);

    if (!session->prepare_video(width, height, s.video_fps, s.video_bitrate_kbps * 1000,
                                s.keyframe_interval_s, s.rotation_deg)) {
      spdlog::error("Failed to prepare video encoder");
      release_session_handle(*session);
      return nullptr;
    }
    if (!valid_bitrate_kbps(s.audio_bitrate_kbps)) {
      spdlog::warn("Audio bitrate {}kbps out of range, continuing without audio",
                   s.audio_bitrate_kbps);
    } else if (!session->prepare_audio(s.audio_bitrate_kbps * 1000, s.audio_sample_rate,
                                       s.audio_stereo, s.audio_echo_canceler,
                                       s.audio_noise_suppressor)) {
      spdlog::warn("Failed to prepare audio encoder, continuing without audio");
    }

    session->start_capture(facing);
    session->start_transport(url);
    return session;
  } catch (const std::exception& e) {
    spdlog::error("Session initialisation failed: {}", e.what());
    if (session) release_session_handle(*session);
  }
  return nullptr;
}

bool SessionOrchestrator::rebuild_session(uint64_t generation) {
  std::string url;
  StreamSettings settings;
  CameraFacing facing;
  uint64_t epoch;
  uint64_t id;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (gate_.is_stopped() || !coordinator_.is_current(generation)) return false;
    if (url_.empty()) {
      spdlog::error("Reconnect URL is empty");
      return false;
    }
    url = url_;
    settings = settings_;
    facing = facing_;
    epoch = epoch_;
    release_session_locked(true);
    id = ++next_session_id_;
    active_id_ = id;
  }

  auto session = open_session(id, url, settings, facing);

  std::lock_guard<std::mutex> g(mu_);
  if (epoch != epoch_ || gate_.is_stopped() || !coordinator_.is_current(generation) ||
      active_id_ != id) {
    spdlog::info("Reconnect superseded, discarding rebuilt session");
    if (active_id_ == id) active_id_ = 0;
    if (session) release_session_handle(*session);
    return false;
  }
  if (!session) {
    active_id_ = 0;
    transition_locked(session_state::Error{"reconnect failed"}, "reconnect failed, waiting for retry");
    return false;
  }

  install_session_locked(std::move(session));
  set_status_locked("reconnected, waiting for connection");
  return true;
}

// ==================== helpers ====================

bool SessionOrchestrator::accepts_locked(uint64_t id, const char* event) const {
  if (id != 0 && id == active_id_) return true;
  spdlog::debug("Dropping {} from retired session {} (active {})", event, id, active_id_);
  return false;
}

void SessionOrchestrator::install_session_locked(std::shared_ptr<SessionHandle> session) {
  session_ = std::move(session);
  monitor_.set_session_handle(session_);
  // The connection may have gone live before the handle was installed
  if (holds<session_state::Streaming>(state_)) restore_controls_locked();
}

// Reapplies the user's mute and torch intent to the current session.
void SessionOrchestrator::restore_controls_locked() {
  if (!session_) return;
  if (muted_) {
    try {
      session_->set_audio_muted(true);
    } catch (const std::exception& e) {
      spdlog::warn("Failed to restore mute: {}", e.what());
    }
  }
  if (flash_on_ && facing_ == CameraFacing::BACK) {
    try {
      if (session_->torch_supported()) session_->set_torch(true);
    } catch (const std::exception& e) {
      spdlog::warn("Failed to restore flash: {}", e.what());
    }
  }
}

void SessionOrchestrator::release_session_locked(bool off_loop) {
  active_id_ = 0;
  monitor_.set_session_handle(nullptr);
  auto session = std::move(session_);
  session_.reset();
  if (!session) return;

  spdlog::debug("Releasing session resources");
  if (off_loop) {
    engine_.post([session] { release_session_handle(*session); });
  } else {
    release_session_handle(*session);
  }
}

void SessionOrchestrator::exhaust_locked(const std::string& reason) {
  gate_.set(RunState::STOPPED);
  ++epoch_;
  release_session_locked(true);
  transition_locked(session_state::Error{reason}, reason);
}

void SessionOrchestrator::transition_locked(SessionState next, std::string status) {
  if (state_.index() != next.index()) {
    spdlog::info("Session state {} -> {}", describe(state_), describe(next));
  }
  state_ = std::move(next);
  status_ = std::move(status);
  if (listener_) listener_(state_, status_);
}

void SessionOrchestrator::set_status_locked(std::string status) {
  spdlog::info("Status: {}", status);
  status_ = std::move(status);
  if (listener_) listener_(state_, status_);
}
