#include "loopback_session.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

const char* fault_name(LoopbackFault f) {
  switch (f) {
    case LoopbackFault::NONE:
      return "none";
    case LoopbackFault::STALL:
      return "stall";
    case LoopbackFault::DROP:
      return "drop";
    case LoopbackFault::WEDGE:
      return "wedge";
    case LoopbackFault::AUTH:
      return "auth";
  }
  return "unknown";
}

bool parse_fault(const std::string& s, LoopbackFault& out) {
  if (s == "none" || s == "recover") {
    out = LoopbackFault::NONE;
  } else if (s == "stall") {
    out = LoopbackFault::STALL;
  } else if (s == "drop") {
    out = LoopbackFault::DROP;
  } else if (s == "wedge") {
    out = LoopbackFault::WEDGE;
  } else if (s == "auth") {
    out = LoopbackFault::AUTH;
  } else {
    return false;
  }
  return true;
}

LoopbackSession::LoopbackSession(std::shared_ptr<TransportListener> listener, LoopbackConfig cfg,
                                 std::shared_ptr<LoopbackFaults> faults)
    : listener_(std::move(listener)), cfg_(cfg), faults_(std::move(faults)),
      target_bps_(cfg.nominal_bitrate_bps) {
  if (!listener_) throw std::invalid_argument("LoopbackSession requires a listener");
  if (!faults_) throw std::invalid_argument("LoopbackSession requires a fault switch");
}

LoopbackSession::~LoopbackSession() { release(); }

bool LoopbackSession::prepare_video(int width, int height, int fps, int bitrate_bps,
                                    int keyframe_interval_s, int rotation_deg) {
  if (width <= 0 || height <= 0 || fps <= 0 || bitrate_bps <= 0) return false;
  spdlog::debug("[loopback] video {}x{}@{} {}bps gop={}s rot={}", width, height, fps, bitrate_bps,
                keyframe_interval_s, rotation_deg);
  target_bps_ = bitrate_bps;
  prepared_ = true;
  return true;
}

bool LoopbackSession::prepare_audio(int bitrate_bps, int sample_rate, bool stereo,
                                    bool echo_cancel, bool noise_suppress) {
  spdlog::debug("[loopback] audio {}bps {}Hz stereo={} aec={} ns={}", bitrate_bps, sample_rate,
                stereo, echo_cancel, noise_suppress);
  return bitrate_bps > 0 && sample_rate > 0;
}

void LoopbackSession::start_capture(CameraFacing facing) {
  if (!prepared_) throw std::runtime_error("capture started before prepare_video");
  facing_ = facing;
  capturing_ = true;
}

void LoopbackSession::start_transport(const std::string& url) {
  if (!capturing_) throw std::runtime_error("transport started without capture");
  stop_transport();
  {
    std::lock_guard<std::mutex> g(mu_);
    stop_requested_ = false;
  }
  worker_ = std::thread([this, url] { run(url); });
}

void LoopbackSession::stop_transport() {
  {
    std::lock_guard<std::mutex> g(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  streaming_ = false;
}

void LoopbackSession::stop_capture() {
  capturing_ = false;
  torch_ = false;
}

void LoopbackSession::release() {
  stop_transport();
  stop_capture();
  prepared_ = false;
}

void LoopbackSession::set_bitrate(int bps) {
  if (bps <= 0) throw std::invalid_argument("bitrate must be positive");
  target_bps_ = bps;
}

void LoopbackSession::switch_facing() {
  facing_ = facing_.load() == CameraFacing::FRONT ? CameraFacing::BACK : CameraFacing::FRONT;
  torch_ = false;
}

void LoopbackSession::set_audio_muted(bool muted) { muted_ = muted; }

bool LoopbackSession::torch_supported() const { return facing_.load() == CameraFacing::BACK; }

void LoopbackSession::set_torch(bool on) {
  if (on && !torch_supported()) throw std::runtime_error("torch not available on front camera");
  torch_ = on;
}

bool LoopbackSession::wait_for(Millis d) {
  std::unique_lock<std::mutex> lock(mu_);
  return !cv_.wait_for(lock, d, [this] { return stop_requested_; });
}

int64_t LoopbackSession::next_sample() {
  const double j = cfg_.sample_jitter;
  std::uniform_real_distribution<double> dist(1.0 - j, 1.0 + j);
  return static_cast<int64_t>(static_cast<double>(target_bps_.load()) * dist(rng_));
}

void LoopbackSession::run(std::string url) {
  listener_->on_connection_started(url);
  if (!wait_for(cfg_.connect_delay)) return;

  switch (faults_->get()) {
    case LoopbackFault::DROP:
      streaming_ = false;
      listener_->on_connection_failed("connection refused");
      return;
    case LoopbackFault::AUTH:
      streaming_ = false;
      listener_->on_auth_error();
      return;
    default:
      break;
  }
  listener_->on_auth_succeeded();
  streaming_ = true;
  listener_->on_connection_succeeded();

  while (wait_for(cfg_.sample_interval)) {
    switch (faults_->get()) {
      case LoopbackFault::STALL:
        continue;
      case LoopbackFault::WEDGE:
        streaming_ = false;
        continue;
      case LoopbackFault::DROP:
        streaming_ = false;
        listener_->on_connection_failed("connection reset by peer");
        return;
      default:
        break;
    }
    if (streaming_) listener_->on_bitrate_sample(next_sample());
  }
}
