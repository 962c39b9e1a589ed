#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include "session_handle.hpp"
#include "types.hpp"

// In-process stand-in for the media engine. Reports connection events and
// throughput samples like a live transport would, and can be told to fail in
// the ways the watchdog is meant to catch.
struct LoopbackConfig {
  int64_t nominal_bitrate_bps{2500000};
  Millis sample_interval{1000};
  Millis connect_delay{500};
  double sample_jitter{0.1};  // +/- fraction of nominal
};

enum class LoopbackFault {
  NONE,
  STALL,  // connection stays up, samples stop
  DROP,   // connection fails
  WEDGE,  // transport stops streaming, capture stays active
  AUTH,   // server rejects credentials
};

const char* fault_name(LoopbackFault f);
bool parse_fault(const std::string& s, LoopbackFault& out);

// Shared by every session the factory builds, so a fault survives reconnects.
class LoopbackFaults {
public:
  void set(LoopbackFault f) { fault_.store(f); }
  LoopbackFault get() const { return fault_.load(); }

private:
  std::atomic<LoopbackFault> fault_{LoopbackFault::NONE};
};

class LoopbackSession : public SessionHandle {
public:
  LoopbackSession(std::shared_ptr<TransportListener> listener, LoopbackConfig cfg,
                  std::shared_ptr<LoopbackFaults> faults);
  ~LoopbackSession() override;

  bool prepare_video(int width, int height, int fps, int bitrate_bps, int keyframe_interval_s,
                     int rotation_deg) override;
  bool prepare_audio(int bitrate_bps, int sample_rate, bool stereo, bool echo_cancel,
                     bool noise_suppress) override;

  void start_capture(CameraFacing facing) override;
  void start_transport(const std::string& url) override;
  void stop_transport() override;
  void stop_capture() override;
  void release() override;

  bool is_streaming() const override { return streaming_.load(); }
  bool is_capturing() const override { return capturing_.load(); }

  void set_bitrate(int bps) override;
  void switch_facing() override;
  void set_audio_muted(bool muted) override;

  bool torch_supported() const override;
  void set_torch(bool on) override;
  bool torch_enabled() const override { return torch_.load(); }

private:
  void run(std::string url);
  bool wait_for(Millis d);  // false when asked to stop
  int64_t next_sample();

  std::shared_ptr<TransportListener> listener_;
  LoopbackConfig cfg_;
  std::shared_ptr<LoopbackFaults> faults_;

  std::atomic<bool> prepared_{false};
  std::atomic<bool> capturing_{false};
  std::atomic<bool> streaming_{false};
  std::atomic<bool> torch_{false};
  std::atomic<bool> muted_{false};
  std::atomic<CameraFacing> facing_{CameraFacing::BACK};
  std::atomic<int64_t> target_bps_{0};

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::thread worker_;
  std::mt19937 rng_{std::random_device{}()};
};
