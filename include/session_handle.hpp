#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "types.hpp"

// Callback surface of the transport engine. Implementations must not assume
// which thread delivers the events.
class TransportListener {
public:
  virtual ~TransportListener() = default;
  virtual void on_connection_started(const std::string& url) = 0;
  virtual void on_connection_succeeded() = 0;
  virtual void on_connection_failed(const std::string& reason) = 0;
  virtual void on_bitrate_sample(int64_t bps) = 0;
  virtual void on_disconnected() = 0;
  virtual void on_auth_error() = 0;
  virtual void on_auth_succeeded() = 0;
};

// Capability over the external capture/encode/transport engine. Any call may
// throw std::exception on engine failure.
class SessionHandle {
public:
  virtual ~SessionHandle() = default;

  virtual bool prepare_video(int width, int height, int fps, int bitrate_bps,
                             int keyframe_interval_s, int rotation_deg) = 0;
  virtual bool prepare_audio(int bitrate_bps, int sample_rate, bool stereo, bool echo_cancel,
                             bool noise_suppress) = 0;

  virtual void start_capture(CameraFacing facing) = 0;
  virtual void start_transport(const std::string& url) = 0;
  virtual void stop_transport() = 0;
  virtual void stop_capture() = 0;
  virtual void release() = 0;

  virtual bool is_streaming() const = 0;
  virtual bool is_capturing() const = 0;

  virtual void set_bitrate(int bps) = 0;
  virtual void switch_facing() = 0;
  virtual void set_audio_muted(bool muted) = 0;

  // Torch is only meaningful on the back camera.
  virtual bool torch_supported() const = 0;
  virtual void set_torch(bool on) = 0;
  virtual bool torch_enabled() const = 0;
};

// Builds a fresh session reporting to the given listener. The session keeps
// the listener alive for as long as it may deliver events.
using SessionFactory =
    std::function<std::shared_ptr<SessionHandle>(std::shared_ptr<TransportListener>)>;
