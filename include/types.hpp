#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Millis = std::chrono::milliseconds;

// Time source for everything that measures durations. Tests substitute a
// manually advanced clock.
class ClockSource {
public:
  virtual ~ClockSource() = default;
  virtual TimePoint now() const = 0;
};

class SteadyClockSource : public ClockSource {
public:
  TimePoint now() const override { return Clock::now(); }
};

enum class CameraFacing { FRONT, BACK };

const char* facing_name(CameraFacing f);

// Engine bitrates are int bps; anything above this many kbps cannot be
// converted without overflow.
constexpr int kMaxBitrateKbps = std::numeric_limits<int>::max() / 1000;

inline bool valid_bitrate_kbps(int kbps) { return kbps > 0 && kbps <= kMaxBitrateKbps; }

struct StreamSettings {
  // Video (landscape, width > height)
  int video_width{1920};
  int video_height{1080};
  int video_bitrate_kbps{4000};
  int video_fps{30};
  int keyframe_interval_s{2};
  int rotation_deg{0};

  // Audio
  int audio_bitrate_kbps{128};
  int audio_sample_rate{44100};
  bool audio_stereo{true};
  bool audio_echo_canceler{false};
  bool audio_noise_suppressor{false};

  CameraFacing facing{CameraFacing::BACK};
};

namespace session_state {
struct Idle {};
struct Preparing {};
struct Connecting {};
struct Streaming {
  int64_t bitrate_bps{0};
};
struct Reconnecting {};
struct Error {
  std::string message;
};
}  // namespace session_state

using SessionState =
    std::variant<session_state::Idle, session_state::Preparing, session_state::Connecting,
                 session_state::Streaming, session_state::Reconnecting, session_state::Error>;

const char* state_name(const SessionState& s);
std::string describe(const SessionState& s);

// Visitor helper for std::visit over the state and anomaly variants.
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename T>
bool holds(const SessionState& s) {
  return std::holds_alternative<T>(s);
}
