#pragma once
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "types.hpp"

enum class Severity { WARNING, ERROR, CRITICAL };

const char* severity_name(Severity s);

namespace anomaly {
struct ZeroBitrate {
  Millis duration{0};
};
struct LowBitrate {
  int64_t current_bps{0};
  int64_t threshold_bps{0};
};
struct BitrateFluctuation {
  double variance{0.0};
};
struct ConnectionStuck {
  Millis duration{0};
};
struct StreamingTimeout {
  Millis duration{0};
};
struct EncoderError {
  std::string message;
};
struct CameraDisconnected {};
}  // namespace anomaly

using AnomalyKind =
    std::variant<anomaly::ZeroBitrate, anomaly::LowBitrate, anomaly::BitrateFluctuation,
                 anomaly::ConnectionStuck, anomaly::StreamingTimeout, anomaly::EncoderError,
                 anomaly::CameraDisconnected>;

// Health-check failure. Severity, name and description are all derived from
// the payload.
class Anomaly {
public:
  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Anomaly>>>
  Anomaly(T payload) : kind_(std::move(payload)) {}  // NOLINT(google-explicit-constructor)

  const AnomalyKind& kind() const { return kind_; }
  Severity severity() const;
  const char* name() const;
  std::string description() const;

  // Noisy kinds go through the debounce map; the rest are reported at once.
  bool debounced() const;

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(kind_);
  }
  template <typename T>
  const T& as() const {
    return std::get<T>(kind_);
  }

private:
  AnomalyKind kind_;
};
