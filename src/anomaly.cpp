#include "anomaly.hpp"

#include <spdlog/fmt/fmt.h>

namespace {
long long whole_seconds(Millis d) {
  return static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(d).count());
}
}  // namespace

const char* severity_name(Severity s) {
  switch (s) {
    case Severity::WARNING:
      return "WARNING";
    case Severity::ERROR:
      return "ERROR";
    case Severity::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

Severity Anomaly::severity() const {
  return std::visit(overloaded{[](const anomaly::ZeroBitrate&) { return Severity::ERROR; },
                               [](const anomaly::LowBitrate&) { return Severity::WARNING; },
                               [](const anomaly::BitrateFluctuation&) { return Severity::WARNING; },
                               [](const anomaly::ConnectionStuck&) { return Severity::CRITICAL; },
                               [](const anomaly::StreamingTimeout&) { return Severity::ERROR; },
                               [](const anomaly::EncoderError&) { return Severity::ERROR; },
                               [](const anomaly::CameraDisconnected&) { return Severity::CRITICAL; }},
                    kind_);
}

const char* Anomaly::name() const {
  return std::visit(overloaded{[](const anomaly::ZeroBitrate&) { return "ZeroBitrate"; },
                               [](const anomaly::LowBitrate&) { return "LowBitrate"; },
                               [](const anomaly::BitrateFluctuation&) { return "BitrateFluctuation"; },
                               [](const anomaly::ConnectionStuck&) { return "ConnectionStuck"; },
                               [](const anomaly::StreamingTimeout&) { return "StreamingTimeout"; },
                               [](const anomaly::EncoderError&) { return "EncoderError"; },
                               [](const anomaly::CameraDisconnected&) { return "CameraDisconnected"; }},
                    kind_);
}

std::string Anomaly::description() const {
  return std::visit(
      overloaded{
          [](const anomaly::ZeroBitrate& a) {
            return fmt::format("zero bitrate for {}s", whole_seconds(a.duration));
          },
          [](const anomaly::LowBitrate& a) {
            return fmt::format("low bitrate: {}bps < {}bps", a.current_bps, a.threshold_bps);
          },
          [](const anomaly::BitrateFluctuation& a) {
            return fmt::format("bitrate fluctuation: variance={:.2f}", a.variance);
          },
          [](const anomaly::ConnectionStuck& a) {
            return fmt::format("connection stuck for {}s", whole_seconds(a.duration));
          },
          [](const anomaly::StreamingTimeout& a) {
            return fmt::format("streaming timeout after {}s", whole_seconds(a.duration));
          },
          [](const anomaly::EncoderError& a) { return fmt::format("encoder error: {}", a.message); },
          [](const anomaly::CameraDisconnected&) { return std::string("camera disconnected"); }},
      kind_);
}

bool Anomaly::debounced() const {
  return is<anomaly::LowBitrate>() || is<anomaly::BitrateFluctuation>();
}
