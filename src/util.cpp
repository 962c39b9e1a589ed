#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace {
void read_ms(const YAML::Node& n, const char* key, Millis& out) {
  if (n[key]) out = Millis{n[key].as<int64_t>()};
}

CameraFacing parse_facing(const std::string& s) {
  if (s == "front") return CameraFacing::FRONT;
  if (s == "back") return CameraFacing::BACK;
  throw std::invalid_argument("unknown camera facing: " + s);
}

ReconnectMode parse_mode(const std::string& s) {
  if (s == "fixed") return ReconnectMode::FIXED;
  if (s == "exponential") return ReconnectMode::EXPONENTIAL;
  throw std::invalid_argument("unknown reconnect mode: " + s);
}

int parse_bitrate_kbps(const YAML::Node& n, const char* section) {
  int kbps = n.as<int>();
  if (!valid_bitrate_kbps(kbps)) {
    throw std::invalid_argument(std::string(section) + ".bitrate_kbps must be in 1.." +
                                std::to_string(kMaxBitrateKbps) + ", got " + std::to_string(kbps));
  }
  return kbps;
}
}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["stream"]) {
    auto s = y["stream"];
    if (s["url"]) c.url = s["url"].as<std::string>();
    if (s["autostart"]) c.autostart = s["autostart"].as<bool>();
    if (s["camera_facing"]) c.stream.facing = parse_facing(s["camera_facing"].as<std::string>());

    if (auto v = s["video"]) {
      if (v["width"]) c.stream.video_width = v["width"].as<int>();
      if (v["height"]) c.stream.video_height = v["height"].as<int>();
      if (v["bitrate_kbps"]) c.stream.video_bitrate_kbps = parse_bitrate_kbps(v["bitrate_kbps"], "video");
      if (v["fps"]) c.stream.video_fps = v["fps"].as<int>();
      if (v["keyframe_interval_s"])
        c.stream.keyframe_interval_s = v["keyframe_interval_s"].as<int>();
      if (v["rotation_deg"]) c.stream.rotation_deg = v["rotation_deg"].as<int>();
    }
    if (auto a = s["audio"]) {
      if (a["bitrate_kbps"]) c.stream.audio_bitrate_kbps = parse_bitrate_kbps(a["bitrate_kbps"], "audio");
      if (a["sample_rate"]) c.stream.audio_sample_rate = a["sample_rate"].as<int>();
      if (a["stereo"]) c.stream.audio_stereo = a["stereo"].as<bool>();
      if (a["echo_canceler"]) c.stream.audio_echo_canceler = a["echo_canceler"].as<bool>();
      if (a["noise_suppressor"])
        c.stream.audio_noise_suppressor = a["noise_suppressor"].as<bool>();
    }
  }

  if (y["watchdog"]) {
    auto w = y["watchdog"];
    read_ms(w, "check_interval_ms", c.watchdog.check_interval);
    read_ms(w, "startup_grace_ms", c.watchdog.startup_grace);
    read_ms(w, "first_bitrate_timeout_ms", c.watchdog.first_bitrate_timeout);
    read_ms(w, "bitrate_timeout_ms", c.watchdog.bitrate_timeout);
    read_ms(w, "zero_bitrate_duration_ms", c.watchdog.zero_bitrate_duration);
    read_ms(w, "low_bitrate_duration_ms", c.watchdog.low_bitrate_duration);
    read_ms(w, "connection_grace_ms", c.watchdog.connection_grace);
    read_ms(w, "connection_stuck_ms", c.watchdog.connection_stuck_duration);
    read_ms(w, "connection_timeout_ms", c.watchdog.connection_timeout);
    read_ms(w, "debounce_ms", c.watchdog.debounce_interval);
    if (w["zero_bitrate_threshold_bps"])
      c.watchdog.zero_bitrate_threshold_bps = w["zero_bitrate_threshold_bps"].as<int64_t>();
    if (w["min_bitrate_threshold_bps"])
      c.watchdog.min_bitrate_threshold_bps = w["min_bitrate_threshold_bps"].as<int64_t>();
    if (w["fluctuation_cv_threshold"])
      c.watchdog.fluctuation_cv_threshold = w["fluctuation_cv_threshold"].as<double>();
    if (w["enable_bitrate_monitoring"])
      c.watchdog.enable_bitrate_monitoring = w["enable_bitrate_monitoring"].as<bool>();
    if (w["enable_connection_monitoring"])
      c.watchdog.enable_connection_monitoring = w["enable_connection_monitoring"].as<bool>();
    if (w["enable_encoder_monitoring"])
      c.watchdog.enable_encoder_monitoring = w["enable_encoder_monitoring"].as<bool>();
    if (w["enable_fluctuation_check"])
      c.watchdog.enable_fluctuation_check = w["enable_fluctuation_check"].as<bool>();
  }

  if (y["reconnect"]) {
    auto r = y["reconnect"];
    if (r["mode"]) c.reconnect.mode = parse_mode(r["mode"].as<std::string>());
    read_ms(r, "fixed_delay_ms", c.reconnect.fixed_delay);
    read_ms(r, "base_delay_ms", c.reconnect.base_delay);
    read_ms(r, "max_delay_ms", c.reconnect.max_delay);
    if (r["jitter"]) c.reconnect.jitter = r["jitter"].as<bool>();
    if (r["max_retry_window_hours"])
      c.reconnect.max_retry_window = std::chrono::hours(r["max_retry_window_hours"].as<int64_t>());
  }

  if (y["loopback"]) {
    auto l = y["loopback"];
    if (l["nominal_bitrate_bps"])
      c.loopback.nominal_bitrate_bps = l["nominal_bitrate_bps"].as<int64_t>();
    read_ms(l, "sample_interval_ms", c.loopback.sample_interval);
    read_ms(l, "connect_delay_ms", c.loopback.connect_delay);
    if (l["sample_jitter"]) c.loopback.sample_jitter = l["sample_jitter"].as<double>();
  }

  if (y["telemetry"] && y["telemetry"]["http_port"])
    c.http_port = y["telemetry"]["http_port"].as<int>();
  if (y["logging"] && y["logging"]["level"])
    c.log_level = y["logging"]["level"].as<std::string>();

  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "trace") {
    spdlog::set_level(spdlog::level::trace);
  } else if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
  }
}
