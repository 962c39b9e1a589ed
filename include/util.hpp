#pragma once
#include <string>

#include "health_monitor.hpp"
#include "loopback_session.hpp"
#include "reconnect_coordinator.hpp"
#include "types.hpp"

struct AppConfig {
  std::string url;
  bool autostart{false};
  StreamSettings stream;
  WatchdogConfig watchdog;
  ReconnectPolicy reconnect;
  LoopbackConfig loopback;
  int http_port{9090};
  std::string log_level{"info"};
};

AppConfig load_config(const std::string& path);

// Maps "debug" / "info" / "warn" / "error" onto spdlog; unknown names are
// ignored with a warning.
void apply_log_level(const std::string& level);
