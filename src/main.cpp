#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "event_loop.hpp"
#include "loopback_session.hpp"
#include "metrics.hpp"
#include "session_orchestrator.hpp"
#include "util.hpp"

namespace {
int64_t to_epoch_ms(TimePoint t) {
  // Steady time has no calendar meaning; report milliseconds since boot.
  return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

nlohmann::json state_json(const SessionOrchestrator& orch) {
  auto b = orch.backoff_state();
  nlohmann::json j{{"state", state_name(orch.state())},
                   {"describe", describe(orch.state())},
                   {"status", orch.status_text()},
                   {"run_state", run_state_name(orch.gate().get())},
                   {"url", orch.current_url()},
                   {"streaming", orch.is_streaming()},
                   {"muted", orch.is_muted()},
                   {"flash_on", orch.is_flash_on()},
                   {"facing", facing_name(orch.facing())},
                   {"reconnect_pending", orch.reconnect_pending()},
                   {"reconnect_attempts", b.attempts},
                   {"last_backoff_ms", b.last_delay.count()}};
  return j;
}

nlohmann::json stats_json(const WatchdogStats& s) {
  nlohmann::json j{{"running", s.running},
                   {"total_checks", s.total_checks},
                   {"effective_checks", s.effective_checks},
                   {"skipped_checks", s.skipped_checks},
                   {"anomalies_detected", s.anomalies_detected},
                   {"last_check_ms", to_epoch_ms(s.last_check_time)},
                   {"current_bitrate", s.current_bitrate},
                   {"average_bitrate", s.average_bitrate},
                   {"bitrate_history", s.bitrate_history},
                   {"last_anomaly_type", s.last_anomaly_type}};
  if (s.last_anomaly_time) j["last_anomaly_ms"] = to_epoch_ms(*s.last_anomaly_time);
  return j;
}

void reply(httplib::Response& res, const nlohmann::json& j, int status = 200) {
  res.status = status;
  res.set_content(j.dump(2), "application/json");
}
}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"StreamKeeper: live stream health watchdog and reconnect supervisor"};

  std::string cfg_path = "configs/streamkeeper.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string url_override;
  cli_app.add_option("-u,--url", url_override, "Ingest URL (overrides stream.url)");

  bool autostart = false;
  cli_app.add_flag("--autostart", autostart, "Start streaming immediately");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "StreamKeeper v1.0.0" << std::endl;
    std::cout << "Watchdog, backoff reconnect and loopback engine" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("StreamKeeper starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config {}: {}", cfg_path, e.what());
    return 1;
  }
  apply_log_level(app.log_level);
  if (!url_override.empty()) app.url = url_override;
  if (autostart) app.autostart = true;

  SteadyClockSource clock;
  EventLoop control("control");
  EventLoop engine("engine");
  control.start();
  engine.start();

  auto faults = std::make_shared<LoopbackFaults>();
  LoopbackConfig loopback = app.loopback;
  SessionFactory factory = [faults, loopback](std::shared_ptr<TransportListener> listener) {
    return std::make_shared<LoopbackSession>(std::move(listener), loopback, faults);
  };

  SessionOrchestrator orch(factory, control, engine, clock, app.watchdog, app.reconnect,
                           app.stream);
  orch.set_state_listener([](const SessionState& s, const std::string& status) {
    spdlog::info("Session state: {} ({})", describe(s), status);
  });
  orch.start_monitoring();

  if (app.autostart) {
    if (app.url.empty()) {
      spdlog::warn("Autostart requested but no URL configured");
    } else if (!orch.start(app.url)) {
      spdlog::error("Autostart failed: {}", orch.status_text());
    }
  }

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/session/state", [&](const httplib::Request&, httplib::Response& res) {
    reply(res, state_json(orch));
  });

  svr.Post("/session/start", [&](const httplib::Request& req, httplib::Response& res) {
    std::string url = req.has_param("url") ? req.get_param_value("url") : app.url;
    bool ok = orch.start(url);
    auto j = state_json(orch);
    j["started"] = ok;
    reply(res, j, ok ? 200 : 409);
  });

  svr.Post("/session/stop", [&](const httplib::Request&, httplib::Response& res) {
    orch.stop();
    auto j = state_json(orch);
    j["stopped"] = true;
    reply(res, j);
  });

  svr.Post("/session/mute", [&](const httplib::Request&, httplib::Response& res) {
    orch.toggle_mute();
    reply(res, nlohmann::json{{"muted", orch.is_muted()}});
  });

  svr.Post("/session/flash", [&](const httplib::Request&, httplib::Response& res) {
    bool ok = orch.toggle_flash();
    reply(res, nlohmann::json{{"flash_on", orch.is_flash_on()}, {"applied", ok}}, ok ? 200 : 409);
  });

  svr.Post("/session/switch-camera", [&](const httplib::Request&, httplib::Response& res) {
    orch.switch_camera();
    reply(res, nlohmann::json{{"facing", facing_name(orch.facing())}});
  });

  svr.Post("/session/bitrate", [&](const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("kbps")) {
      reply(res, nlohmann::json{{"error", "missing kbps"}}, 400);
      return;
    }
    int kbps = 0;
    try {
      kbps = std::stoi(req.get_param_value("kbps"));
    } catch (const std::exception&) {
      reply(res, nlohmann::json{{"error", "invalid kbps"}}, 400);
      return;
    }
    if (!valid_bitrate_kbps(kbps)) {
      reply(res, nlohmann::json{{"error", fmt::format("kbps must be in 1..{}", kMaxBitrateKbps)}},
            400);
      return;
    }
    bool ok = orch.set_bitrate(kbps);
    reply(res, nlohmann::json{{"video_bitrate_kbps", kbps}, {"applied", ok}}, ok ? 200 : 409);
  });

  svr.Get("/watchdog/stats", [&](const httplib::Request&, httplib::Response& res) {
    reply(res, stats_json(orch.watchdog_stats()));
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(prometheus_text(orch.watchdog_stats()), "text/plain; version=0.0.4");
  });

  svr.Post("/loopback/fault", [&](const httplib::Request& req, httplib::Response& res) {
    LoopbackFault f{};
    if (!req.has_param("mode") || !parse_fault(req.get_param_value("mode"), f)) {
      reply(res, nlohmann::json{{"error", "mode must be stall|drop|wedge|auth|recover"}}, 400);
      return;
    }
    faults->set(f);
    spdlog::warn("Loopback fault set to {}", fault_name(f));
    reply(res, nlohmann::json{{"fault", fault_name(f)}});
  });

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.http_port);
  if (!svr.listen("0.0.0.0", app.http_port)) {
    spdlog::error("Failed to bind HTTP server on port {}", app.http_port);
  }

  // Cleanup
  orch.shutdown();
  control.stop();
  engine.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}
