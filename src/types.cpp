#include "types.hpp"

#include <spdlog/fmt/fmt.h>

const char* facing_name(CameraFacing f) { return f == CameraFacing::FRONT ? "front" : "back"; }

const char* state_name(const SessionState& s) {
  return std::visit(overloaded{[](const session_state::Idle&) { return "Idle"; },
                               [](const session_state::Preparing&) { return "Preparing"; },
                               [](const session_state::Connecting&) { return "Connecting"; },
                               [](const session_state::Streaming&) { return "Streaming"; },
                               [](const session_state::Reconnecting&) { return "Reconnecting"; },
                               [](const session_state::Error&) { return "Error"; }},
                    s);
}

std::string describe(const SessionState& s) {
  if (const auto* st = std::get_if<session_state::Streaming>(&s)) {
    return fmt::format("Streaming({}bps)", st->bitrate_bps);
  }
  if (const auto* e = std::get_if<session_state::Error>(&s)) {
    return fmt::format("Error({})", e->message);
  }
  return state_name(s);
}
