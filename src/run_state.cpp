#include "run_state.hpp"

#include <spdlog/spdlog.h>

const char* run_state_name(RunState s) { return s == RunState::RUNNING ? "RUNNING" : "STOPPED"; }

void RunStateGate::set(RunState s) {
  state_.store(s, std::memory_order_release);
  spdlog::debug("Run state -> {}", run_state_name(s));
}
