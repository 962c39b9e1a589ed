#pragma once
#include <atomic>

enum class RunState { STOPPED, RUNNING };

const char* run_state_name(RunState s);

// Coarse "should anyone be monitoring or reconnecting right now" flag.
// Independent of session health.
class RunStateGate {
public:
  void set(RunState s);
  RunState get() const { return state_.load(std::memory_order_acquire); }
  bool is_running() const { return get() == RunState::RUNNING; }
  bool is_stopped() const { return get() == RunState::STOPPED; }

private:
  std::atomic<RunState> state_{RunState::STOPPED};
};
