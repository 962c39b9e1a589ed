#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "types.hpp"

using Task = std::function<void()>;
using TaskId = uint64_t;

// Serial execution context. Tasks posted to one executor never run
// concurrently with each other.
class Executor {
public:
  virtual ~Executor() = default;
  virtual void post(Task t) = 0;
  virtual TaskId post_delayed(Millis delay, Task t) = 0;
  // Returns false when the task already ran or was never scheduled.
  virtual bool cancel(TaskId id) = 0;
};

// Single worker thread draining an immediate queue and a timer queue.
class EventLoop : public Executor {
public:
  explicit EventLoop(std::string name);
  ~EventLoop() override;

  void start();
  void stop();  // Drops tasks that have not run yet and joins the worker
  bool running() const { return running_.load(); }

  void post(Task t) override;
  TaskId post_delayed(Millis delay, Task t) override;
  bool cancel(TaskId id) override;

  size_t pending() const;

private:
  using Key = std::pair<TimePoint, TaskId>;

  void run();

  std::string name_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<Key, Task> queue_;
  std::unordered_map<TaskId, Key> index_;
  TaskId next_id_{1};

  std::atomic<bool> running_{false};
  std::thread worker_;
};
