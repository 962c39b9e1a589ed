#include "event_loop.hpp"

#include <spdlog/spdlog.h>

#include <exception>

EventLoop::EventLoop(std::string name) : name_(std::move(name)) {}

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread([this] { run(); });
  spdlog::debug("Event loop '{}' started", name_);
}

void EventLoop::stop() {
  if (!running_.exchange(false)) return;
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();

  std::lock_guard<std::mutex> g(mu_);
  if (!queue_.empty()) {
    spdlog::debug("Event loop '{}' dropped {} pending task(s)", name_, queue_.size());
  }
  queue_.clear();
  index_.clear();
  spdlog::debug("Event loop '{}' stopped", name_);
}

void EventLoop::post(Task t) { post_delayed(Millis{0}, std::move(t)); }

TaskId EventLoop::post_delayed(Millis delay, Task t) {
  TaskId id;
  {
    std::lock_guard<std::mutex> g(mu_);
    id = next_id_++;
    Key key{Clock::now() + delay, id};
    queue_.emplace(key, std::move(t));
    index_.emplace(id, key);
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::cancel(TaskId id) {
  std::lock_guard<std::mutex> g(mu_);
  auto it = index_.find(id);
  if (it == index_.end()) return false;
  queue_.erase(it->second);
  index_.erase(it);
  return true;
}

size_t EventLoop::pending() const {
  std::lock_guard<std::mutex> g(mu_);
  return queue_.size();
}

void EventLoop::run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (running_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
      continue;
    }
    auto head = queue_.begin();
    const TimePoint due = head->first.first;
    if (Clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }
    Task task = std::move(head->second);
    index_.erase(head->first.second);
    queue_.erase(head);

    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("Event loop '{}': task threw: {}", name_, e.what());
    }
    lock.lock();
  }
}
