// Repository: Retrovue-camgate
// Component: EventLoop
// Purpose: Single-thread cooperative run queue that hosts consumer callbacks.
// Copyright (c) 2025 RetroVue

#include "camgate/runtime/EventLoop.hpp"

#include <exception>
#include <string>
#include <utility>

#include "camgate/util/Logger.hpp"

namespace camgate::runtime {

using camgate::util::Logger;

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
  Stop();
}

bool EventLoop::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load(std::memory_order_acquire)) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void EventLoop::Run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_thread_id_ = std::this_thread::get_id();
  }

  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] {
        return closed_.load(std::memory_order_acquire) || !tasks_.empty();
      });
      if (closed_.load(std::memory_order_acquire)) break;
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    try {
      task();
    } catch (const std::exception& e) {
      task_failures_.fetch_add(1, std::memory_order_relaxed);
      Logger::Error(std::string("[EventLoop] task raised: ") + e.what());
    }
    tasks_run_.fetch_add(1, std::memory_order_relaxed);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  loop_thread_id_ = std::thread::id();
}

void EventLoop::RunInBackground() {
  std::lock_guard<std::mutex> lock(background_mutex_);
  if (background_.joinable() || IsClosed()) return;
  background_ = std::thread(&EventLoop::Run, this);
}

void EventLoop::Stop() {
  size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_.exchange(true, std::memory_order_acq_rel)) {
      discarded = tasks_.size();
      tasks_.clear();
    }
  }
  cv_.notify_all();
  if (discarded > 0) {
    Logger::Debug("[EventLoop] closed, discarded " + std::to_string(discarded) +
                  " pending task(s)");
  }

  std::lock_guard<std::mutex> lock(background_mutex_);
  if (background_.joinable() && background_.get_id() != std::this_thread::get_id()) {
    background_.join();
  }
}

bool EventLoop::IsLoopThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loop_thread_id_ == std::this_thread::get_id();
}

size_t EventLoop::PendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace camgate::runtime
