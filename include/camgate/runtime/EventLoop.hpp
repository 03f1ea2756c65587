// Repository: Retrovue-camgate
// Component: EventLoop
// Purpose: Single-thread cooperative run queue that hosts consumer callbacks.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_RUNTIME_EVENT_LOOP_HPP_
#define CAMGATE_RUNTIME_EVENT_LOOP_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace camgate::runtime {

// EventLoop runs posted tasks one at a time, in FIFO order, on the thread
// that called Run() (or on its own thread after RunInBackground()).
//
// Post() is thread-safe and never blocks on task execution. Once Stop() has
// been called the loop is closed: Post() returns false, pending tasks are
// discarded, and Run() returns after the task in progress (if any).
// Exceptions escaping a task are logged; the loop keeps running.
class EventLoop {
 public:
  using Task = std::function<void()>;

  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // Enqueues a task. Returns false if the loop is closed.
  bool Post(Task task);

  // Blocks the calling thread running tasks until Stop().
  void Run();

  // Starts Run() on an internal thread. No-op if already running.
  void RunInBackground();

  // Closes the loop. Idempotent. Joins the background thread unless called
  // from it.
  void Stop();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  bool IsLoopThread() const;

  size_t PendingTasks() const;
  uint64_t TasksRun() const { return tasks_run_.load(std::memory_order_relaxed); }
  uint64_t TaskFailures() const { return task_failures_.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::atomic<bool> closed_{false};
  std::thread::id loop_thread_id_;

  std::thread background_;
  std::mutex background_mutex_;

  std::atomic<uint64_t> tasks_run_{0};
  std::atomic<uint64_t> task_failures_{0};
};

}  // namespace camgate::runtime

#endif  // CAMGATE_RUNTIME_EVENT_LOOP_HPP_
