// Repository: Retrovue-camgate
// Component: CrossContextDispatcher
// Purpose: Hands decoded payloads from the worker thread to the consumer
//          EventLoop without waiting for the callback to run.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_RUNTIME_CROSS_CONTEXT_DISPATCHER_HPP_
#define CAMGATE_RUNTIME_CROSS_CONTEXT_DISPATCHER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "camgate/buffer/FrameRecord.hpp"
#include "camgate/runtime/EventLoop.hpp"

namespace camgate::runtime {

// Consumer callback: (payload, timestamp_ms, channel). Runs on the EventLoop.
using PayloadCallback =
    std::function<void(const std::vector<uint8_t>&, int64_t, int)>;

// CrossContextDispatcher submits one callback invocation per payload to the
// target EventLoop. Submission order per media kind is preserved because
// the loop is FIFO and only the worker thread dispatches.
//
// If the loop is closed, the payload is dropped and nothing is retried.
// Submit() reports this as a DispatchError; Dispatch() logs and counts it and
// returns false.
class CrossContextDispatcher {
 public:
  explicit CrossContextDispatcher(std::shared_ptr<EventLoop> loop);

  // Throws DispatchError if the loop is closed.
  void Submit(buffer::MediaKind kind, const PayloadCallback& callback,
              std::vector<uint8_t> payload, int64_t timestamp_ms, int channel);

  bool Dispatch(buffer::MediaKind kind, const PayloadCallback& callback,
                std::vector<uint8_t> payload, int64_t timestamp_ms, int channel);

  bool TargetClosed() const { return loop_->IsClosed(); }

  uint64_t Submitted() const { return submitted_.load(std::memory_order_relaxed); }
  uint64_t Failed() const { return failed_.load(std::memory_order_relaxed); }

 private:
  std::shared_ptr<EventLoop> loop_;
  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> failed_{0};
};

}  // namespace camgate::runtime

#endif  // CAMGATE_RUNTIME_CROSS_CONTEXT_DISPATCHER_HPP_
