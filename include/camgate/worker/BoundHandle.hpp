// Repository: Retrovue-camgate
// Component: BoundHandle
// Purpose: Lazily bound, never rebound holder for per-codec decoder state.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_WORKER_BOUND_HANDLE_HPP_
#define CAMGATE_WORKER_BOUND_HANDLE_HPP_

#include <memory>
#include <utility>

#include "camgate/buffer/FrameRecord.hpp"

namespace camgate::worker {

// BoundHandle<T> starts unbound. Bind() is a one-way transition that fixes
// the codec for the handle's lifetime; a second Bind() is refused. Reset()
// only runs on worker teardown.
//
// Not thread-safe: owned by the decode worker thread.
template <typename T>
class BoundHandle {
 public:
  BoundHandle() = default;

  BoundHandle(const BoundHandle&) = delete;
  BoundHandle& operator=(const BoundHandle&) = delete;

  bool IsBound() const { return handle_ != nullptr; }

  // Returns false (and leaves the handle untouched) if already bound or if
  // handle is null.
  bool Bind(buffer::CodecId codec, std::unique_ptr<T> handle) {
    if (handle_ || !handle) return false;
    codec_ = codec;
    handle_ = std::move(handle);
    return true;
  }

  // Valid only while IsBound().
  buffer::CodecId Codec() const { return codec_; }
  bool Matches(buffer::CodecId codec) const { return handle_ && codec_ == codec; }

  T* Get() const { return handle_.get(); }
  T* operator->() const { return handle_.get(); }

  void Reset() { handle_.reset(); }

 private:
  buffer::CodecId codec_ = buffer::CodecId::kH264;
  std::unique_ptr<T> handle_;
};

}  // namespace camgate::worker

#endif  // CAMGATE_WORKER_BOUND_HANDLE_HPP_
