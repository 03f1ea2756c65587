// Repository: Retrovue-camgate
// Component: FrameBuffer
// Purpose: Bounded dual-lane (video/audio) ring buffer between the network
//          producer and the single decode worker. Never blocks producers;
//          under pressure the video lane keeps keyframes over freshness.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_BUFFER_FRAME_BUFFER_HPP_
#define CAMGATE_BUFFER_FRAME_BUFFER_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "camgate/buffer/FrameRecord.hpp"

namespace camgate::buffer {

// Counters (under mutex_). Cumulative since construction.
struct FrameBufferStats {
  uint64_t video_pushed = 0;
  uint64_t video_dropped_non_key = 0;   // Full lane, incoming non-keyframe discarded
  uint64_t video_evicted_for_key = 0;   // Queued non-keyframe removed for a keyframe
  uint64_t video_evicted_oldest = 0;    // Lane held only keyframes; oldest removed
  uint64_t audio_pushed = 0;
  uint64_t audio_evicted_oldest = 0;
  uint64_t taken_video = 0;
  uint64_t taken_audio = 0;
};

// FrameBuffer holds two independent lanes of at most `capacity` records.
//
// Video lane overflow policy:
//   - incoming keyframe: evict the first queued non-keyframe (or the oldest
//     entry if the lane is all keyframes), then append
//   - incoming non-keyframe: discard the incoming record
// Audio lane overflow policy: drop-oldest.
//
// Take() is single-consumer: video is always served before audio. A single
// condition variable covers both lanes so the consumer wakes on any push.
//
// Thread safety: PutVideo/PutAudio may be called from any thread
// concurrently with Take(). Shutdown() is idempotent; after it, puts are
// no-ops and Take() returns std::nullopt immediately.
class FrameBuffer {
 public:
  static constexpr size_t kDefaultCapacity = 20;

  explicit FrameBuffer(size_t capacity = kDefaultCapacity);
  ~FrameBuffer();

  FrameBuffer(const FrameBuffer&) = delete;
  FrameBuffer& operator=(const FrameBuffer&) = delete;

  // --- Producer ---

  void PutVideo(FrameRecord record);
  void PutAudio(FrameRecord record);

  // --- Consumer ---

  // Pops the front video record, else the front audio record. When both
  // lanes are empty, waits up to timeout_ms for a push. Returns std::nullopt
  // on timeout or shutdown ("no data", not an error).
  std::optional<FrameRecord> Take(int timeout_ms);

  // --- Lifecycle ---

  // Wakes a blocked Take(), clears both lanes, rejects further puts.
  void Shutdown();
  bool IsShutdown() const;

  // --- Observability ---

  size_t Capacity() const { return capacity_; }
  size_t VideoDepth() const;
  size_t AudioDepth() const;
  FrameBufferStats Stats() const;

 private:
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;  // Signalled on any push and on shutdown
  std::deque<FrameRecord> video_;
  std::deque<FrameRecord> audio_;
  bool shutdown_ = false;
  FrameBufferStats stats_;
};

}  // namespace camgate::buffer

#endif  // CAMGATE_BUFFER_FRAME_BUFFER_HPP_
