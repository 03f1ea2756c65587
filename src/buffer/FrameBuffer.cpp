// Repository: Retrovue-camgate
// Component: FrameBuffer
// Purpose: Keyframe-preserving dual-lane buffer implementation.
// Copyright (c) 2025 RetroVue

#include "camgate/buffer/FrameBuffer.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "camgate/util/Logger.hpp"

namespace camgate::buffer {

using camgate::util::Logger;

FrameBuffer::FrameBuffer(size_t capacity)
    : capacity_(capacity > 0 ? capacity : kDefaultCapacity) {}

FrameBuffer::~FrameBuffer() {
  Shutdown();
}

// =============================================================================
// PutVideo: keyframe-aware overflow
// =============================================================================

void FrameBuffer::PutVideo(FrameRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) return;

  if (video_.size() >= capacity_) {
    if (!record.is_keyframe) {
      stats_.video_dropped_non_key++;
      { std::ostringstream oss;
        oss << "[FrameBuffer] drop non-key frame codec=" << CodecIdName(record.codec_id)
            << " ts=" << record.timestamp << " channel=" << record.channel;
        Logger::Debug(oss.str()); }
      return;
    }

    auto victim = std::find_if(video_.begin(), video_.end(),
                               [](const FrameRecord& r) { return !r.is_keyframe; });
    if (victim != video_.end()) {
      video_.erase(victim);
      stats_.video_evicted_for_key++;
    } else {
      // Lane is all keyframes; fall back to drop-oldest.
      video_.pop_front();
      stats_.video_evicted_oldest++;
    }
    { std::ostringstream oss;
      oss << "[FrameBuffer] lane full, evicted for keyframe ts=" << record.timestamp
          << " channel=" << record.channel;
      Logger::Debug(oss.str()); }
  }

  video_.push_back(std::move(record));
  stats_.video_pushed++;
  cv_.notify_one();
}

// =============================================================================
// PutAudio: drop-oldest
// =============================================================================

void FrameBuffer::PutAudio(FrameRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) return;

  if (audio_.size() >= capacity_) {
    audio_.pop_front();
    stats_.audio_evicted_oldest++;
  }
  audio_.push_back(std::move(record));
  stats_.audio_pushed++;
  cv_.notify_one();
}

// =============================================================================
// Take: video first, then audio, else bounded wait
// =============================================================================

std::optional<FrameRecord> FrameBuffer::Take(int timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!shutdown_ && video_.empty() && audio_.empty() && timeout_ms > 0) {
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
      return shutdown_ || !video_.empty() || !audio_.empty();
    });
  }
  if (shutdown_) return std::nullopt;

  if (!video_.empty()) {
    FrameRecord out = std::move(video_.front());
    video_.pop_front();
    out.media_kind = MediaKind::kVideo;
    stats_.taken_video++;
    return out;
  }
  if (!audio_.empty()) {
    FrameRecord out = std::move(audio_.front());
    audio_.pop_front();
    out.media_kind = MediaKind::kAudio;
    stats_.taken_audio++;
    return out;
  }
  return std::nullopt;
}

// =============================================================================
// Shutdown
// =============================================================================

void FrameBuffer::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;
    video_.clear();
    audio_.clear();
  }
  cv_.notify_all();
}

bool FrameBuffer::IsShutdown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_;
}

size_t FrameBuffer::VideoDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return video_.size();
}

size_t FrameBuffer::AudioDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audio_.size();
}

FrameBufferStats FrameBuffer::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace camgate::buffer
