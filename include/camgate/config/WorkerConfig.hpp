// Repository: Retrovue-camgate
// Component: Worker Configuration
// Purpose: DecodeWorker settings and the video quality presets.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_CONFIG_WORKER_CONFIG_HPP_
#define CAMGATE_CONFIG_WORKER_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include "camgate/decode/FFmpegCodecs.hpp"

namespace camgate::config {

// DecodeWorkerConfig holds configuration for one decode worker.
struct DecodeWorkerConfig {
  int64_t frame_interval_ms;  // Minimum spacing between video snapshots (<= 0: every tick)
  bool enable_audio;          // Decode and forward audio
  bool enable_hw_accel;       // Try VAAPI video decode when the host supports it
  size_t buffer_capacity;     // Per-lane FrameBuffer capacity
  int take_timeout_ms;        // Idle poll interval of the worker loop
  int jpeg_quality;           // 1 (worst) .. 100 (best)
  int max_decode_threads;     // Maximum decoder threads (0 = auto)

  DecodeWorkerConfig()
      : frame_interval_ms(1000),
        enable_audio(true),
        enable_hw_accel(true),
        buffer_capacity(20),
        take_timeout_ms(200),
        jpeg_quality(90),
        max_decode_threads(0) {}
};

// Snapshot quality presets as exposed to operators.
enum class VideoQuality {
  kLow = 1,
  kMedium = 2,
  kHigh = 3,
};

constexpr VideoQuality kDefaultVideoQuality = VideoQuality::kMedium;

// Throws ConfigurationError for values outside 1..3.
VideoQuality VideoQualityFromInt(int value);

const char* VideoQualityName(VideoQuality quality);

// LOW=60, MEDIUM=75, HIGH=90.
int JpegQualityFor(VideoQuality quality);

// Codec-level subset handed to FFmpegCodecFactory.
decode::FFmpegCodecConfig ToCodecConfig(const DecodeWorkerConfig& config);

}  // namespace camgate::config

#endif  // CAMGATE_CONFIG_WORKER_CONFIG_HPP_
