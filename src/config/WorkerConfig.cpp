// Repository: Retrovue-camgate
// Component: Worker Configuration
// Copyright (c) 2025 RetroVue

#include "camgate/config/WorkerConfig.hpp"

#include <string>

#include "camgate/util/Errors.hpp"

namespace camgate::config {

VideoQuality VideoQualityFromInt(int value) {
  switch (value) {
    case 1: return VideoQuality::kLow;
    case 2: return VideoQuality::kMedium;
    case 3: return VideoQuality::kHigh;
    default:
      throw ConfigurationError("invalid video quality " + std::to_string(value) +
                               " (expected 1=LOW, 2=MEDIUM, 3=HIGH)");
  }
}

const char* VideoQualityName(VideoQuality quality) {
  switch (quality) {
    case VideoQuality::kLow: return "LOW";
    case VideoQuality::kMedium: return "MEDIUM";
    case VideoQuality::kHigh: return "HIGH";
  }
  return "UNKNOWN";
}

int JpegQualityFor(VideoQuality quality) {
  switch (quality) {
    case VideoQuality::kLow: return 60;
    case VideoQuality::kMedium: return 75;
    case VideoQuality::kHigh: return 90;
  }
  return 75;
}

decode::FFmpegCodecConfig ToCodecConfig(const DecodeWorkerConfig& config) {
  decode::FFmpegCodecConfig codec;
  codec.enable_hw_accel = config.enable_hw_accel;
  codec.jpeg_quality = config.jpeg_quality;
  codec.max_decode_threads = config.max_decode_threads;
  return codec;
}

}  // namespace camgate::config
