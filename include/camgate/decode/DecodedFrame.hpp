// Repository: Retrovue-camgate
// Component: Decoded Frame Types
// Purpose: Library-neutral decoded picture/audio containers passed between
//          the codec adapters and the decode worker.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_DECODE_DECODED_FRAME_HPP_
#define CAMGATE_DECODE_DECODED_FRAME_HPP_

#include <cstdint>
#include <vector>

namespace camgate::decode {

// Output PCM format forwarded to the audio callback: S16 mono 16 kHz.
constexpr int kPcmSampleRate = 16000;
constexpr int kPcmChannels = 1;

// VideoPicture holds one decoded picture as packed YUV420P planes
// (Y: width*height, U and V: (width/2)*(height/2) each).
struct VideoPicture {
  int width = 0;
  int height = 0;
  int64_t pts = 0;
  std::vector<uint8_t> data;

  size_t LumaSize() const { return static_cast<size_t>(width) * height; }
  size_t ChromaSize() const {
    return static_cast<size_t>(width / 2) * (height / 2);
  }
};

// AudioBlock holds one decoded audio frame as interleaved float samples in
// the decoder's native rate and channel count.
struct AudioBlock {
  int sample_rate = 0;
  int channels = 0;
  int nb_samples = 0;  // Per channel
  std::vector<float> samples;
};

}  // namespace camgate::decode

#endif  // CAMGATE_DECODE_DECODED_FRAME_HPP_
