// Repository: Retrovue-camgate
// Component: Codec Adapter Interfaces
// Purpose: Minimal decode/convert surface used by DecodeWorker so tests can
//          inject fake codecs. Production uses FFmpegCodecFactory; tests use
//          FakeCodecFactory.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_DECODE_ICODEC_FACTORY_HPP_
#define CAMGATE_DECODE_ICODEC_FACTORY_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "camgate/buffer/FrameRecord.hpp"
#include "camgate/decode/DecodedFrame.hpp"

namespace camgate::decode {

// Stateful video decoder bound to one codec. Decode() feeds one packet and
// returns every picture the decoder released (zero or more).
// Throws DecodeError when the codec rejects the packet.
class IVideoDecoder {
 public:
  virtual ~IVideoDecoder() = default;
  virtual buffer::CodecId Codec() const = 0;
  virtual std::vector<VideoPicture> Decode(const std::vector<uint8_t>& packet) = 0;
};

// Stateful audio decoder bound to one codec.
// Throws DecodeError when the codec rejects the packet.
class IAudioDecoder {
 public:
  virtual ~IAudioDecoder() = default;
  virtual buffer::CodecId Codec() const = 0;
  virtual std::vector<AudioBlock> Decode(const std::vector<uint8_t>& packet) = 0;
};

// Converts one decoded picture to JPEG bytes. Throws ConversionError.
class IImageEncoder {
 public:
  virtual ~IImageEncoder() = default;
  virtual std::vector<uint8_t> Encode(const VideoPicture& picture) = 0;
};

// Converts decoded audio to S16 mono at kPcmSampleRate. Stateful (keeps
// filter delay across calls). Throws ConversionError.
class IAudioResampler {
 public:
  virtual ~IAudioResampler() = default;
  virtual std::vector<int16_t> Resample(const AudioBlock& block) = 0;
};

// Creates codec handles for a codec id. All Create* methods throw
// DecoderInitError when the codec is unsupported or cannot be opened.
class ICodecFactory {
 public:
  virtual ~ICodecFactory() = default;

  virtual std::unique_ptr<IVideoDecoder> CreateVideoDecoder(buffer::CodecId codec) = 0;
  virtual std::unique_ptr<IImageEncoder> CreateImageEncoder() = 0;
  virtual std::unique_ptr<IAudioDecoder> CreateAudioDecoder(buffer::CodecId codec) = 0;
  virtual std::unique_ptr<IAudioResampler> CreateAudioResampler(buffer::CodecId codec) = 0;
};

}  // namespace camgate::decode

#endif  // CAMGATE_DECODE_ICODEC_FACTORY_HPP_
