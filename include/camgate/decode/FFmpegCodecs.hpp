// Repository: Retrovue-camgate
// Component: FFmpeg Codec Adapters
// Purpose: Packet decoding (H.264/HEVC/Opus/G.711), JPEG encoding and PCM
//          resampling using libavcodec, libswscale and libswresample.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_DECODE_FFMPEG_CODECS_HPP_
#define CAMGATE_DECODE_FFMPEG_CODECS_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "camgate/decode/ICodecFactory.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVCodec;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;
struct SwrContext;

namespace camgate::decode {

// FFmpegCodecConfig holds codec-level settings supplied by the host.
struct FFmpegCodecConfig {
  bool enable_hw_accel;    // Try VAAPI for video when the host supports it
  int jpeg_quality;        // 1 (worst) .. 100 (best)
  int max_decode_threads;  // Maximum decoder threads (0 = auto)

  FFmpegCodecConfig()
      : enable_hw_accel(true),
        jpeg_quality(90),
        max_decode_threads(0) {}
};

// Result of probing the host for VAAPI decode support.
struct HwAccelProbe {
  bool available = false;
  std::string type;  // "vaapi" when available
};

// Checks that FFmpeg was built with VAAPI and that a DRM render node exists.
HwAccelProbe ProbeHardwareAcceleration();

// Maps JPEG quality (1..100) to an MJPEG qscale (31..2).
int JpegQualityToQscale(int quality);

// Throws DecodeError when avcodec_send_packet() refused the packet. EAGAIN
// still reported after the drain-and-retry counts as a refusal.
void CheckSendResult(int ret, buffer::CodecId codec);

// PictureConverter copies a decoded software frame into a VideoPicture,
// full-range YUV 4:2:0. Odd widths and heights lose their last column or row.
class PictureConverter {
 public:
  PictureConverter() = default;
  ~PictureConverter();

  PictureConverter(const PictureConverter&) = delete;
  PictureConverter& operator=(const PictureConverter&) = delete;

  // Throws DecodeError if the frame is empty or cannot be converted.
  VideoPicture Convert(const AVFrame* src);

 private:
  SwsContext* sws_ctx_ = nullptr;
};

// FFmpegVideoDecoder decodes H.264/HEVC packets to YUV 4:2:0 (full range).
//
// Thread Safety: not thread-safe; owned by the decode worker thread.
class FFmpegVideoDecoder : public IVideoDecoder {
 public:
  FFmpegVideoDecoder(buffer::CodecId codec, const FFmpegCodecConfig& config,
                     bool use_hw_accel);
  ~FFmpegVideoDecoder() override;

  FFmpegVideoDecoder(const FFmpegVideoDecoder&) = delete;
  FFmpegVideoDecoder& operator=(const FFmpegVideoDecoder&) = delete;

  buffer::CodecId Codec() const override { return codec_; }
  std::vector<VideoPicture> Decode(const std::vector<uint8_t>& packet) override;

  bool UsingHwAccel() const { return hw_enabled_; }

 private:
  void AttachHwDevice();
  void ReceiveAll(std::vector<VideoPicture>& out);
  void Close();

  buffer::CodecId codec_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* sw_frame_ = nullptr;  // Target of hw → system memory transfer
  PictureConverter converter_;
  bool hw_enabled_ = false;
};

// FFmpegAudioDecoder decodes Opus/G.711 packets to interleaved float.
class FFmpegAudioDecoder : public IAudioDecoder {
 public:
  explicit FFmpegAudioDecoder(buffer::CodecId codec);
  ~FFmpegAudioDecoder() override;

  FFmpegAudioDecoder(const FFmpegAudioDecoder&) = delete;
  FFmpegAudioDecoder& operator=(const FFmpegAudioDecoder&) = delete;

  buffer::CodecId Codec() const override { return codec_; }
  std::vector<AudioBlock> Decode(const std::vector<uint8_t>& packet) override;

 private:
  void ReceiveAll(std::vector<AudioBlock>& out);
  void Close();

  buffer::CodecId codec_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
};

// FFmpegJpegEncoder encodes pictures with the MJPEG encoder. The encoder
// context is reopened when the picture size changes.
class FFmpegJpegEncoder : public IImageEncoder {
 public:
  explicit FFmpegJpegEncoder(int jpeg_quality);
  ~FFmpegJpegEncoder() override;

  FFmpegJpegEncoder(const FFmpegJpegEncoder&) = delete;
  FFmpegJpegEncoder& operator=(const FFmpegJpegEncoder&) = delete;

  std::vector<uint8_t> Encode(const VideoPicture& picture) override;

 private:
  void EnsureContext(int width, int height);

  const AVCodec* codec_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  int qscale_;
  int width_ = 0;
  int height_ = 0;
  int64_t frame_index_ = 0;
};

// FFmpegAudioResampler converts interleaved float at any rate/channel count
// to S16 mono at kPcmSampleRate. Reconfigures on input format change.
class FFmpegAudioResampler : public IAudioResampler {
 public:
  FFmpegAudioResampler();
  ~FFmpegAudioResampler() override;

  FFmpegAudioResampler(const FFmpegAudioResampler&) = delete;
  FFmpegAudioResampler& operator=(const FFmpegAudioResampler&) = delete;

  std::vector<int16_t> Resample(const AudioBlock& block) override;

 private:
  void EnsureContext(int sample_rate, int channels);

  ::SwrContext* swr_ctx_ = nullptr;  // FFmpeg type, global scope
  int in_sample_rate_ = 0;
  int in_channels_ = 0;
};

// Production codec factory.
class FFmpegCodecFactory : public ICodecFactory {
 public:
  explicit FFmpegCodecFactory(const FFmpegCodecConfig& config = FFmpegCodecConfig());
  ~FFmpegCodecFactory() override;

  std::unique_ptr<IVideoDecoder> CreateVideoDecoder(buffer::CodecId codec) override;
  std::unique_ptr<IImageEncoder> CreateImageEncoder() override;
  std::unique_ptr<IAudioDecoder> CreateAudioDecoder(buffer::CodecId codec) override;
  std::unique_ptr<IAudioResampler> CreateAudioResampler(buffer::CodecId codec) override;

  const HwAccelProbe& HwAccel() const { return hw_; }

 private:
  FFmpegCodecConfig config_;
  HwAccelProbe hw_;
};

}  // namespace camgate::decode

#endif  // CAMGATE_DECODE_FFMPEG_CODECS_HPP_
