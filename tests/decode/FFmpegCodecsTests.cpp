// Repository: Retrovue-camgate
// Component: FFmpeg Codec Adapter Tests
// Purpose: Exercise the real FFmpeg adapters with codecs present in every
//          build: G.711 decode, PCM resample, MJPEG encode, frame conversion.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <vector>

#include "camgate/decode/FFmpegCodecs.hpp"
#include "camgate/util/Errors.hpp"

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
}

namespace camgate::decode::testing {
namespace {

using buffer::CodecId;

FFmpegCodecConfig SoftwareOnly() {
  FFmpegCodecConfig config;
  config.enable_hw_accel = false;
  return config;
}

// 20 ms of G.711 at 8 kHz: one byte per sample.
std::vector<uint8_t> G711Packet(uint8_t value) {
  return std::vector<uint8_t>(160, value);
}

TEST(FFmpegCodecsTest, G711DecodesToMono8k) {
  FFmpegCodecFactory factory(SoftwareOnly());
  auto decoder = factory.CreateAudioDecoder(CodecId::kPcmU);
  ASSERT_NE(decoder, nullptr);
  EXPECT_EQ(decoder->Codec(), CodecId::kPcmU);

  std::vector<AudioBlock> blocks = decoder->Decode(G711Packet(0xFF));  // mu-law ~0
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].sample_rate, 8000);
  EXPECT_EQ(blocks[0].channels, 1);
  EXPECT_EQ(blocks[0].nb_samples, 160);
  ASSERT_EQ(blocks[0].samples.size(), 160u);
  for (float s : blocks[0].samples) {
    EXPECT_NEAR(s, 0.0f, 0.01f);
  }
}

TEST(FFmpegCodecsTest, EmptyPacketDecodesToNothing) {
  FFmpegCodecFactory factory(SoftwareOnly());
  auto decoder = factory.CreateAudioDecoder(CodecId::kPcmA);
  EXPECT_TRUE(decoder->Decode({}).empty());
}

TEST(FFmpegCodecsTest, ResamplerProducesS16Mono16k) {
  FFmpegCodecFactory factory(SoftwareOnly());
  auto decoder = factory.CreateAudioDecoder(CodecId::kPcmA);
  auto resampler = factory.CreateAudioResampler(CodecId::kPcmA);

  size_t total = 0;
  for (int i = 0; i < 10; i++) {
    for (const AudioBlock& block : decoder->Decode(G711Packet(0xD5))) {
      total += resampler->Resample(block).size();
    }
  }
  // 1600 input samples at 8 kHz ≈ 3200 at 16 kHz, minus filter delay.
  EXPECT_GT(total, 3000u);
  EXPECT_LE(total, 3200u);
}

TEST(FFmpegCodecsTest, ResamplerIgnoresEmptyBlock) {
  FFmpegAudioResampler resampler;
  AudioBlock empty;
  EXPECT_TRUE(resampler.Resample(empty).empty());
}

TEST(FFmpegCodecsTest, JpegEncoderEmitsSoiAndEoi) {
  FFmpegJpegEncoder encoder(90);
  VideoPicture picture;
  picture.width = 64;
  picture.height = 48;
  picture.data.assign(picture.LumaSize() + 2 * picture.ChromaSize(), 0x80);

  std::vector<uint8_t> jpeg = encoder.Encode(picture);
  ASSERT_GT(jpeg.size(), 4u);
  EXPECT_EQ(jpeg[0], 0xFF);
  EXPECT_EQ(jpeg[1], 0xD8);
  EXPECT_EQ(jpeg[jpeg.size() - 2], 0xFF);
  EXPECT_EQ(jpeg[jpeg.size() - 1], 0xD9);

  // Size change reopens the encoder.
  picture.width = 32;
  picture.height = 32;
  picture.data.assign(picture.LumaSize() + 2 * picture.ChromaSize(), 0x10);
  std::vector<uint8_t> second = encoder.Encode(picture);
  ASSERT_GT(second.size(), 4u);
  EXPECT_EQ(second[0], 0xFF);
  EXPECT_EQ(second[1], 0xD8);
}

TEST(FFmpegCodecsTest, LowerQualityGivesSmallerJpeg) {
  VideoPicture picture;
  picture.width = 64;
  picture.height = 64;
  picture.data.resize(picture.LumaSize() + 2 * picture.ChromaSize());
  for (size_t i = 0; i < picture.data.size(); i++) {
    picture.data[i] = static_cast<uint8_t>((i * 37) & 0xFF);
  }

  FFmpegJpegEncoder high(95);
  FFmpegJpegEncoder low(10);
  EXPECT_LT(low.Encode(picture).size(), high.Encode(picture).size());
}

TEST(FFmpegCodecsTest, JpegEncoderRejectsShortPicture) {
  FFmpegJpegEncoder encoder(75);
  VideoPicture picture;
  picture.width = 16;
  picture.height = 16;
  picture.data.assign(10, 0);
  EXPECT_THROW(encoder.Encode(picture), ConversionError);
}

TEST(FFmpegCodecsTest, CodecKindMismatchFailsInit) {
  FFmpegCodecFactory factory(SoftwareOnly());
  EXPECT_THROW(factory.CreateVideoDecoder(CodecId::kOpus), DecoderInitError);
  EXPECT_THROW(factory.CreateAudioDecoder(CodecId::kH265), DecoderInitError);
  EXPECT_THROW(factory.CreateAudioResampler(CodecId::kH264), DecoderInitError);
}

TEST(FFmpegCodecsTest, HwProbeSkippedWhenDisabled) {
  FFmpegCodecFactory factory(SoftwareOnly());
  EXPECT_FALSE(factory.HwAccel().available);
}

// FFmpeg reports EAGAIN as AVERROR(EAGAIN) == -EAGAIN on POSIX hosts.
TEST(FFmpegCodecsTest, SendStillFullAfterDrainIsDecodeError) {
  EXPECT_NO_THROW(CheckSendResult(0, CodecId::kH264));
  EXPECT_THROW(CheckSendResult(-EAGAIN, CodecId::kH264), DecodeError);
  EXPECT_THROW(CheckSendResult(-EINVAL, CodecId::kOpus), DecodeError);
}

// Odd-sized frames are cropped to even dimensions, not rescaled: a bright
// last column must not bleed into the kept picture.
TEST(FFmpegCodecsTest, OddSizedFrameIsCroppedToEvenDimensions) {
  AVFrame* frame = av_frame_alloc();
  ASSERT_NE(frame, nullptr);
  frame->format = AV_PIX_FMT_YUV420P;
  frame->width = 17;
  frame->height = 9;
  ASSERT_GE(av_frame_get_buffer(frame, 0), 0);

  for (int y = 0; y < frame->height; y++) {
    uint8_t* row = frame->data[0] + y * frame->linesize[0];
    for (int x = 0; x < frame->width; x++) {
      row[x] = (x == frame->width - 1 || y == frame->height - 1) ? 235 : 100;
    }
  }
  for (int plane = 1; plane < 3; plane++) {
    for (int y = 0; y < (frame->height + 1) / 2; y++) {
      uint8_t* row = frame->data[plane] + y * frame->linesize[plane];
      for (int x = 0; x < (frame->width + 1) / 2; x++) row[x] = 128;
    }
  }
  frame->pts = 42;

  PictureConverter converter;
  VideoPicture picture = converter.Convert(frame);
  av_frame_free(&frame);

  EXPECT_EQ(picture.width, 16);
  EXPECT_EQ(picture.height, 8);
  EXPECT_EQ(picture.pts, 42);
  ASSERT_EQ(picture.data.size(), picture.LumaSize() + 2 * picture.ChromaSize());
  const uint8_t first = picture.data[0];
  for (size_t i = 0; i < picture.LumaSize(); i++) {
    ASSERT_EQ(picture.data[i], first) << "luma index " << i;
  }
}

TEST(FFmpegCodecsTest, EmptyFrameIsDecodeError) {
  AVFrame* frame = av_frame_alloc();
  ASSERT_NE(frame, nullptr);
  frame->format = AV_PIX_FMT_YUV420P;
  frame->width = 1;
  frame->height = 1;

  PictureConverter converter;
  EXPECT_THROW(converter.Convert(frame), DecodeError);
  av_frame_free(&frame);
}

}  // namespace
}  // namespace camgate::decode::testing
