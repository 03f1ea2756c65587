// Repository: Retrovue-camgate
// Component: FFmpeg Codec Adapters
// Purpose: Packet decode, JPEG encode and PCM resample via FFmpeg.
// Copyright (c) 2025 RetroVue

#include "camgate/decode/FFmpegCodecs.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <unistd.h>

#include "camgate/util/Errors.hpp"
#include "camgate/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/hwcontext.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libavutil/pixdesc.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace camgate::decode {

using buffer::CodecId;
using camgate::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  std::ostringstream oss;
  oss << "ret=" << ret << " err=" << errbuf;
  return oss.str();
}

// Suppress FFmpeg warnings but keep errors visible
void QuietFFmpegLogs() {
  static std::once_flag once;
  std::call_once(once, [] { av_log_set_level(AV_LOG_ERROR); });
}

const char* FFmpegCodecName(CodecId codec) {
  switch (codec) {
    case CodecId::kH264: return "h264";
    case CodecId::kH265: return "hevc";
    case CodecId::kOpus: return "opus";
    case CodecId::kPcmA: return "pcm_alaw";
    case CodecId::kPcmU: return "pcm_mulaw";
  }
  return "";
}

struct PacketDeleter {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

PacketPtr MakePacket(const std::vector<uint8_t>& payload) {
  PacketPtr pkt(av_packet_alloc());
  if (!pkt) {
    throw DecodeError("[FFmpegCodecs] av_packet_alloc failed");
  }
  int ret = av_new_packet(pkt.get(), static_cast<int>(payload.size()));
  if (ret < 0) {
    throw DecodeError("[FFmpegCodecs] av_new_packet failed " + AvError(ret));
  }
  std::memcpy(pkt->data, payload.data(), payload.size());
  return pkt;
}

// get_format callback: prefer VAAPI surfaces, else the first software format.
enum AVPixelFormat PickHwFormat(AVCodecContext* /*ctx*/,
                                const enum AVPixelFormat* formats) {
  for (const enum AVPixelFormat* p = formats; *p != AV_PIX_FMT_NONE; ++p) {
    if (*p == AV_PIX_FMT_VAAPI) return *p;
  }
  for (const enum AVPixelFormat* p = formats; *p != AV_PIX_FMT_NONE; ++p) {
    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(*p);
    if (desc && !(desc->flags & AV_PIX_FMT_FLAG_HWACCEL)) return *p;
  }
  return AV_PIX_FMT_NONE;
}

float ReadSample(const uint8_t* p, AVSampleFormat packed_fmt) {
  switch (packed_fmt) {
    case AV_SAMPLE_FMT_U8:
      return (static_cast<int>(*p) - 128) / 128.0f;
    case AV_SAMPLE_FMT_S16: {
      int16_t v;
      std::memcpy(&v, p, sizeof(v));
      return v / 32768.0f;
    }
    case AV_SAMPLE_FMT_S32: {
      int32_t v;
      std::memcpy(&v, p, sizeof(v));
      return static_cast<float>(v / 2147483648.0);
    }
    case AV_SAMPLE_FMT_FLT: {
      float v;
      std::memcpy(&v, p, sizeof(v));
      return v;
    }
    case AV_SAMPLE_FMT_DBL: {
      double v;
      std::memcpy(&v, p, sizeof(v));
      return static_cast<float>(v);
    }
    default:
      throw DecodeError(std::string("[FFmpegCodecs] unsupported sample format ") +
                        av_get_sample_fmt_name(packed_fmt));
  }
}

}  // namespace

// =============================================================================
// Host probing
// =============================================================================

HwAccelProbe ProbeHardwareAcceleration() {
  HwAccelProbe probe;
  if (av_hwdevice_find_type_by_name("vaapi") == AV_HWDEVICE_TYPE_NONE) {
    Logger::Info("[FFmpegCodecs] FFmpeg built without VAAPI, will use software decoding");
    return probe;
  }
  if (access("/dev/dri/renderD128", F_OK) == 0 || access("/dev/dri/card0", F_OK) == 0) {
    probe.available = true;
    probe.type = "vaapi";
    Logger::Info("[FFmpegCodecs] VAAPI device detected, hardware decoding may be available");
  } else {
    Logger::Info("[FFmpegCodecs] No VAAPI device, will use software decoding");
  }
  return probe;
}

int JpegQualityToQscale(int quality) {
  if (quality < 1) quality = 1;
  if (quality > 100) quality = 100;
  // 100 → 2 (best MJPEG qscale), 1 → 31 (worst).
  return 2 + ((100 - quality) * 29 + 49) / 99;
}

void CheckSendResult(int ret, CodecId codec) {
  if (ret >= 0) return;
  if (ret == AVERROR(EAGAIN)) {
    throw DecodeError(std::string("[FFmpegCodecs] ") + FFmpegCodecName(codec) +
                      " decoder still full after drain, packet dropped " + AvError(ret));
  }
  throw DecodeError(std::string("[FFmpegCodecs] ") + FFmpegCodecName(codec) +
                    " avcodec_send_packet failed " + AvError(ret));
}

// =============================================================================
// FFmpegVideoDecoder
// =============================================================================

FFmpegVideoDecoder::FFmpegVideoDecoder(CodecId codec,
                                       const FFmpegCodecConfig& config,
                                       bool use_hw_accel)
    : codec_(codec) {
  if (!buffer::IsVideoCodec(codec)) {
    throw DecoderInitError(std::string("[FFmpegCodecs] not a video codec: ") +
                           buffer::CodecIdName(codec));
  }

  const AVCodec* av_codec = avcodec_find_decoder_by_name(FFmpegCodecName(codec));
  if (!av_codec) {
    throw DecoderInitError(std::string("[FFmpegCodecs] decoder not found: ") +
                           FFmpegCodecName(codec));
  }

  codec_ctx_ = avcodec_alloc_context3(av_codec);
  if (!codec_ctx_) {
    throw DecoderInitError("[FFmpegCodecs] Failed to allocate video codec context");
  }

  // Set threading (frame + slice, like "auto")
  codec_ctx_->thread_count = config.max_decode_threads > 0 ? config.max_decode_threads : 0;
  codec_ctx_->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;

  if (use_hw_accel) {
    AttachHwDevice();
  }

  int ret = avcodec_open2(codec_ctx_, av_codec, nullptr);
  if (ret < 0) {
    Close();
    throw DecoderInitError(std::string("[FFmpegCodecs] Failed to open video codec ") +
                           FFmpegCodecName(codec) + " " + AvError(ret));
  }

  frame_ = av_frame_alloc();
  sw_frame_ = av_frame_alloc();
  if (!frame_ || !sw_frame_) {
    Close();
    throw DecoderInitError("[FFmpegCodecs] Failed to allocate video frames");
  }

  std::ostringstream oss;
  oss << "[FFmpegCodecs] video decoder created codec=" << FFmpegCodecName(codec)
      << " hw=" << (hw_enabled_ ? "vaapi" : "software");
  Logger::Info(oss.str());
}

FFmpegVideoDecoder::~FFmpegVideoDecoder() {
  Close();
}

void FFmpegVideoDecoder::Close() {
  if (sw_frame_) {
    av_frame_free(&sw_frame_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);  // Also unrefs hw_device_ctx
  }
}

void FFmpegVideoDecoder::AttachHwDevice() {
  AVBufferRef* hw_device = nullptr;
  int ret = av_hwdevice_ctx_create(&hw_device, AV_HWDEVICE_TYPE_VAAPI,
                                   nullptr, nullptr, 0);
  if (ret < 0) {
    Logger::Warn("[FFmpegCodecs] Failed to init VAAPI device (" + AvError(ret) +
                 "), fallback to software");
    return;
  }
  codec_ctx_->hw_device_ctx = hw_device;  // Context owns the reference
  codec_ctx_->get_format = PickHwFormat;
  hw_enabled_ = true;
}

std::vector<VideoPicture> FFmpegVideoDecoder::Decode(const std::vector<uint8_t>& packet) {
  std::vector<VideoPicture> out;
  // An empty packet would put the decoder into draining mode.
  if (packet.empty()) return out;

  PacketPtr pkt = MakePacket(packet);
  int ret = avcodec_send_packet(codec_ctx_, pkt.get());
  if (ret == AVERROR(EAGAIN)) {
    // Decoder full: drain, then retry once with the same packet.
    ReceiveAll(out);
    ret = avcodec_send_packet(codec_ctx_, pkt.get());
  }
  CheckSendResult(ret, codec_);
  ReceiveAll(out);
  return out;
}

void FFmpegVideoDecoder::ReceiveAll(std::vector<VideoPicture>& out) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return;
    }
    if (ret < 0) {
      throw DecodeError(std::string("[FFmpegCodecs] ") + FFmpegCodecName(codec_) +
                        " avcodec_receive_frame failed " + AvError(ret));
    }

    const AVFrame* src = frame_;
    if (frame_->format == AV_PIX_FMT_VAAPI) {
      av_frame_unref(sw_frame_);
      ret = av_hwframe_transfer_data(sw_frame_, frame_, 0);
      if (ret < 0) {
        av_frame_unref(frame_);
        throw DecodeError("[FFmpegCodecs] av_hwframe_transfer_data failed " + AvError(ret));
      }
      src = sw_frame_;
    }

    try {
      out.push_back(converter_.Convert(src));
    } catch (...) {
      av_frame_unref(frame_);
      throw;
    }
    av_frame_unref(frame_);
  }
}

// =============================================================================
// PictureConverter
// =============================================================================

PictureConverter::~PictureConverter() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

VideoPicture PictureConverter::Convert(const AVFrame* src) {
  // 4:2:0 needs even dimensions; crop rather than rescale.
  const int width = src->width & ~1;
  const int height = src->height & ~1;
  if (width <= 0 || height <= 0) {
    throw DecodeError("[FFmpegCodecs] decoded frame has no picture");
  }

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      width, height, static_cast<AVPixelFormat>(src->format),
      width, height, AV_PIX_FMT_YUVJ420P,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    throw DecodeError("[FFmpegCodecs] Failed to create scaler context");
  }

  VideoPicture picture;
  picture.width = width;
  picture.height = height;
  picture.pts = src->pts != AV_NOPTS_VALUE ? src->pts : src->best_effort_timestamp;
  const size_t y_size = picture.LumaSize();
  const size_t uv_size = picture.ChromaSize();
  picture.data.resize(y_size + 2 * uv_size);

  uint8_t* dst[4] = {picture.data.data(),
                     picture.data.data() + y_size,
                     picture.data.data() + y_size + uv_size,
                     nullptr};
  const int dst_linesize[4] = {width, width / 2, width / 2, 0};
  int rows = sws_scale(sws_ctx_, src->data, src->linesize, 0, height,
                       dst, dst_linesize);
  if (rows <= 0) {
    throw DecodeError("[FFmpegCodecs] sws_scale failed " + AvError(rows));
  }
  return picture;
}

// =============================================================================
// FFmpegAudioDecoder
// =============================================================================

FFmpegAudioDecoder::FFmpegAudioDecoder(CodecId codec) : codec_(codec) {
  if (buffer::IsVideoCodec(codec)) {
    throw DecoderInitError(std::string("[FFmpegCodecs] not an audio codec: ") +
                           buffer::CodecIdName(codec));
  }

  const AVCodec* av_codec = avcodec_find_decoder_by_name(FFmpegCodecName(codec));
  if (!av_codec) {
    throw DecoderInitError(std::string("[FFmpegCodecs] decoder not found: ") +
                           FFmpegCodecName(codec));
  }

  codec_ctx_ = avcodec_alloc_context3(av_codec);
  if (!codec_ctx_) {
    throw DecoderInitError("[FFmpegCodecs] Failed to allocate audio codec context");
  }

  // Camera audio carries no extradata: assume mono at the codec's native rate.
  av_channel_layout_default(&codec_ctx_->ch_layout, 1);
  codec_ctx_->sample_rate = (codec == CodecId::kOpus) ? 48000 : 8000;

  int ret = avcodec_open2(codec_ctx_, av_codec, nullptr);
  if (ret < 0) {
    Close();
    throw DecoderInitError(std::string("[FFmpegCodecs] Failed to open audio codec ") +
                           FFmpegCodecName(codec) + " " + AvError(ret));
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Close();
    throw DecoderInitError("[FFmpegCodecs] Failed to allocate audio frame");
  }

  Logger::Info(std::string("[FFmpegCodecs] audio decoder created codec=") +
               FFmpegCodecName(codec));
}

FFmpegAudioDecoder::~FFmpegAudioDecoder() {
  Close();
}

void FFmpegAudioDecoder::Close() {
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
}

std::vector<AudioBlock> FFmpegAudioDecoder::Decode(const std::vector<uint8_t>& packet) {
  std::vector<AudioBlock> out;
  if (packet.empty()) return out;

  PacketPtr pkt = MakePacket(packet);
  int ret = avcodec_send_packet(codec_ctx_, pkt.get());
  if (ret == AVERROR(EAGAIN)) {
    ReceiveAll(out);
    ret = avcodec_send_packet(codec_ctx_, pkt.get());
  }
  CheckSendResult(ret, codec_);
  ReceiveAll(out);
  return out;
}

void FFmpegAudioDecoder::ReceiveAll(std::vector<AudioBlock>& out) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return;
    }
    if (ret < 0) {
      throw DecodeError(std::string("[FFmpegCodecs] ") + FFmpegCodecName(codec_) +
                        " avcodec_receive_frame failed " + AvError(ret));
    }

    AudioBlock block;
    block.sample_rate = frame_->sample_rate;
    block.channels = frame_->ch_layout.nb_channels;
    block.nb_samples = frame_->nb_samples;
    if (block.channels <= 0 || block.sample_rate <= 0) {
      av_frame_unref(frame_);
      throw DecodeError("[FFmpegCodecs] decoded audio frame has no channel layout");
    }

    const AVSampleFormat fmt = static_cast<AVSampleFormat>(frame_->format);
    const AVSampleFormat packed = av_get_packed_sample_fmt(fmt);
    const bool planar = av_sample_fmt_is_planar(fmt) != 0;
    const int bps = av_get_bytes_per_sample(fmt);
    block.samples.resize(static_cast<size_t>(block.nb_samples) * block.channels);

    try {
      for (int s = 0; s < block.nb_samples; ++s) {
        for (int c = 0; c < block.channels; ++c) {
          const uint8_t* p = planar
              ? frame_->extended_data[c] + static_cast<size_t>(s) * bps
              : frame_->extended_data[0] +
                    (static_cast<size_t>(s) * block.channels + c) * bps;
          block.samples[static_cast<size_t>(s) * block.channels + c] =
              ReadSample(p, packed);
        }
      }
    } catch (...) {
      av_frame_unref(frame_);
      throw;
    }
    av_frame_unref(frame_);
    out.push_back(std::move(block));
  }
}

// =============================================================================
// FFmpegJpegEncoder
// =============================================================================

FFmpegJpegEncoder::FFmpegJpegEncoder(int jpeg_quality)
    : qscale_(JpegQualityToQscale(jpeg_quality)) {
  codec_ = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec_) {
    throw DecoderInitError("[FFmpegCodecs] MJPEG encoder not found");
  }
  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    av_frame_free(&frame_);
    av_packet_free(&packet_);
    throw DecoderInitError("[FFmpegCodecs] Failed to allocate encoder frame/packet");
  }
}

FFmpegJpegEncoder::~FFmpegJpegEncoder() {
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  av_frame_free(&frame_);
  av_packet_free(&packet_);
}

void FFmpegJpegEncoder::EnsureContext(int width, int height) {
  if (codec_ctx_ && width_ == width && height_ == height) {
    return;
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  width_ = 0;
  height_ = 0;

  codec_ctx_ = avcodec_alloc_context3(codec_);
  if (!codec_ctx_) {
    throw ConversionError("[FFmpegCodecs] Failed to allocate MJPEG context");
  }
  codec_ctx_->width = width;
  codec_ctx_->height = height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUVJ420P;
  codec_ctx_->color_range = AVCOL_RANGE_JPEG;
  codec_ctx_->time_base = AVRational{1, 25};
  codec_ctx_->flags |= AV_CODEC_FLAG_QSCALE;
  codec_ctx_->global_quality = FF_QP2LAMBDA * qscale_;

  int ret = avcodec_open2(codec_ctx_, codec_, nullptr);
  if (ret < 0) {
    avcodec_free_context(&codec_ctx_);
    throw ConversionError("[FFmpegCodecs] Failed to open MJPEG encoder " + AvError(ret));
  }
  width_ = width;
  height_ = height;
}

std::vector<uint8_t> FFmpegJpegEncoder::Encode(const VideoPicture& picture) {
  const size_t y_size = picture.LumaSize();
  const size_t uv_size = picture.ChromaSize();
  if (picture.width <= 0 || picture.height <= 0 ||
      picture.data.size() < y_size + 2 * uv_size) {
    throw ConversionError("[FFmpegCodecs] invalid picture for JPEG encode");
  }

  EnsureContext(picture.width, picture.height);

  av_frame_unref(frame_);
  frame_->format = AV_PIX_FMT_YUVJ420P;
  frame_->width = picture.width;
  frame_->height = picture.height;
  int ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    throw ConversionError("[FFmpegCodecs] av_frame_get_buffer failed " + AvError(ret));
  }

  // Copy Y plane, then U and V
  const uint8_t* src = picture.data.data();
  for (int y = 0; y < picture.height; y++) {
    std::memcpy(frame_->data[0] + y * frame_->linesize[0],
                src + static_cast<size_t>(y) * picture.width, picture.width);
  }
  const int cw = picture.width / 2;
  const int ch = picture.height / 2;
  for (int plane = 1; plane <= 2; plane++) {
    const uint8_t* plane_src = src + y_size + (plane - 1) * uv_size;
    for (int y = 0; y < ch; y++) {
      std::memcpy(frame_->data[plane] + y * frame_->linesize[plane],
                  plane_src + static_cast<size_t>(y) * cw, cw);
    }
  }
  frame_->quality = codec_ctx_->global_quality;
  frame_->pts = frame_index_++;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    throw ConversionError("[FFmpegCodecs] avcodec_send_frame failed " + AvError(ret));
  }
  ret = avcodec_receive_packet(codec_ctx_, packet_);
  if (ret < 0) {
    throw ConversionError("[FFmpegCodecs] avcodec_receive_packet failed " + AvError(ret));
  }
  std::vector<uint8_t> jpeg(packet_->data, packet_->data + packet_->size);
  av_packet_unref(packet_);
  return jpeg;
}

// =============================================================================
// FFmpegAudioResampler
// =============================================================================

FFmpegAudioResampler::FFmpegAudioResampler() = default;

FFmpegAudioResampler::~FFmpegAudioResampler() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
}

void FFmpegAudioResampler::EnsureContext(int sample_rate, int channels) {
  if (swr_ctx_ && sample_rate == in_sample_rate_ && channels == in_channels_) {
    return;
  }
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }

  AVChannelLayout src_ch_layout{};
  AVChannelLayout dst_ch_layout{};
  av_channel_layout_default(&src_ch_layout, channels);
  av_channel_layout_default(&dst_ch_layout, kPcmChannels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_S16, kPcmSampleRate,
                                &src_ch_layout, AV_SAMPLE_FMT_FLT, sample_rate,
                                0, nullptr);
  // swr_alloc_set_opts2 copies the layouts
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);
  if (ret < 0) {
    swr_free(&swr_ctx_);
    throw ConversionError("[FFmpegCodecs] Failed to set resampler options " + AvError(ret));
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    swr_free(&swr_ctx_);
    throw ConversionError("[FFmpegCodecs] Failed to initialize resampler " + AvError(ret));
  }
  in_sample_rate_ = sample_rate;
  in_channels_ = channels;
}

std::vector<int16_t> FFmpegAudioResampler::Resample(const AudioBlock& block) {
  if (block.nb_samples <= 0) return {};
  if (block.channels <= 0 || block.sample_rate <= 0 ||
      block.samples.size() < static_cast<size_t>(block.nb_samples) * block.channels) {
    throw ConversionError("[FFmpegCodecs] invalid audio block for resample");
  }

  EnsureContext(block.sample_rate, block.channels);

  const int64_t delay = swr_get_delay(swr_ctx_, block.sample_rate);
  const int out_capacity = static_cast<int>(
      av_rescale_rnd(delay + block.nb_samples, kPcmSampleRate,
                     block.sample_rate, AV_ROUND_UP));

  std::vector<int16_t> out(static_cast<size_t>(out_capacity));
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out.data())};
  const uint8_t* in_data[1] = {reinterpret_cast<const uint8_t*>(block.samples.data())};

  int converted = swr_convert(swr_ctx_, out_data, out_capacity,
                              in_data, block.nb_samples);
  if (converted < 0) {
    throw ConversionError("[FFmpegCodecs] Audio resampling failed " + AvError(converted));
  }
  out.resize(static_cast<size_t>(converted));
  return out;
}

// =============================================================================
// FFmpegCodecFactory
// =============================================================================

FFmpegCodecFactory::FFmpegCodecFactory(const FFmpegCodecConfig& config)
    : config_(config) {
  QuietFFmpegLogs();
  if (config_.enable_hw_accel) {
    hw_ = ProbeHardwareAcceleration();
  }
}

FFmpegCodecFactory::~FFmpegCodecFactory() = default;

std::unique_ptr<IVideoDecoder> FFmpegCodecFactory::CreateVideoDecoder(CodecId codec) {
  return std::make_unique<FFmpegVideoDecoder>(
      codec, config_, config_.enable_hw_accel && hw_.available);
}

std::unique_ptr<IImageEncoder> FFmpegCodecFactory::CreateImageEncoder() {
  return std::make_unique<FFmpegJpegEncoder>(config_.jpeg_quality);
}

std::unique_ptr<IAudioDecoder> FFmpegCodecFactory::CreateAudioDecoder(CodecId codec) {
  return std::make_unique<FFmpegAudioDecoder>(codec);
}

std::unique_ptr<IAudioResampler> FFmpegCodecFactory::CreateAudioResampler(CodecId codec) {
  if (buffer::IsVideoCodec(codec)) {
    throw DecoderInitError(std::string("[FFmpegCodecs] no resampler for video codec ") +
                           buffer::CodecIdName(codec));
  }
  return std::make_unique<FFmpegAudioResampler>();
}

}  // namespace camgate::decode
