// Repository: Retrovue-camgate
// Component: DecodeWorker
// Purpose: Decode loop, lazy codec binding, video gating, payload handoff.
// Copyright (c) 2025 RetroVue

#include "camgate/worker/DecodeWorker.hpp"

#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "camgate/util/Errors.hpp"
#include "camgate/util/Logger.hpp"

namespace camgate::worker {

using buffer::CodecId;
using buffer::CodecIdName;
using buffer::FrameRecord;
using buffer::MediaKind;
using camgate::util::Logger;

const char* WorkerStateName(WorkerState state) {
  switch (state) {
    case WorkerState::kCreated: return "CREATED";
    case WorkerState::kRunning: return "RUNNING";
    case WorkerState::kStopping: return "STOPPING";
    case WorkerState::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

namespace {

std::vector<uint8_t> PcmBytes(const std::vector<int16_t>& samples) {
  std::vector<uint8_t> bytes(samples.size() * sizeof(int16_t));
  if (!samples.empty()) {
    std::memcpy(bytes.data(), samples.data(), bytes.size());
  }
  return bytes;
}

}  // namespace

DecodeWorker::DecodeWorker(const config::DecodeWorkerConfig& config,
                           std::shared_ptr<decode::ICodecFactory> codecs,
                           std::shared_ptr<runtime::EventLoop> loop,
                           runtime::PayloadCallback video_callback,
                           runtime::PayloadCallback audio_callback,
                           std::shared_ptr<IClock> clock)
    : config_(config),
      codecs_(std::move(codecs)),
      loop_(std::move(loop)),
      video_callback_(std::move(video_callback)),
      audio_callback_(std::move(audio_callback)),
      buffer_(config.buffer_capacity),
      dispatcher_(loop_),
      gate_(config.frame_interval_ms, std::move(clock)) {
  if (!codecs_) {
    throw ConfigurationError("[DecodeWorker] codec factory is required");
  }
  if (!video_callback_) {
    throw ConfigurationError("[DecodeWorker] video_callback is required");
  }
  if (config_.enable_audio && !audio_callback_) {
    throw ConfigurationError("[DecodeWorker] audio_callback is required when audio is enabled");
  }

  std::ostringstream oss;
  oss << "[DecodeWorker] created interval_ms=" << config_.frame_interval_ms
      << " audio=" << (config_.enable_audio ? "on" : "off")
      << " capacity=" << buffer_.Capacity()
      << " take_timeout_ms=" << config_.take_timeout_ms;
  Logger::Info(oss.str());
}

DecodeWorker::~DecodeWorker() {
  Stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool DecodeWorker::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (state_.load(std::memory_order_acquire) != WorkerState::kCreated) {
    Logger::Warn(std::string("[DecodeWorker] Start ignored in state ") +
                 WorkerStateName(state_.load()));
    return false;
  }
  state_.store(WorkerState::kRunning, std::memory_order_release);
  thread_ = std::thread(&DecodeWorker::RunLoop, this);
  return true;
}

void DecodeWorker::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  WorkerState state = state_.load(std::memory_order_acquire);
  if (state == WorkerState::kStopped) return;

  if (state == WorkerState::kRunning) {
    state_.store(WorkerState::kStopping, std::memory_order_release);
  }
  stop_requested_.store(true, std::memory_order_release);
  buffer_.Shutdown();

  if (thread_.joinable()) {
    thread_.join();
  }
  // Handles belong to the worker thread; release only after it has exited.
  ReleaseHandles();
  state_.store(WorkerState::kStopped, std::memory_order_release);
  Logger::Info("[DecodeWorker] stopped");
}

void DecodeWorker::ReleaseHandles() {
  video_decoder_.Reset();
  image_encoder_.reset();
  audio_decoder_.Reset();
  resampler_.Reset();
}

void DecodeWorker::RunLoop() {
  Logger::Info("[DecodeWorker] started");
  while (!stop_requested_.load(std::memory_order_acquire)) {
    try {
      StepResult result = Step();
      if (result == StepResult::kStopped) break;
      if (result == StepResult::kTargetClosed) {
        Logger::Warn("[DecodeWorker] consumer loop closed, worker loop exiting");
        break;
      }
    } catch (const std::exception& e) {
      Logger::Error(std::string("[DecodeWorker] frame data handle error: ") + e.what());
      if (dispatcher_.TargetClosed()) {
        break;
      }
    }
  }
  Logger::Info("[DecodeWorker] decode loop exited");
}

// =============================================================================
// Producer API
// =============================================================================

void DecodeWorker::PushVideoFrame(FrameRecord record) {
  record.media_kind = MediaKind::kVideo;
  buffer_.PutVideo(std::move(record));
}

void DecodeWorker::PushAudioFrame(FrameRecord record) {
  if (!config_.enable_audio) return;
  record.media_kind = MediaKind::kAudio;
  buffer_.PutAudio(std::move(record));
}

// =============================================================================
// One iteration
// =============================================================================

StepResult DecodeWorker::Step() {
  if (stop_requested_.load(std::memory_order_acquire)) {
    return StepResult::kStopped;
  }

  std::optional<FrameRecord> record = buffer_.Take(config_.take_timeout_ms);
  if (!record) {
    return buffer_.IsShutdown() ? StepResult::kStopped : StepResult::kNoData;
  }
  // Records still in hand when Stop() lands are discarded, not decoded.
  if (stop_requested_.load(std::memory_order_acquire)) {
    return StepResult::kStopped;
  }

  if (record->media_kind == MediaKind::kVideo) {
    return HandleVideo(*record);
  }
  return HandleAudio(*record);
}

// =============================================================================
// Video path
// =============================================================================

bool DecodeWorker::BindVideo(CodecId codec) {
  try {
    std::unique_ptr<decode::IVideoDecoder> decoder = codecs_->CreateVideoDecoder(codec);
    std::unique_ptr<decode::IImageEncoder> encoder = codecs_->CreateImageEncoder();
    if (!decoder || !encoder) {
      throw DecoderInitError("codec factory returned no handle");
    }
    image_encoder_ = std::move(encoder);
    video_decoder_.Bind(codec, std::move(decoder));
  } catch (const DecodeError& e) {
    Count(&DecodeWorkerStats::decoder_init_failures);
    Logger::Error(std::string("[DecodeWorker] video decoder init failed codec=") +
                  CodecIdName(codec) + ": " + e.what());
    return false;
  }
  Logger::Info(std::string("[DecodeWorker] video decoder created, codec=") + CodecIdName(codec));
  return true;
}

StepResult DecodeWorker::HandleVideo(FrameRecord& record) {
  if (!video_decoder_.IsBound() && !BindVideo(record.codec_id)) {
    return StepResult::kProcessed;  // Record dropped; next video record retries
  }

  std::vector<decode::VideoPicture> pictures;
  try {
    if (!video_decoder_.Matches(record.codec_id)) {
      throw DecodeError(std::string("codec changed from ") +
                        CodecIdName(video_decoder_.Codec()) + " to " +
                        CodecIdName(record.codec_id));
    }
    pictures = video_decoder_->Decode(record.payload);
  } catch (const DecodeError& e) {
    Count(&DecodeWorkerStats::decode_errors);
    std::ostringstream oss;
    oss << "[DecodeWorker] video decode error ts=" << record.timestamp
        << " channel=" << record.channel << ": " << e.what();
    Logger::Error(oss.str());
    return StepResult::kProcessed;
  }
  Count(&DecodeWorkerStats::video_decoded, pictures.size());

  const int64_t now = gate_.Now();
  if (!gate_.ShouldEmit(now)) {
    Count(&DecodeWorkerStats::video_skipped_by_gate);
    return StepResult::kProcessed;
  }

  if (pictures.empty()) {
    // Missed tick: advance the gate, do not retry on the next record.
    Count(&DecodeWorkerStats::video_empty_ticks);
    std::ostringstream oss;
    oss << "[DecodeWorker] video frame is empty codec=" << CodecIdName(record.codec_id)
        << " ts=" << record.timestamp;
    Logger::Debug(oss.str());
    gate_.MarkTick(now);
    return StepResult::kProcessed;
  }

  std::vector<uint8_t> jpeg;
  try {
    jpeg = image_encoder_->Encode(pictures.front());
  } catch (const std::exception& e) {
    // Any encoder failure ends this frame, ConversionError or not.
    Count(&DecodeWorkerStats::conversion_errors);
    Logger::Error(std::string("[DecodeWorker] Failed to process video frame: ") + e.what());
    return StepResult::kProcessed;
  }

  if (!dispatcher_.Dispatch(MediaKind::kVideo, video_callback_, std::move(jpeg),
                            record.timestamp, record.channel)) {
    Count(&DecodeWorkerStats::dispatch_failures);
    return StepResult::kTargetClosed;
  }
  Count(&DecodeWorkerStats::video_emitted);
  gate_.MarkTick(now);
  return StepResult::kProcessed;
}

// =============================================================================
// Audio path
// =============================================================================

bool DecodeWorker::BindAudio(CodecId codec) {
  try {
    std::unique_ptr<decode::IAudioDecoder> decoder = codecs_->CreateAudioDecoder(codec);
    std::unique_ptr<decode::IAudioResampler> resampler = codecs_->CreateAudioResampler(codec);
    if (!decoder || !resampler) {
      throw DecoderInitError("codec factory returned no handle");
    }
    audio_decoder_.Bind(codec, std::move(decoder));
    resampler_.Bind(codec, std::move(resampler));
  } catch (const DecodeError& e) {
    Count(&DecodeWorkerStats::decoder_init_failures);
    Logger::Error(std::string("[DecodeWorker] audio decoder init failed codec=") +
                  CodecIdName(codec) + ": " + e.what());
    return false;
  }
  Logger::Info(std::string("[DecodeWorker] audio decoder created, codec=") + CodecIdName(codec));
  return true;
}

StepResult DecodeWorker::HandleAudio(FrameRecord& record) {
  if (!audio_decoder_.IsBound() && !BindAudio(record.codec_id)) {
    return StepResult::kProcessed;
  }

  std::vector<decode::AudioBlock> blocks;
  try {
    if (!audio_decoder_.Matches(record.codec_id)) {
      throw DecodeError(std::string("codec changed from ") +
                        CodecIdName(audio_decoder_.Codec()) + " to " +
                        CodecIdName(record.codec_id));
    }
    blocks = audio_decoder_->Decode(record.payload);
  } catch (const DecodeError& e) {
    Count(&DecodeWorkerStats::decode_errors);
    std::ostringstream oss;
    oss << "[DecodeWorker] audio decode error ts=" << record.timestamp
        << " channel=" << record.channel << ": " << e.what();
    Logger::Error(oss.str());
    return StepResult::kProcessed;
  }

  std::vector<int16_t> pcm;
  for (const decode::AudioBlock& block : blocks) {
    try {
      std::vector<int16_t> samples = resampler_->Resample(block);
      pcm.insert(pcm.end(), samples.begin(), samples.end());
    } catch (const std::exception& e) {
      Count(&DecodeWorkerStats::conversion_errors);
      Logger::Error(std::string("[DecodeWorker] audio resample failed: ") + e.what());
    }
  }

  // Audio is never gated; an empty batch is forwarded as-is.
  if (!dispatcher_.Dispatch(MediaKind::kAudio, audio_callback_, PcmBytes(pcm),
                            record.timestamp, record.channel)) {
    Count(&DecodeWorkerStats::dispatch_failures);
    return StepResult::kTargetClosed;
  }
  Count(&DecodeWorkerStats::audio_batches_emitted);
  return StepResult::kProcessed;
}

DecodeWorkerStats DecodeWorker::Stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

}  // namespace camgate::worker
