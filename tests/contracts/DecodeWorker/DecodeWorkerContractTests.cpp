// Repository: Retrovue-camgate
// Component: DecodeWorker Contract Tests
// Purpose: Lazy binding, video gating, audio pass-through, error tolerance,
//          lifecycle and shutdown behavior of the decode worker.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "camgate/config/WorkerConfig.hpp"
#include "camgate/runtime/EventLoop.hpp"
#include "camgate/util/Errors.hpp"
#include "camgate/worker/DecodeWorker.hpp"
#include "../../fixtures/FakeCodecFactory.h"
#include "../../support/ManualClock.hpp"
#include "../../support/WaitFor.hpp"

namespace camgate::worker::testing {
namespace {

using buffer::CodecId;
using buffer::FrameRecord;
using buffer::MediaKind;
using camgate::tests::WaitFor;
using camgate::tests::fixtures::FakeCodecFactory;
using camgate::tests::fixtures::kPayloadCorrupt;
using camgate::tests::fixtures::kPayloadEmpty;
using camgate::tests::fixtures::kPayloadFault;
using camgate::tests::fixtures::kPayloadPicture;
using camgate::tests::fixtures::kPayloadTwoPictures;

struct Delivery {
  std::vector<uint8_t> payload;
  int64_t timestamp;
  int channel;
  bool on_loop_thread;
};

// Records deliveries made on the consumer loop.
class Collector {
 public:
  explicit Collector(std::shared_ptr<runtime::EventLoop> loop) : loop_(std::move(loop)) {}

  runtime::PayloadCallback Video() {
    return [this](const std::vector<uint8_t>& p, int64_t ts, int ch) {
      std::lock_guard<std::mutex> lock(mutex_);
      video_.push_back({p, ts, ch, loop_->IsLoopThread()});
    };
  }
  runtime::PayloadCallback Audio() {
    return [this](const std::vector<uint8_t>& p, int64_t ts, int ch) {
      std::lock_guard<std::mutex> lock(mutex_);
      audio_.push_back({p, ts, ch, loop_->IsLoopThread()});
    };
  }

  size_t VideoCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return video_.size();
  }
  size_t AudioCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return audio_.size();
  }
  std::vector<Delivery> VideoDeliveries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return video_;
  }
  std::vector<Delivery> AudioDeliveries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return audio_;
  }

 private:
  std::shared_ptr<runtime::EventLoop> loop_;
  std::mutex mutex_;
  std::vector<Delivery> video_;
  std::vector<Delivery> audio_;
};

static FrameRecord MakeVideo(int64_t ts, uint8_t marker = kPayloadPicture,
                             CodecId codec = CodecId::kH264, bool keyframe = true) {
  FrameRecord r;
  r.media_kind = MediaKind::kVideo;
  r.codec_id = codec;
  r.payload = {marker, 0x00, 0x00, 0x01};
  r.timestamp = ts;
  r.channel = 2;
  r.is_keyframe = keyframe;
  return r;
}

static FrameRecord MakeAudio(int64_t ts, size_t samples, uint8_t marker = kPayloadPicture,
                             CodecId codec = CodecId::kPcmA) {
  FrameRecord r;
  r.media_kind = MediaKind::kAudio;
  r.codec_id = codec;
  if (samples > 0) {
    r.payload.assign(samples, 0x55);
    r.payload[0] = marker;
  }
  r.timestamp = ts;
  r.channel = 2;
  return r;
}

class DecodeWorkerContract : public ::testing::Test {
 protected:
  void SetUp() override {
    loop_ = std::make_shared<runtime::EventLoop>();
    loop_->RunInBackground();
    clock_ = std::make_shared<ManualClock>(1'000'000);
    codecs_ = std::make_shared<FakeCodecFactory>();
    collector_ = std::make_unique<Collector>(loop_);
    config_.frame_interval_ms = 1000;
    config_.take_timeout_ms = 10;
  }

  void TearDown() override {
    worker_.reset();
    loop_->Stop();
  }

  DecodeWorker& MakeWorker() {
    worker_ = std::make_unique<DecodeWorker>(config_, codecs_, loop_,
                                             collector_->Video(), collector_->Audio(),
                                             clock_);
    return *worker_;
  }

  std::shared_ptr<runtime::EventLoop> loop_;
  std::shared_ptr<ManualClock> clock_;
  std::shared_ptr<FakeCodecFactory> codecs_;
  std::unique_ptr<Collector> collector_;
  config::DecodeWorkerConfig config_;
  std::unique_ptr<DecodeWorker> worker_;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(DecodeWorkerContract, AudioEnabledWithoutAudioCallbackThrows) {
  config_.enable_audio = true;
  EXPECT_THROW(DecodeWorker(config_, codecs_, loop_, collector_->Video(), nullptr, clock_),
               ConfigurationError);
}

TEST_F(DecodeWorkerContract, MissingCollaboratorsThrow) {
  EXPECT_THROW(DecodeWorker(config_, codecs_, loop_, nullptr, collector_->Audio(), clock_),
               ConfigurationError);
  EXPECT_THROW(DecodeWorker(config_, nullptr, loop_, collector_->Video(), collector_->Audio(), clock_),
               ConfigurationError);
  EXPECT_THROW(DecodeWorker(config_, codecs_, nullptr, collector_->Video(), collector_->Audio(), clock_),
               ConfigurationError);
}

TEST_F(DecodeWorkerContract, AudioDisabledIgnoresAudioPushes) {
  config_.enable_audio = false;
  worker_ = std::make_unique<DecodeWorker>(config_, codecs_, loop_, collector_->Video(),
                                           nullptr, clock_);
  worker_->PushAudioFrame(MakeAudio(1, 160));

  EXPECT_EQ(worker_->Buffer().AudioDepth(), 0u);
  EXPECT_EQ(worker_->Step(), StepResult::kNoData);
  EXPECT_EQ(codecs_->State().audio_decoders_created.load(), 0);
}

TEST_F(DecodeWorkerContract, BufferCapacityComesFromConfig) {
  config_.buffer_capacity = 7;
  DecodeWorker& worker = MakeWorker();
  EXPECT_EQ(worker.Buffer().Capacity(), 7u);
}

// =============================================================================
// Video gating
// =============================================================================

TEST_F(DecodeWorkerContract, FirstDecodedFrameEmitsJpeg) {
  DecodeWorker& worker = MakeWorker();
  worker.PushVideoFrame(MakeVideo(500));

  EXPECT_EQ(worker.Step(), StepResult::kProcessed);
  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));

  Delivery d = collector_->VideoDeliveries().front();
  ASSERT_GE(d.payload.size(), 4u);
  EXPECT_EQ(d.payload[0], 0xFF);
  EXPECT_EQ(d.payload[1], 0xD8);
  EXPECT_EQ(d.timestamp, 500);
  EXPECT_EQ(d.channel, 2);
  EXPECT_TRUE(d.on_loop_thread);
  EXPECT_EQ(worker.Stats().video_emitted, 1u);
  EXPECT_EQ(worker.Gate().LastEmitMs().value(), clock_->NowMs());
}

// 10 decodable records within 100 ms against a 1000 ms interval.
TEST_F(DecodeWorkerContract, BurstWithinIntervalEmitsAtMostOnce) {
  DecodeWorker& worker = MakeWorker();
  for (int i = 0; i < 10; i++) {
    worker.PushVideoFrame(MakeVideo(i * 10));
  }
  ASSERT_TRUE(worker.Start());

  ASSERT_TRUE(WaitFor([&] { return codecs_->State().video_decode_calls.load() == 10; }));
  ASSERT_TRUE(WaitFor([&] { return worker.Stats().video_skipped_by_gate == 9; }));
  worker.Stop();

  EXPECT_LE(collector_->VideoCount(), 1u);
  auto stats = worker.Stats();
  EXPECT_EQ(stats.video_emitted, 1u);
  EXPECT_EQ(stats.video_decoded, 10u) << "gated frames are still decoded";
  EXPECT_EQ(codecs_->State().encode_calls.load(), 1);
}

TEST_F(DecodeWorkerContract, GateReopensAfterInterval) {
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1));
  worker.Step();
  clock_->AdvanceMs(999);
  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();
  clock_->AdvanceMs(1);
  worker.PushVideoFrame(MakeVideo(3));
  worker.Step();

  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 2; }));
  auto deliveries = collector_->VideoDeliveries();
  EXPECT_EQ(deliveries[0].timestamp, 1);
  EXPECT_EQ(deliveries[1].timestamp, 3);
  EXPECT_EQ(worker.Stats().video_skipped_by_gate, 1u);
}

TEST_F(DecodeWorkerContract, OnlyFirstPictureOfATickIsConverted) {
  DecodeWorker& worker = MakeWorker();
  worker.PushVideoFrame(MakeVideo(1, kPayloadTwoPictures));
  worker.Step();

  EXPECT_EQ(worker.Stats().video_decoded, 2u);
  EXPECT_EQ(codecs_->State().encode_calls.load(), 1);
}

// An emission tick with no decoded picture advances the gate; the next
// record inside the interval is not emitted.
TEST_F(DecodeWorkerContract, EmptyDecodeAtTickAdvancesGate) {
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1, kPayloadEmpty));
  worker.Step();
  EXPECT_EQ(worker.Stats().video_empty_ticks, 1u);
  EXPECT_TRUE(worker.Gate().LastEmitMs().has_value());

  clock_->AdvanceMs(10);
  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();
  EXPECT_EQ(worker.Stats().video_emitted, 0u);
  EXPECT_EQ(worker.Stats().video_skipped_by_gate, 1u);

  clock_->AdvanceMs(1000);
  worker.PushVideoFrame(MakeVideo(3));
  worker.Step();
  EXPECT_EQ(worker.Stats().video_emitted, 1u);
}

// =============================================================================
// Error tolerance
// =============================================================================

TEST_F(DecodeWorkerContract, DecoderInitFailureDropsRecordAndRetries) {
  codecs_->State().fail_video_init.store(1);
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1));
  EXPECT_EQ(worker.Step(), StepResult::kProcessed);
  EXPECT_EQ(worker.Stats().decoder_init_failures, 1u);
  EXPECT_EQ(codecs_->State().video_decoders_created.load(), 0);
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 0);

  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();
  EXPECT_EQ(codecs_->State().video_decoders_created.load(), 1);
  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));
  EXPECT_EQ(collector_->VideoDeliveries().front().timestamp, 2);
}

TEST_F(DecodeWorkerContract, CodecChangeIsDecodeErrorAndKeepsBinding) {
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1, kPayloadPicture, CodecId::kH264));
  worker.Step();
  worker.PushVideoFrame(MakeVideo(2, kPayloadPicture, CodecId::kH265));
  worker.Step();

  EXPECT_EQ(worker.Stats().decode_errors, 1u);
  EXPECT_EQ(codecs_->State().video_decoders_created.load(), 1);
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 1);

  clock_->AdvanceMs(1000);
  worker.PushVideoFrame(MakeVideo(3, kPayloadPicture, CodecId::kH264));
  worker.Step();
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 2);
  EXPECT_EQ(worker.Stats().video_emitted, 2u);
}

TEST_F(DecodeWorkerContract, CorruptPacketIsCountedAndLoopContinues) {
  DecodeWorker& worker = MakeWorker();
  worker.PushVideoFrame(MakeVideo(1, kPayloadCorrupt));
  worker.PushVideoFrame(MakeVideo(2));
  ASSERT_TRUE(worker.Start());

  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));
  worker.Stop();

  EXPECT_EQ(worker.Stats().decode_errors, 1u);
  EXPECT_EQ(collector_->VideoDeliveries().front().timestamp, 2);
}

TEST_F(DecodeWorkerContract, ConversionErrorSkipsFrameWithoutAdvancingGate) {
  codecs_->State().fail_encode.store(1);
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1));
  EXPECT_EQ(worker.Step(), StepResult::kProcessed);
  EXPECT_EQ(worker.Stats().conversion_errors, 1u);
  EXPECT_FALSE(worker.Gate().LastEmitMs().has_value());

  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();
  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));
  EXPECT_EQ(collector_->VideoDeliveries().front().timestamp, 2);
}

// A non-ConversionError encoder failure is still a conversion error: counted,
// logged, and Step() returns normally.
TEST_F(DecodeWorkerContract, EncoderFaultIsCountedAsConversionError) {
  codecs_->State().fault_encode.store(1);
  DecodeWorker& worker = MakeWorker();

  worker.PushVideoFrame(MakeVideo(1));
  StepResult result = StepResult::kNoData;
  EXPECT_NO_THROW(result = worker.Step());
  EXPECT_EQ(result, StepResult::kProcessed);
  EXPECT_EQ(worker.Stats().conversion_errors, 1u);
  EXPECT_FALSE(worker.Gate().LastEmitMs().has_value());

  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();
  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));
  EXPECT_EQ(collector_->VideoDeliveries().front().timestamp, 2);
}

TEST_F(DecodeWorkerContract, ResamplerFaultSkipsOnlyThatBlock) {
  codecs_->State().fault_resample.store(1);
  DecodeWorker& worker = MakeWorker();
  worker.PushAudioFrame(MakeAudio(1, 80, kPayloadTwoPictures));

  EXPECT_NO_THROW(worker.Step());
  ASSERT_TRUE(WaitFor([&] { return collector_->AudioCount() == 1; }));
  EXPECT_EQ(collector_->AudioDeliveries().front().payload.size(), 80u * 2 * 2);
  EXPECT_EQ(worker.Stats().conversion_errors, 1u);
}

// =============================================================================
// Worker loop fault tolerance
// =============================================================================

// A decoder fault outside the DecodeError taxonomy escapes Step() to the
// caller; the worker loop is the layer that absorbs it.
TEST_F(DecodeWorkerContract, UnclassifiedDecoderFaultEscapesStep) {
  DecodeWorker& worker = MakeWorker();
  worker.PushVideoFrame(MakeVideo(1, kPayloadFault));
  EXPECT_THROW(worker.Step(), std::runtime_error);
  EXPECT_EQ(worker.Stats().decode_errors, 0u);
}

TEST_F(DecodeWorkerContract, WorkerLoopSurvivesUnclassifiedFault) {
  DecodeWorker& worker = MakeWorker();
  worker.PushVideoFrame(MakeVideo(1, kPayloadFault));
  worker.PushVideoFrame(MakeVideo(2));
  ASSERT_TRUE(worker.Start());

  ASSERT_TRUE(WaitFor([&] { return collector_->VideoCount() == 1; }));
  EXPECT_EQ(collector_->VideoDeliveries().front().timestamp, 2);
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 2);
  EXPECT_EQ(worker.GetState(), WorkerState::kRunning);

  worker.Stop();
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
}

TEST_F(DecodeWorkerContract, WorkerLoopExitsOnFaultOnceConsumerLoopClosed) {
  DecodeWorker& worker = MakeWorker();
  loop_->Stop();
  ASSERT_TRUE(worker.Start());

  worker.PushVideoFrame(MakeVideo(1, kPayloadFault));
  ASSERT_TRUE(WaitFor([&] { return codecs_->State().video_decode_calls.load() == 1; }));

  // The loop has exited: later records are never taken or decoded.
  worker.PushVideoFrame(MakeVideo(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 1);
  EXPECT_EQ(worker.Buffer().VideoDepth(), 1u);
  EXPECT_EQ(worker.Stats().dispatch_failures, 0u);

  worker.Stop();
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
}

// =============================================================================
// Audio path
// =============================================================================

TEST_F(DecodeWorkerContract, AudioIsForwardedForEveryBatch) {
  DecodeWorker& worker = MakeWorker();
  for (int i = 0; i < 5; i++) {
    worker.PushAudioFrame(MakeAudio(i, 160));
  }
  for (int i = 0; i < 5; i++) {
    EXPECT_EQ(worker.Step(), StepResult::kProcessed);
  }

  ASSERT_TRUE(WaitFor([&] { return collector_->AudioCount() == 5; }));
  auto deliveries = collector_->AudioDeliveries();
  for (int i = 0; i < 5; i++) {
    // 160 samples at 8 kHz → 320 samples at 16 kHz, 2 bytes each.
    EXPECT_EQ(deliveries[i].payload.size(), 640u);
    EXPECT_EQ(deliveries[i].timestamp, i);
    EXPECT_TRUE(deliveries[i].on_loop_thread);
  }
  EXPECT_EQ(worker.Stats().audio_batches_emitted, 5u);
  EXPECT_EQ(codecs_->State().audio_decoders_created.load(), 1);
  EXPECT_EQ(codecs_->State().resamplers_created.load(), 1);
}

TEST_F(DecodeWorkerContract, EmptyAudioDecodeIsStillForwarded) {
  DecodeWorker& worker = MakeWorker();
  worker.PushAudioFrame(MakeAudio(9, 0));
  worker.Step();

  ASSERT_TRUE(WaitFor([&] { return collector_->AudioCount() == 1; }));
  EXPECT_TRUE(collector_->AudioDeliveries().front().payload.empty());
}

TEST_F(DecodeWorkerContract, ResampleFailureSkipsOnlyThatBlock) {
  codecs_->State().fail_resample.store(1);
  DecodeWorker& worker = MakeWorker();
  worker.PushAudioFrame(MakeAudio(1, 80, kPayloadTwoPictures));
  worker.Step();

  ASSERT_TRUE(WaitFor([&] { return collector_->AudioCount() == 1; }));
  EXPECT_EQ(collector_->AudioDeliveries().front().payload.size(), 80u * 2 * 2);
  EXPECT_EQ(worker.Stats().conversion_errors, 1u);
}

TEST_F(DecodeWorkerContract, VideoCodecOnAudioPathFailsInit) {
  DecodeWorker& worker = MakeWorker();
  worker.PushAudioFrame(MakeAudio(1, 10, kPayloadPicture, CodecId::kH264));
  worker.Step();

  EXPECT_EQ(worker.Stats().decoder_init_failures, 1u);
  EXPECT_EQ(worker.Stats().audio_batches_emitted, 0u);
}

TEST_F(DecodeWorkerContract, VideoIsServedBeforeAudio) {
  DecodeWorker& worker = MakeWorker();
  worker.PushAudioFrame(MakeAudio(1, 10));
  worker.PushVideoFrame(MakeVideo(2));
  worker.Step();

  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 1);
  EXPECT_EQ(codecs_->State().audio_decode_calls.load(), 0);
}

// =============================================================================
// Consumer loop closed
// =============================================================================

TEST_F(DecodeWorkerContract, StepReportsTargetClosed) {
  DecodeWorker& worker = MakeWorker();
  loop_->Stop();

  worker.PushVideoFrame(MakeVideo(1));
  EXPECT_EQ(worker.Step(), StepResult::kTargetClosed);
  EXPECT_EQ(worker.Stats().dispatch_failures, 1u);
  EXPECT_EQ(worker.Stats().video_emitted, 0u);
}

TEST_F(DecodeWorkerContract, WorkerLoopExitsWhenConsumerLoopCloses) {
  DecodeWorker& worker = MakeWorker();
  ASSERT_TRUE(worker.Start());
  loop_->Stop();

  worker.PushAudioFrame(MakeAudio(1, 10));
  ASSERT_TRUE(WaitFor([&] { return worker.Stats().dispatch_failures == 1; }));

  worker.PushAudioFrame(MakeAudio(2, 10));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(codecs_->State().audio_decode_calls.load(), 1);

  worker.Stop();
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(DecodeWorkerContract, LifecycleIsOneWay) {
  DecodeWorker& worker = MakeWorker();
  EXPECT_EQ(worker.GetState(), WorkerState::kCreated);

  ASSERT_TRUE(worker.Start());
  EXPECT_EQ(worker.GetState(), WorkerState::kRunning);
  EXPECT_FALSE(worker.Start());

  worker.Stop();
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
  worker.Stop();  // Idempotent
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
  EXPECT_FALSE(worker.Start());
}

TEST_F(DecodeWorkerContract, StopBeforeStartGoesStraightToStopped) {
  DecodeWorker& worker = MakeWorker();
  worker.Stop();
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);
  EXPECT_EQ(worker.Step(), StepResult::kStopped);
}

// Stop() while the worker is blocked in Take().
TEST_F(DecodeWorkerContract, StopWhileBlockedExitsWithoutDecoding) {
  config_.take_timeout_ms = 5000;
  DecodeWorker& worker = MakeWorker();
  ASSERT_TRUE(worker.Start());
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  auto start = std::chrono::steady_clock::now();
  worker.Stop();
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::seconds(2)) << "Stop must not wait out the Take timeout";
  EXPECT_EQ(worker.GetState(), WorkerState::kStopped);

  worker.PushVideoFrame(MakeVideo(1));
  worker.PushAudioFrame(MakeAudio(1, 10));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 0);
  EXPECT_EQ(codecs_->State().audio_decode_calls.load(), 0);
  EXPECT_EQ(collector_->VideoCount(), 0u);
}

TEST_F(DecodeWorkerContract, StopDiscardsBufferedRecords) {
  DecodeWorker& worker = MakeWorker();
  for (int i = 0; i < 5; i++) worker.PushVideoFrame(MakeVideo(i));

  worker.Stop();

  EXPECT_EQ(worker.Buffer().VideoDepth(), 0u);
  EXPECT_EQ(codecs_->State().video_decode_calls.load(), 0);
}

}  // namespace
}  // namespace camgate::worker::testing
