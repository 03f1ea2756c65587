// Repository: Retrovue-camgate
// Component: DecodeWorker
// Purpose: Dedicated thread that drains FrameBuffer, decodes packets, gates
//          video cadence and hands JPEG/PCM payloads to the consumer loop.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_WORKER_DECODE_WORKER_HPP_
#define CAMGATE_WORKER_DECODE_WORKER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "camgate/buffer/FrameBuffer.hpp"
#include "camgate/buffer/FrameRecord.hpp"
#include "camgate/config/WorkerConfig.hpp"
#include "camgate/decode/ICodecFactory.hpp"
#include "camgate/runtime/CrossContextDispatcher.hpp"
#include "camgate/runtime/EventLoop.hpp"
#include "camgate/time/Clock.hpp"
#include "camgate/worker/BoundHandle.hpp"
#include "camgate/worker/RateGate.hpp"

namespace camgate::worker {

// CREATED → RUNNING → STOPPING → STOPPED. No path back to RUNNING.
enum class WorkerState {
  kCreated,
  kRunning,
  kStopping,
  kStopped,
};

const char* WorkerStateName(WorkerState state);

// Outcome of one loop iteration.
enum class StepResult {
  kNoData,        // Take() timed out (idle poll)
  kProcessed,     // One record consumed (emitted, gated, or dropped on error)
  kStopped,       // Stop requested or buffer shut down
  kTargetClosed,  // Consumer loop is closed; the worker loop ends
};

// DecodeWorkerStats tracks decode/emit outcomes. Cumulative since construction.
struct DecodeWorkerStats {
  uint64_t video_decoded;          // Pictures returned by the video decoder
  uint64_t video_emitted;          // JPEG payloads handed to the dispatcher
  uint64_t video_skipped_by_gate;  // Records decoded between emission ticks
  uint64_t video_empty_ticks;      // Emission ticks where decode yielded nothing
  uint64_t audio_batches_emitted;  // PCM buffers handed to the dispatcher
  uint64_t decode_errors;          // Includes codec mismatches
  uint64_t conversion_errors;
  uint64_t dispatch_failures;
  uint64_t decoder_init_failures;

  DecodeWorkerStats()
      : video_decoded(0),
        video_emitted(0),
        video_skipped_by_gate(0),
        video_empty_ticks(0),
        audio_batches_emitted(0),
        decode_errors(0),
        conversion_errors(0),
        dispatch_failures(0),
        decoder_init_failures(0) {}
};

// DecodeWorker bridges push-style producers and the pull-style consumer.
//
// Producers call PushVideoFrame/PushAudioFrame from any thread; both are
// non-blocking and never report errors. The worker thread owns the decoder
// handles and the RateGate. Payloads are delivered by posting to the
// consumer EventLoop; the worker never waits for a callback to run.
//
// Decoders bind lazily to the first codec seen per media kind and are never
// rebound. A later record with a different codec is a DecodeError.
//
// Errors below the loop (decode, conversion, dispatch) are logged and
// counted. Any other exception escaping an iteration is logged by the worker
// loop, which moves on to the next record unless the consumer loop is closed.
// The loop exits on Stop(), or when the consumer loop is closed.
class DecodeWorker {
 public:
  // Throws ConfigurationError if video_callback, loop or codecs is missing,
  // or if audio is enabled without an audio_callback.
  // clock defaults to SteadyClock.
  DecodeWorker(const config::DecodeWorkerConfig& config,
               std::shared_ptr<decode::ICodecFactory> codecs,
               std::shared_ptr<runtime::EventLoop> loop,
               runtime::PayloadCallback video_callback,
               runtime::PayloadCallback audio_callback = nullptr,
               std::shared_ptr<IClock> clock = nullptr);
  ~DecodeWorker();

  DecodeWorker(const DecodeWorker&) = delete;
  DecodeWorker& operator=(const DecodeWorker&) = delete;

  // Starts the worker thread. Returns false unless the state is CREATED.
  bool Start();

  // Shuts the buffer down, joins the thread, releases decoder handles.
  // Idempotent. A worker that never started goes straight to STOPPED.
  void Stop();

  // --- Producer API (any thread) ---

  void PushVideoFrame(buffer::FrameRecord record);
  // No-op when audio is disabled.
  void PushAudioFrame(buffer::FrameRecord record);

  // Runs one iteration on the calling thread. For driving a worker that was
  // not started (tests, single-threaded hosts); must not race the worker
  // thread.
  StepResult Step();

  WorkerState GetState() const { return state_.load(std::memory_order_acquire); }
  DecodeWorkerStats Stats() const;
  const buffer::FrameBuffer& Buffer() const { return buffer_; }
  const RateGate& Gate() const { return gate_; }

 private:
  void RunLoop();

  StepResult HandleVideo(buffer::FrameRecord& record);
  StepResult HandleAudio(buffer::FrameRecord& record);
  bool BindVideo(buffer::CodecId codec);
  bool BindAudio(buffer::CodecId codec);
  void ReleaseHandles();

  template <typename Field>
  void Count(Field field, uint64_t n = 1) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.*field += n;
  }

  const config::DecodeWorkerConfig config_;
  std::shared_ptr<decode::ICodecFactory> codecs_;
  std::shared_ptr<runtime::EventLoop> loop_;
  runtime::PayloadCallback video_callback_;
  runtime::PayloadCallback audio_callback_;

  buffer::FrameBuffer buffer_;
  runtime::CrossContextDispatcher dispatcher_;
  RateGate gate_;

  // Worker-thread state.
  BoundHandle<decode::IVideoDecoder> video_decoder_;
  std::unique_ptr<decode::IImageEncoder> image_encoder_;
  BoundHandle<decode::IAudioDecoder> audio_decoder_;
  BoundHandle<decode::IAudioResampler> resampler_;

  std::atomic<WorkerState> state_{WorkerState::kCreated};
  std::atomic<bool> stop_requested_{false};
  std::mutex lifecycle_mutex_;
  std::thread thread_;

  mutable std::mutex stats_mutex_;
  DecodeWorkerStats stats_;
};

}  // namespace camgate::worker

#endif  // CAMGATE_WORKER_DECODE_WORKER_HPP_
