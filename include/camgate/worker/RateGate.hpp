// Repository: Retrovue-camgate
// Component: RateGate
// Purpose: Per-stream cadence limiter for decoded video output.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_WORKER_RATE_GATE_HPP_
#define CAMGATE_WORKER_RATE_GATE_HPP_

#include <cstdint>
#include <memory>
#include <optional>

#include "camgate/time/Clock.hpp"

namespace camgate::worker {

// RateGate answers "may the worker emit a video payload now?".
//
// The first tick always passes. After MarkTick(t), ShouldEmit(now) is true
// only once now - t >= interval_ms. An interval <= 0 lets every tick pass.
//
// Not thread-safe: owned and mutated by the decode worker thread only.
class RateGate {
 public:
  RateGate(int64_t interval_ms, std::shared_ptr<IClock> clock);

  int64_t IntervalMs() const { return interval_ms_; }

  // Reads the injected clock.
  int64_t Now() const;

  bool ShouldEmit(int64_t now_ms) const;

  // Advances lastEmitTimestamp. Called once per allowed tick, whether or not
  // the tick produced a payload.
  void MarkTick(int64_t now_ms);

  std::optional<int64_t> LastEmitMs() const { return last_emit_ms_; }

 private:
  const int64_t interval_ms_;
  std::shared_ptr<IClock> clock_;
  std::optional<int64_t> last_emit_ms_;
};

}  // namespace camgate::worker

#endif  // CAMGATE_WORKER_RATE_GATE_HPP_
