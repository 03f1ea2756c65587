// Repository: Retrovue-camgate
// Component: RateGate
// Purpose: Per-stream cadence limiter for decoded video output.
// Copyright (c) 2025 RetroVue

#include "camgate/worker/RateGate.hpp"

#include <utility>

#include "camgate/time/Clock.hpp"

namespace camgate::worker {

RateGate::RateGate(int64_t interval_ms, std::shared_ptr<IClock> clock)
    : interval_ms_(interval_ms),
      clock_(clock ? std::move(clock)
                               : std::make_shared<SteadyClock>()) {}

int64_t RateGate::Now() const {
  return clock_->NowMs();
}

bool RateGate::ShouldEmit(int64_t now_ms) const {
  if (interval_ms_ <= 0 || !last_emit_ms_) {
    return true;
  }
  return now_ms - *last_emit_ms_ >= interval_ms_;
}

void RateGate::MarkTick(int64_t now_ms) {
  last_emit_ms_ = now_ms;
}

}  // namespace camgate::worker
