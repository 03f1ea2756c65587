// Repository: Retrovue-camgate
// Component: Clock
// Purpose: Injectable millisecond clocks for emission cadence and timestamps.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_TIME_CLOCK_HPP_
#define CAMGATE_TIME_CLOCK_HPP_

#include <chrono>
#include <cstdint>

namespace camgate {

class IClock {
 public:
  virtual ~IClock() = default;
  virtual int64_t NowMs() const = 0;
};

// Monotonic. Default for RateGate so wall-clock steps cannot stall or
// burst snapshot emission.
class SteadyClock : public IClock {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  }
};

// UTC epoch milliseconds.
class SystemClock : public IClock {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace camgate

#endif  // CAMGATE_TIME_CLOCK_HPP_
