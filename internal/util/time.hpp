#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace vesting::util {

/*
  Time utilities. Single place to control the clock source.

  All unlock arithmetic is a pure function of Clock::NowUnixSeconds().
*/

using SystemTimePoint = std::chrono::system_clock::time_point;

uint64_t ToUnixSeconds(SystemTimePoint tp);

class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t NowUnixSeconds() const = 0;
};

class SystemClock final : public Clock {
 public:
  uint64_t NowUnixSeconds() const override;
};

// Externally driven clock.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t now = 0) : now_(now) {
  }

  uint64_t NowUnixSeconds() const override {
    return now_.load();
  }

  void Set(uint64_t now) {
    now_.store(now);
  }

  void Advance(uint64_t seconds) {
    now_.fetch_add(seconds);
  }

 private:
  std::atomic<uint64_t> now_;
};

} // namespace vesting::util
