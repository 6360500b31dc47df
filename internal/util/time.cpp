#include "time.hpp"

namespace vesting::util {

uint64_t ToUnixSeconds(SystemTimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

uint64_t SystemClock::NowUnixSeconds() const {
  return ToUnixSeconds(std::chrono::system_clock::now());
}

} // namespace vesting::util
