#pragma once

#include <mutex>

namespace vesting::core {

/*
  Serializes mutating ledger operations on one mutex.

  A thread that is already inside an operation guarded by the same
  mutex (a token ledger calling back during a transfer) gets
  util::ReentrantCall instead of deadlocking on the mutex.
*/
class ReentrancyGuard {
 public:
  explicit ReentrancyGuard(std::mutex& mutex);
  ~ReentrancyGuard();

  ReentrancyGuard(const ReentrancyGuard&)            = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

 private:
  std::mutex&                  mutex_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace vesting::core
