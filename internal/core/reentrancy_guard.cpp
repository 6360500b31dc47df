#include "reentrancy_guard.hpp"

#include <algorithm>
#include <vector>

#include "internal/util/errors.hpp"

namespace vesting::core {

namespace {

// Mutexes the current thread holds through a ReentrancyGuard.
thread_local std::vector<const std::mutex*> t_entered;

} // namespace

ReentrancyGuard::ReentrancyGuard(std::mutex& mutex) : mutex_(mutex) {
  if (std::find(t_entered.begin(), t_entered.end(), &mutex_) != t_entered.end()) {
    throw util::ReentrantCall("ledger operation already in progress on this thread");
  }
  lock_ = std::unique_lock<std::mutex>(mutex_);
  t_entered.push_back(&mutex_);
}

ReentrancyGuard::~ReentrancyGuard() {
  t_entered.erase(std::find(t_entered.begin(), t_entered.end(), &mutex_));
}

} // namespace vesting::core
