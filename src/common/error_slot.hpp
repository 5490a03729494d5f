// src/common/error_slot.hpp
// Single-assignment error mailbox shared between a worker thread and the
// thread that polls it. The first record() wins; later ones are dropped.

#pragma once
#include <atomic>
#include <exception>

namespace common {

class ErrorSlot {
public:
  void record(std::exception_ptr error) {
    bool expected = false;
    if (!claimed_.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel))
      return;
    error_ = std::move(error);
    ready_.store(true, std::memory_order_release);
  }

  bool has_error() const { return ready_.load(std::memory_order_acquire); }

  std::exception_ptr error() const {
    return ready_.load(std::memory_order_acquire) ? error_ : nullptr;
  }

private:
  std::atomic<bool> claimed_{false};
  std::atomic<bool> ready_{false};
  std::exception_ptr error_;
};

} // namespace common
