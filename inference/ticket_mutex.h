#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace infergate {

// Mutex that grants ownership in arrival order. Satisfies BasicLockable, so
// it works with std::lock_guard and std::unique_lock.
class TicketMutex {
public:
  TicketMutex() = default;
  TicketMutex(const TicketMutex &) = delete;
  TicketMutex &operator=(const TicketMutex &) = delete;

  void lock() {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&] { return serving_ == ticket; });
  }

  void unlock() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++serving_;
    }
    cv_.notify_all();
  }

  // Holders plus waiters.
  uint64_t queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_ - serving_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t next_ticket_{0};
  uint64_t serving_{0};
};

} // namespace infergate
