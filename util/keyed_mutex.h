#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace infergate {

// One mutex per key, created on first use and dropped once nobody holds or
// waits on it.
class KeyedMutex {
public:
  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex &) = delete;
  KeyedMutex &operator=(const KeyedMutex &) = delete;

  // Holds the mutex for `key` for its lifetime.
  class Guard {
  public:
    Guard(KeyedMutex &owner, const std::string &key)
        : owner_(owner), key_(key), slot_(owner.Acquire(key)) {
      slot_->lock();
    }
    ~Guard() {
      slot_->unlock();
      owner_.Release(key_, slot_);
    }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

  private:
    KeyedMutex &owner_;
    std::string key_;
    std::shared_ptr<std::mutex> slot_;
  };

  // Keys with a holder or a waiter.
  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
  }

private:
  std::shared_ptr<std::mutex> Acquire(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = slots_[key];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    return slot;
  }

  void Release(const std::string &key, std::shared_ptr<std::mutex> &slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    // Two references left: the map's and the releasing guard's.
    if (it != slots_.end() && it->second == slot && slot.use_count() == 2) {
      slots_.erase(it);
    }
    slot.reset();
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<std::mutex>> slots_;
};

} // namespace infergate
