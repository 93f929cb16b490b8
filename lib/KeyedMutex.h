#ifndef PAYLEDGER_KEYED_MUTEX_H
#define PAYLEDGER_KEYED_MUTEX_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pl {

/**
 * A set of mutexes addressed by string key, created on demand and released
 * when the last holder or waiter lets go. Used to serialize work on one
 * correlation id without a process-wide lock.
 */
class KeyedMutex {
  struct Slot {
    std::mutex mutex;
    size_t users{ 0 };
  };

public:
  class Guard {
  public:
    Guard(KeyedMutex &owner, const std::string &key)
        : owner_(&owner), key_(key), slot_(owner.acquire(key)) {
      slot_->mutex.lock();
    }

    ~Guard() {
      if (owner_) {
        slot_->mutex.unlock();
        owner_->release(key_);
      }
    }

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

    Guard(Guard &&other) noexcept
        : owner_(other.owner_), key_(std::move(other.key_)),
          slot_(std::move(other.slot_)) {
      other.owner_ = nullptr;
    }

  private:
    KeyedMutex *owner_;
    std::string key_;
    std::shared_ptr<Slot> slot_;
  };

  Guard lock(const std::string &key) { return Guard(*this, key); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
  }

private:
  std::shared_ptr<Slot> acquire(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &spSlot = slots_[key];
    if (!spSlot) {
      spSlot = std::make_shared<Slot>();
    }
    ++spSlot->users;
    return spSlot;
  }

  void release(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end() && --it->second->users == 0) {
      slots_.erase(it);
    }
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace pl

#endif // PAYLEDGER_KEYED_MUTEX_H
