#include "TenantRateLimiter.h"
#include "Utilities.h"

namespace pl {

TenantRateLimiter::TenantRateLimiter(const Config &config)
    : TenantRateLimiter(config, [] { return utl::getCurrentTime(); }) {}

TenantRateLimiter::TenantRateLimiter(const Config &config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

void TenantRateLimiter::expire(std::deque<int64_t> &events, int64_t now) const {
  while (!events.empty() && events.front() <= now - config_.windowSec) {
    events.pop_front();
  }
}

bool TenantRateLimiter::tryAcquire(uint64_t tenantId) {
  if (config_.maxEvents == 0) {
    return true;
  }
  int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto &events = events_[tenantId];
  expire(events, now);
  if (events.size() >= config_.maxEvents) {
    return false;
  }
  events.push_back(now);
  return true;
}

void TenantRateLimiter::release(uint64_t tenantId) {
  if (config_.maxEvents == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = events_.find(tenantId);
  if (it != events_.end() && !it->second.empty()) {
    it->second.pop_back();
  }
}

uint32_t TenantRateLimiter::count(uint64_t tenantId) {
  int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = events_.find(tenantId);
  if (it == events_.end()) {
    return 0;
  }
  expire(it->second, now);
  return static_cast<uint32_t>(it->second.size());
}

size_t TenantRateLimiter::prune() {
  int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t dropped = 0;
  for (auto it = events_.begin(); it != events_.end();) {
    expire(it->second, now);
    if (it->second.empty()) {
      it = events_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

size_t TenantRateLimiter::getTrackedTenantCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace pl
