#ifndef PAYLEDGER_TENANT_RATE_LIMITER_H
#define PAYLEDGER_TENANT_RATE_LIMITER_H

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace pl {

/**
 * Sliding-window event counter per tenant.
 * Events older than the window expire; prune() drops tenants whose window
 * has emptied so idle tenants cost nothing.
 */
class TenantRateLimiter {
public:
  using Clock = std::function<int64_t()>;

  struct Config {
    uint32_t maxEvents{ 0 }; // 0 disables the limit
    int64_t windowSec{ 900 };
  };

  explicit TenantRateLimiter(const Config &config);
  TenantRateLimiter(const Config &config, Clock clock);

  /**
   * Count an event for the tenant if the window has room.
   * @return false when the tenant is over its limit; nothing is counted then
   */
  bool tryAcquire(uint64_t tenantId);

  /** Give back the most recent event of the tenant, for attempts refused after acquiring */
  void release(uint64_t tenantId);

  /** Events of the tenant still inside the window */
  uint32_t count(uint64_t tenantId);

  /** @return Number of tenants dropped */
  size_t prune();

  size_t getTrackedTenantCount() const;

private:
  // Caller holds mutex_
  void expire(std::deque<int64_t> &events, int64_t now) const;

  Config config_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::map<uint64_t, std::deque<int64_t>> events_;
};

} // namespace pl

#endif // PAYLEDGER_TENANT_RATE_LIMITER_H
