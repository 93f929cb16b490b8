#include "../TenantRateLimiter.h"
#include <gtest/gtest.h>

using namespace pl;

class TenantRateLimiterTest : public ::testing::Test {
protected:
  TenantRateLimiter make(uint32_t maxEvents, int64_t windowSec = 60) {
    TenantRateLimiter::Config config;
    config.maxEvents = maxEvents;
    config.windowSec = windowSec;
    return TenantRateLimiter(config, [this] { return now_; });
  }

  int64_t now_{ 1000 };
};

TEST_F(TenantRateLimiterTest, AllowsUpToLimitInWindow) {
  auto limiter = make(3);
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_FALSE(limiter.tryAcquire(1));
  EXPECT_EQ(limiter.count(1), 3u);
}

TEST_F(TenantRateLimiterTest, TenantsAreIndependent) {
  auto limiter = make(1);
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_FALSE(limiter.tryAcquire(1));
  EXPECT_TRUE(limiter.tryAcquire(2));
  EXPECT_EQ(limiter.count(3), 0u);
}

TEST_F(TenantRateLimiterTest, WindowSlides) {
  auto limiter = make(2, 60);
  EXPECT_TRUE(limiter.tryAcquire(1));
  now_ += 30;
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_FALSE(limiter.tryAcquire(1));

  // The first event leaves the window, the second one stays
  now_ += 30;
  EXPECT_EQ(limiter.count(1), 1u);
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_FALSE(limiter.tryAcquire(1));
}

TEST_F(TenantRateLimiterTest, RefusedAttemptsAreNotCounted) {
  auto limiter = make(1, 60);
  EXPECT_TRUE(limiter.tryAcquire(1));
  for (int i = 0; i < 10; ++i) {
    now_ += 5;
    EXPECT_FALSE(limiter.tryAcquire(1));
  }
  now_ += 10;
  EXPECT_TRUE(limiter.tryAcquire(1));
}

TEST_F(TenantRateLimiterTest, ZeroDisablesTheLimit) {
  auto limiter = make(0);
  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(limiter.tryAcquire(1));
  }
  EXPECT_EQ(limiter.getTrackedTenantCount(), 0u);
}

TEST_F(TenantRateLimiterTest, PruneDropsIdleTenants) {
  auto limiter = make(5, 60);
  limiter.tryAcquire(1);
  now_ += 40;
  limiter.tryAcquire(2);
  EXPECT_EQ(limiter.getTrackedTenantCount(), 2u);

  now_ += 30;
  EXPECT_EQ(limiter.prune(), 1u);
  EXPECT_EQ(limiter.getTrackedTenantCount(), 1u);

  now_ += 60;
  EXPECT_EQ(limiter.prune(), 1u);
  EXPECT_EQ(limiter.getTrackedTenantCount(), 0u);
}

TEST_F(TenantRateLimiterTest, ReleaseReturnsTheSlot) {
  auto limiter = make(2, 60);
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_TRUE(limiter.tryAcquire(1));
  EXPECT_FALSE(limiter.tryAcquire(1));

  limiter.release(1);
  EXPECT_EQ(limiter.count(1), 1u);
  EXPECT_TRUE(limiter.tryAcquire(1));

  // Releasing an unknown tenant is a no-op
  limiter.release(9);
  EXPECT_EQ(limiter.getTrackedTenantCount(), 1u);
}
