#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

#include "rcache/foundation/cache_metrics.hpp"
#include "rcache/reliability/concurrency_limiter.hpp"

using namespace rcache::foundation;
using namespace rcache::reliability;

TEST(ConcurrencyLimiterTest, GrantsUpToLimit) {
    CacheMetrics metrics;
    ConcurrencyLimiter limiter(2, "pets", metrics);

    auto a = limiter.tryAcquire();
    auto b = limiter.tryAcquire();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(limiter.inFlight(), 2u);

    auto c = limiter.tryAcquire();
    EXPECT_FALSE(c.has_value());
    EXPECT_EQ(limiter.rejectedCount(), 1u);
    EXPECT_DOUBLE_EQ(
        metrics.counterValue("rcache_concurrency_rejected_total", {{"limiter", "pets"}}), 1.0);
}

TEST(ConcurrencyLimiterTest, PermitReleasesOnDestruction) {
    ConcurrencyLimiter limiter(1);
    {
        auto permit = limiter.tryAcquire();
        ASSERT_TRUE(permit.has_value());
        EXPECT_FALSE(limiter.tryAcquire().has_value());
    }
    EXPECT_EQ(limiter.inFlight(), 0u);
    EXPECT_TRUE(limiter.tryAcquire().has_value());
}

TEST(ConcurrencyLimiterTest, ReleaseIsIdempotent) {
    ConcurrencyLimiter limiter(2);
    auto permit = limiter.tryAcquire();
    ASSERT_TRUE(permit.has_value());
    permit->release();
    permit->release();
    EXPECT_EQ(limiter.inFlight(), 0u);
}

TEST(ConcurrencyLimiterTest, MovedPermitReleasesOnce) {
    ConcurrencyLimiter limiter(1);
    auto permit = limiter.tryAcquire();
    ASSERT_TRUE(permit.has_value());

    std::vector<ConcurrencyLimiter::Permit> held;
    held.push_back(std::move(*permit));
    permit.reset();
    EXPECT_EQ(limiter.inFlight(), 1u);

    held.clear();
    EXPECT_EQ(limiter.inFlight(), 0u);
}

TEST(ConcurrencyLimiterTest, PermitMayOutliveLimiter) {
    std::optional<ConcurrencyLimiter::Permit> permit;
    {
        ConcurrencyLimiter limiter(1);
        permit = limiter.tryAcquire();
        ASSERT_TRUE(permit.has_value());
    }
    EXPECT_NO_THROW(permit.reset());
}

TEST(ConcurrencyLimiterTest, Accessors) {
    ConcurrencyLimiter limiter(16, "owners");
    EXPECT_EQ(limiter.maxConcurrent(), 16u);
    EXPECT_EQ(limiter.name(), "owners");
}
