#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

#include "rcache/cache/cache_registry.hpp"
#include "rcache/cache/expiry_sweeper.hpp"
#include "rcache/config/resilience_config.hpp"
#include "rcache/foundation/cache_metrics.hpp"
#include "rcache/foundation/config_manager.hpp"
#include "rcache/foundation/manual_scheduler.hpp"
#include "rcache/handler/protected_handler.hpp"
#include "rcache/reliability/component_registry.hpp"

using namespace rcache;
using namespace rcache::cache;
using namespace rcache::foundation;
using namespace rcache::handler;
using namespace rcache::reliability;
using namespace std::chrono_literals;

namespace {

constexpr const char* kConfig = R"(
cache:
  default_ttl_ms: 60000
  sweep_interval_ms: 1000
retry:
  max_attempts: 3
  initial_backoff_ms: 100
  backoff_multiplier: 2.0
  max_backoff_ms: 1000
  jitter: false
circuit_breaker:
  failure_threshold: 2
  reset_timeout_ms: 10000
  success_threshold: 1
rate_limit:
  capacity: 50
  refill_per_second: 10
resources:
  pets:
    cache:
      default_ttl_ms: 5000
)";

using PetHandler = ProtectedHandler<std::string, std::string>;

// Pet service whose availability the test toggles.
struct PetService {
    int calls = 0;
    bool down = false;

    PetHandler::Fetch fetcher() {
        return [this](const std::string& key, Completion<std::string, FetchError> done) {
            ++calls;
            if (down) {
                done(Result<std::string, FetchError>::err(
                    CacheError(ErrorCode::UpstreamUnavailable, "pet service down")));
                return;
            }
            done(Result<std::string, FetchError>::ok("pet " + key));
        };
    }
};

// Wires every layer for the "pets" resource from kConfig.
class ResilientFetchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager manager;
        ASSERT_TRUE(manager.loadFromString(kConfig).hasValue());
        auto loaded = config::loadResilienceConfig(manager);
        ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
        settings_ = loaded.value().settingsFor("pets");

        ASSERT_TRUE((caches_.registerCache<std::string, std::string>(
                               "pets", settings_.cache.toPolicy()).hasValue()));
        cache_ = caches_.find<std::string, std::string>("pets").value();
        breaker_ = breakers_.getOrCreate(settings_.circuitBreaker);
        limiter_ = limiters_.getOrCreate(settings_.rateLimiter);

        handler_.emplace(*limiter_, *breaker_, *cache_, retry_,
                         RetryPolicy<FetchError>(settings_.retry, transientUpstreamErrors()),
                         HandlerOptions{.operationName = "get_pet"});
    }

    std::optional<PetHandler::Outcome> request(const std::string& key) {
        std::optional<PetHandler::Outcome> outcome;
        handler_->handle(key, service_.fetcher(),
                         [&outcome](PetHandler::Outcome r) { outcome = std::move(r); });
        // Let every pending retry timer fire.
        scheduler_.advance(1s);
        return outcome;
    }

    ManualClock clock_;
    ManualScheduler scheduler_{clock_};
    CacheMetrics metrics_;
    CacheRegistry caches_{clock_, metrics_};
    CircuitBreakerRegistry breakers_{clock_, metrics_};
    RateLimiterRegistry limiters_{clock_, metrics_};
    RetryExecutor retry_{scheduler_, metrics_};
    config::ResourceSettings settings_;
    std::shared_ptr<ResourceCache<std::string, std::string>> cache_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<RateLimiter> limiter_;
    std::optional<PetHandler> handler_;
    PetService service_;
};

}  // namespace

TEST_F(ResilientFetchTest, ResourceOverrideReachesCache) {
    EXPECT_EQ(cache_->policy().defaultTtl, 5s);
    EXPECT_EQ(breaker_->name(), "pets");
    EXPECT_EQ(breaker_->config().failureThreshold, 2u);
}

TEST_F(ResilientFetchTest, OutageAndRecovery) {
    // Warm the cache.
    auto first = request("pet:1");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->hasValue());
    EXPECT_EQ(first->value(), "pet pet:1");
    ASSERT_TRUE(request("pet:1")->hasValue());
    EXPECT_EQ(service_.calls, 1);

    // Two exhausted misses open the circuit.
    service_.down = true;
    auto failed = request("pet:2");
    ASSERT_TRUE(failed.has_value());
    ASSERT_TRUE(failed->hasError());
    EXPECT_TRUE(failed->error().isUpstream());
    EXPECT_EQ(service_.calls, 4);
    ASSERT_TRUE(request("pet:3")->hasError());
    EXPECT_EQ(service_.calls, 7);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Open);

    // Cached values keep being served; misses fail fast.
    auto cached = request("pet:1");
    ASSERT_TRUE(cached->hasValue());
    auto rejected = request("pet:4");
    ASSERT_TRUE(rejected->hasError());
    EXPECT_TRUE(rejected->error().isCircuitOpen());
    EXPECT_EQ(service_.calls, 7);

    // After the reset timeout a probe goes through and closes the circuit.
    service_.down = false;
    scheduler_.advance(10s);
    auto probe = request("pet:4");
    ASSERT_TRUE(probe->hasValue());
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(service_.calls, 8);

    // pet:1 expired during the outage and is fetched again.
    ASSERT_TRUE(request("pet:1")->hasValue());
    EXPECT_EQ(service_.calls, 9);

    EXPECT_EQ(metrics_.counterValue("rcache_circuit_transitions_total",
                                    {{"breaker", "pets"}, {"from", "closed"}, {"to", "open"}}),
              1.0);
    EXPECT_EQ(metrics_.counterValue("rcache_circuit_transitions_total",
                                    {{"breaker", "pets"}, {"from", "half_open"}, {"to", "closed"}}),
              1.0);
    EXPECT_EQ(metrics_.counterValue("rcache_circuit_rejected_total", {{"breaker", "pets"}}), 1.0);
    EXPECT_EQ(metrics_.counterValue("rcache_retry_exhausted_total", {{"operation", "get_pet"}}),
              2.0);
    EXPECT_EQ(metrics_.gaugeValue("rcache_circuit_state", {{"breaker", "pets"}}), 0.0);
}

TEST_F(ResilientFetchTest, StatsAndSweeperAcrossRegistry) {
    ASSERT_TRUE(request("pet:1")->hasValue());
    ASSERT_TRUE(request("pet:1")->hasValue());
    ASSERT_TRUE(request("pet:2")->hasValue());

    auto stats = caches_.aggregateStats().at("pets");
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_EQ(stats.entriesCreated, 2u);
    EXPECT_EQ(stats.size, 2u);

    ExpirySweeper sweeper(caches_, scheduler_, settings_.cache.sweepInterval);
    ASSERT_TRUE(sweeper.start().hasValue());
    scheduler_.advance(6s);
    EXPECT_EQ(cache_->size(), 0u);
    EXPECT_EQ(caches_.totalStats().evictions, 2u);
    EXPECT_EQ(metrics_.gaugeValue("rcache_cache_entries", {{"cache", "pets"}}), 0.0);
    sweeper.stop();
}

TEST_F(ResilientFetchTest, RateLimitShedsBurst) {
    ASSERT_TRUE(request("pet:1")->hasValue());

    // Hits complete inline, so the whole burst lands at one instant.
    int granted = 0;
    int limited = 0;
    for (int i = 0; i < 60; ++i) {
        handler_->handle("pet:1", service_.fetcher(), [&](PetHandler::Outcome outcome) {
            if (outcome.hasValue()) {
                ++granted;
            } else if (outcome.error().isRateLimited()) {
                ++limited;
            }
        });
    }
    // The refill during the warm-up second topped the bucket back up to 50.
    EXPECT_EQ(granted, 50);
    EXPECT_EQ(limited, 10);
    EXPECT_EQ(service_.calls, 1);
    EXPECT_EQ(metrics_.counterValue("rcache_rate_limited_total", {{"limiter", "pets"}}), 10.0);
}
