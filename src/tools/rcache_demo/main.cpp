/// @file main.cpp
/// @brief rcache demo entry point.
///
/// Wires a cache registry, circuit breaker, rate limiter and retry executor
/// from a YAML config around a simulated flaky upstream, issues a burst of
/// requests and prints cache statistics plus the metrics scrape.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rcache/cache/cache_registry.hpp"
#include "rcache/cache/expiry_sweeper.hpp"
#include "rcache/config/resilience_config.hpp"
#include "rcache/foundation/cache_logger.hpp"
#include "rcache/foundation/cache_metrics.hpp"
#include "rcache/foundation/config_manager.hpp"
#include "rcache/foundation/thread_pool_scheduler.hpp"
#include "rcache/handler/protected_handler.hpp"
#include "rcache/reliability/component_registry.hpp"

using namespace rcache;

namespace {

struct Pet {
    int id = 0;
    std::string name;
};

std::string parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return {};
}

// Upstream that answers after a short delay and fails every third call.
class FlakyPetApi {
public:
    explicit FlakyPetApi(foundation::Scheduler& scheduler) : scheduler_(scheduler) {}

    void getPet(const std::string& key, foundation::Completion<Pet, foundation::FetchError> done) {
        auto call = ++calls_;
        auto posted = scheduler_.postAfter(
            std::chrono::milliseconds(20), [call, key, done] {
                if (call % 3 == 0) {
                    done(Result<Pet, foundation::FetchError>::err(foundation::CacheError(
                        foundation::ErrorCode::UpstreamUnavailable, "pet service unavailable")));
                    return;
                }
                auto id = std::stoi(key.substr(key.find(':') + 1));
                done(Result<Pet, foundation::FetchError>::ok(Pet{id, "pet-" + std::to_string(id)}));
            });
        if (posted.hasError()) {
            done(Result<Pet, foundation::FetchError>::err(posted.error()));
        }
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    foundation::Scheduler& scheduler_;
    std::atomic<int> calls_{0};
};

} // namespace

int main(int argc, char* argv[]) {
    foundation::ConfigManager configManager;
    auto configPath = parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        auto loaded = configManager.load(configPath);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto resilience = config::loadResilienceConfig(configManager);
    if (!resilience) {
        std::cerr << "Invalid config: " << resilience.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto settings = resilience.value().settingsFor("pets");

    auto& clock = foundation::SteadyClock::instance();
    foundation::CacheMetrics metrics;
    foundation::ThreadPoolScheduler scheduler(4, "rcache_demo");

    cache::CacheRegistry caches(clock, metrics);
    auto registered = caches.registerCache<std::string, Pet>("pets", settings.cache.toPolicy());
    if (!registered) {
        std::cerr << "Failed to register cache: " << registered.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto pets = caches.find<std::string, Pet>("pets").value();

    std::optional<cache::ExpirySweeper> sweeper;
    if (settings.cache.sweepInterval.count() > 0) {
        sweeper.emplace(caches, scheduler, settings.cache.sweepInterval);
        auto started = sweeper->start();
        if (!started) {
            std::cerr << "Failed to start sweeper: " << started.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    reliability::CircuitBreakerRegistry breakers(clock, metrics);
    reliability::RateLimiterRegistry limiters(clock, metrics);
    auto breaker = breakers.getOrCreate(settings.circuitBreaker);
    auto limiter = limiters.getOrCreate(settings.rateLimiter);

    reliability::RetryExecutor retry(scheduler, metrics);
    handler::ProtectedHandler<std::string, Pet> handler(
        *limiter, *breaker, *pets, retry,
        reliability::RetryPolicy<foundation::FetchError>(
            settings.retry, reliability::transientUpstreamErrors()),
        {.operationName = "get_pet"});

    std::optional<reliability::ConcurrencyLimiter> concurrency;
    if (settings.concurrency.enabled) {
        concurrency.emplace(settings.concurrency.maxConcurrent, "pets", metrics);
        handler.setConcurrencyLimiter(&*concurrency);
    }

    FlakyPetApi api(scheduler);
    auto fetch = [&api](const std::string& key,
                        foundation::Completion<Pet, foundation::FetchError> done) {
        api.getPet(key, std::move(done));
    };

    // Two passes over the same keys: the second is served from the cache.
    std::vector<std::string> keys = {"pet:1", "pet:2", "pet:3", "pet:4", "pet:5"};
    for (int pass = 0; pass < 2; ++pass) {
        for (const auto& key : keys) {
            auto outcome = handler.handleFuture(key, fetch).get();
            if (outcome) {
                std::cout << key << " -> " << outcome.value().name << "\n";
            } else {
                std::cout << key << " -> error (" << outcome.error().kindName() << ")\n";
            }
        }
    }

    caches.publishMetrics();
    for (const auto& [name, stats] : caches.aggregateStats()) {
        std::cout << "cache " << name << ": hits=" << stats.hits
                  << " misses=" << stats.misses << " evictions=" << stats.evictions
                  << " size=" << stats.size << " hit_ratio=" << stats.hitRatio() << "\n";
    }
    std::cout << "upstream calls: " << api.calls() << "\n"
              << "circuit: " << reliability::toString(breaker->state()) << "\n\n"
              << metrics.scrape();

    if (sweeper) {
        sweeper->stop();
    }
    scheduler.shutdown();

    auto flushed = foundation::CacheLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
