/// @file resilience_config.cpp
/// @brief Loading and validation of ResilienceConfig.

#include "rcache/config/resilience_config.hpp"

#include <limits>
#include <optional>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::config {

using foundation::CacheError;
using foundation::CacheResult;
using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

// Reads keys below one prefix into existing fields, leaving a field
// untouched when its key is absent. The first error sticks; later reads
// become no-ops.
class SectionReader {
public:
    SectionReader(const ConfigManager& config, std::string prefix)
        : config_(config), prefix_(std::move(prefix)) {}

    void boolean(std::string_view key, bool& out) {
        read<bool>(key, [&out](bool v) { out = v; return true; });
    }

    void real(std::string_view key, double& out) {
        read<double>(key, [&out](double v) { out = v; return true; });
    }

    void millis(std::string_view key, std::chrono::milliseconds& out) {
        read<int64_t>(key, [&out](int64_t v) {
            out = std::chrono::milliseconds(v);
            return true;
        });
    }

    void count(std::string_view key, uint32_t& out) {
        read<int64_t>(key, [&out](int64_t v) {
            if (v < 0 || v > std::numeric_limits<uint32_t>::max()) {
                return false;
            }
            out = static_cast<uint32_t>(v);
            return true;
        });
    }

    void size(std::string_view key, std::size_t& out) {
        read<int64_t>(key, [&out](int64_t v) {
            if (v < 0) {
                return false;
            }
            out = static_cast<std::size_t>(v);
            return true;
        });
    }

    void text(std::string_view key, std::string& out) {
        read<std::string>(key, [&out](std::string v) { out = std::move(v); return true; });
    }

    [[nodiscard]] const CacheResult<void>& status() const { return status_; }

private:
    template <typename T, typename Apply>
    void read(std::string_view key, Apply&& apply) {
        if (status_.hasError()) {
            return;
        }
        auto full = prefix_ + std::string(key);
        if (!config_.hasKey(full)) {
            return;
        }
        auto value = config_.get<T>(full);
        if (value.hasError()) {
            status_ = CacheResult<void>::err(value.error());
            return;
        }
        if (!apply(std::move(value).value())) {
            status_ = CacheResult<void>::err(
                CacheError(ErrorCode::ConfigInvalidValue, "value out of range: " + full));
        }
    }

    const ConfigManager& config_;
    std::string prefix_;
    CacheResult<void> status_ = CacheResult<void>::ok();
};

// Overlay every section found under @p prefix onto @p settings.
CacheResult<void> readSettings(const ConfigManager& config, const std::string& prefix,
                               ResourceSettings& settings) {
    SectionReader cache(config, prefix + "cache.");
    cache.boolean("enabled", settings.cache.enabled);
    cache.millis("default_ttl_ms", settings.cache.defaultTtl);
    cache.size("max_capacity", settings.cache.maxCapacity);
    cache.boolean("coalesce_fetches", settings.cache.coalesceFetches);
    cache.millis("sweep_interval_ms", settings.cache.sweepInterval);
    if (cache.status().hasError()) {
        return cache.status();
    }

    SectionReader retry(config, prefix + "retry.");
    bool retryEnabled = true;
    retry.boolean("enabled", retryEnabled);
    retry.count("max_attempts", settings.retry.maxAttempts);
    retry.millis("initial_backoff_ms", settings.retry.initialBackoff);
    retry.real("backoff_multiplier", settings.retry.backoffMultiplier);
    retry.millis("max_backoff_ms", settings.retry.maxBackoff);
    retry.boolean("jitter", settings.retry.jitterEnabled);
    if (retry.status().hasError()) {
        return retry.status();
    }
    if (!retryEnabled) {
        settings.retry.maxAttempts = 1;
    }

    SectionReader breaker(config, prefix + "circuit_breaker.");
    std::string mode;
    breaker.count("failure_threshold", settings.circuitBreaker.failureThreshold);
    breaker.millis("reset_timeout_ms", settings.circuitBreaker.resetTimeout);
    breaker.count("success_threshold", settings.circuitBreaker.successThreshold);
    breaker.text("mode", mode);
    breaker.millis("window_ms", settings.circuitBreaker.window);
    breaker.count("failure_rate_percent", settings.circuitBreaker.failureRatePercent);
    breaker.count("minimum_requests", settings.circuitBreaker.minimumRequests);
    if (breaker.status().hasError()) {
        return breaker.status();
    }
    if (mode == "consecutive") {
        settings.circuitBreaker.failureMode = reliability::FailureMode::ConsecutiveFailures;
    } else if (mode == "rolling_window") {
        settings.circuitBreaker.failureMode = reliability::FailureMode::RollingWindow;
    } else if (!mode.empty()) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::ConfigInvalidValue,
            "unknown circuit breaker mode '" + mode + "' at " + prefix + "circuit_breaker.mode"));
    }

    SectionReader limiter(config, prefix + "rate_limit.");
    limiter.real("capacity", settings.rateLimiter.capacity);
    limiter.real("refill_per_second", settings.rateLimiter.refillRate);
    if (limiter.status().hasError()) {
        return limiter.status();
    }

    SectionReader concurrency(config, prefix + "concurrency.");
    concurrency.boolean("enabled", settings.concurrency.enabled);
    concurrency.count("max_concurrent", settings.concurrency.maxConcurrent);
    return concurrency.status();
}

CacheResult<void> invalid(std::string_view scope, std::string_view what) {
    return CacheResult<void>::err(CacheError(
        ErrorCode::ConfigInvalidValue, std::string(scope) + ": " + std::string(what)));
}

}  // namespace

ResourceSettings ResilienceConfig::settingsFor(std::string_view resource) const {
    auto it = resources.find(std::string(resource));
    ResourceSettings settings = it != resources.end() ? it->second : defaults;
    settings.circuitBreaker.name = std::string(resource);
    settings.rateLimiter.name = std::string(resource);
    return settings;
}

CacheResult<void> validate(const ResourceSettings& s, std::string_view scope) {
    if (s.cache.defaultTtl <= std::chrono::milliseconds::zero()) {
        return invalid(scope, "cache.default_ttl_ms must be positive");
    }
    if (s.cache.sweepInterval < std::chrono::milliseconds::zero()) {
        return invalid(scope, "cache.sweep_interval_ms must not be negative");
    }
    if (s.retry.maxAttempts == 0) {
        return invalid(scope, "retry.max_attempts must be at least 1");
    }
    if (s.retry.initialBackoff < std::chrono::milliseconds::zero() ||
        s.retry.maxBackoff < s.retry.initialBackoff) {
        return invalid(scope, "retry backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (!(s.retry.backoffMultiplier >= 1.0)) {
        return invalid(scope, "retry.backoff_multiplier must be >= 1.0");
    }
    if (s.circuitBreaker.failureThreshold == 0) {
        return invalid(scope, "circuit_breaker.failure_threshold must be at least 1");
    }
    if (s.circuitBreaker.successThreshold == 0) {
        return invalid(scope, "circuit_breaker.success_threshold must be at least 1");
    }
    if (s.circuitBreaker.resetTimeout <= std::chrono::milliseconds::zero()) {
        return invalid(scope, "circuit_breaker.reset_timeout_ms must be positive");
    }
    if (s.circuitBreaker.failureMode == reliability::FailureMode::RollingWindow) {
        if (s.circuitBreaker.window <= std::chrono::milliseconds::zero()) {
            return invalid(scope, "circuit_breaker.window_ms must be positive");
        }
        if (s.circuitBreaker.failureRatePercent == 0 ||
            s.circuitBreaker.failureRatePercent > 100) {
            return invalid(scope, "circuit_breaker.failure_rate_percent must be in 1..100");
        }
    }
    if (!(s.rateLimiter.capacity > 0.0)) {
        return invalid(scope, "rate_limit.capacity must be positive");
    }
    if (!(s.rateLimiter.refillRate > 0.0)) {
        return invalid(scope, "rate_limit.refill_per_second must be positive");
    }
    if (s.concurrency.enabled && s.concurrency.maxConcurrent == 0) {
        return invalid(scope, "concurrency.max_concurrent must be at least 1");
    }
    return CacheResult<void>::ok();
}

CacheResult<ResilienceConfig> loadResilienceConfig(const ConfigManager& config) {
    ResilienceConfig result;

    auto fail = [](const CacheError& error) {
        RCACHE_LOG_ERROR(LogCategory::Config,
                         "invalid resilience configuration: " + std::string(error.message()));
        return CacheResult<ResilienceConfig>::err(error);
    };

    auto loaded = readSettings(config, "", result.defaults);
    if (loaded.hasError()) {
        return fail(loaded.error());
    }
    auto valid = validate(result.defaults, "defaults");
    if (valid.hasError()) {
        return fail(valid.error());
    }

    for (const auto& name : config.childNames("resources")) {
        // Overrides start from the global values.
        ResourceSettings settings = result.defaults;
        auto overlaid = readSettings(config, "resources." + name + ".", settings);
        if (overlaid.hasError()) {
            return fail(overlaid.error());
        }
        auto checked = validate(settings, "resources." + name);
        if (checked.hasError()) {
            return fail(checked.error());
        }
        settings.circuitBreaker.name = name;
        settings.rateLimiter.name = name;
        result.resources.emplace(name, std::move(settings));
    }

    RCACHE_LOG_INFO(LogCategory::Config,
                    "resilience configuration loaded (" +
                        std::to_string(result.resources.size()) + " resource overrides)");
    return CacheResult<ResilienceConfig>::ok(std::move(result));
}

}  // namespace rcache::config
