#pragma once

/// @file metrics_sink.hpp
/// @brief Metrics sink interface consumed by caches and reliability layers.

#include <map>
#include <string>
#include <string_view>

namespace rcache::foundation {

/// Label set attached to a metric update. Ordered so that the same set
/// always renders to the same series key.
using MetricLabels = std::map<std::string, std::string>;

/// Destination for counter and gauge updates.
///
/// Emitters call record() after every cache hit/miss/eviction, retry
/// attempt, circuit transition and rate-limit rejection. By convention a
/// metric whose name ends in "_total" is a counter and @p value is a delta;
/// any other name is a gauge and @p value replaces the previous sample.
///
/// Implementations must be thread-safe; record() is called from any thread
/// but never while a component holds its internal lock.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void record(std::string_view name, double value,
                        const MetricLabels& labels) = 0;
};

/// Sink that discards every update.
class NullMetricsSink final : public MetricsSink {
public:
    void record(std::string_view, double, const MetricLabels&) override {}

    static NullMetricsSink& instance() {
        static NullMetricsSink inst;
        return inst;
    }
};

/// True when @p name follows the counter naming convention.
[[nodiscard]] constexpr bool isCounterMetric(std::string_view name) noexcept {
    constexpr std::string_view kSuffix = "_total";
    return name.size() >= kSuffix.size() &&
           name.substr(name.size() - kSuffix.size()) == kSuffix;
}

} // namespace rcache::foundation
