#pragma once

/// @file cache_metrics.hpp
/// @brief In-memory MetricsSink with labeled series and Prometheus export.
///
/// Holds every series reported through MetricsSink::record() so that
/// operators (and tests) can read hit/miss/eviction counters, circuit
/// transitions and rate-limit rejections, or scrape them in Prometheus
/// text exposition format.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::foundation {

/// Thread-safe in-memory metrics store.
///
/// Example:
/// @code
///   CacheMetrics metrics;
///   CacheRegistry registry(SteadyClock::instance(), metrics);
///   ...
///   double hits = metrics.counterValue("rcache_cache_hits_total",
///                                      {{"cache", "pets"}});
///   std::string prom = metrics.scrape();
/// @endcode
class CacheMetrics final : public MetricsSink {
public:
    CacheMetrics();
    ~CacheMetrics() override;

    CacheMetrics(const CacheMetrics&) = delete;
    CacheMetrics& operator=(const CacheMetrics&) = delete;
    CacheMetrics(CacheMetrics&&) noexcept;
    CacheMetrics& operator=(CacheMetrics&&) noexcept;

    /// Counter names ("_total" suffix) accumulate @p value; gauges are
    /// overwritten with it.
    void record(std::string_view name, double value,
                const MetricLabels& labels) override;

    /// Value of the counter series with exactly these labels, 0 if absent.
    [[nodiscard]] double counterValue(std::string_view name,
                                      const MetricLabels& labels = {}) const;

    /// Sum of a counter across all of its label sets.
    [[nodiscard]] double counterTotal(std::string_view name) const;

    /// Current gauge value for the series with exactly these labels,
    /// 0.0 if absent.
    [[nodiscard]] double gaugeValue(std::string_view name,
                                    const MetricLabels& labels = {}) const;

    /// Number of distinct series (name + label set).
    [[nodiscard]] std::size_t seriesCount() const;

    /// Serialize all series in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear every series. Intended for tests.
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rcache::foundation
