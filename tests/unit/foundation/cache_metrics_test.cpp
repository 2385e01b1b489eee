#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "rcache/foundation/cache_metrics.hpp"
#include "rcache/foundation/metrics_sink.hpp"

using namespace rcache::foundation;

TEST(MetricNamingTest, TotalSuffixMeansCounter) {
    EXPECT_TRUE(isCounterMetric("rcache_cache_hits_total"));
    EXPECT_FALSE(isCounterMetric("rcache_cache_entries"));
    EXPECT_FALSE(isCounterMetric("_tota"));
    EXPECT_TRUE(isCounterMetric("_total"));
}

TEST(CacheMetricsTest, CountersAccumulate) {
    CacheMetrics metrics;
    metrics.record("rcache_cache_hits_total", 1, {{"cache", "pets"}});
    metrics.record("rcache_cache_hits_total", 2, {{"cache", "pets"}});
    EXPECT_DOUBLE_EQ(metrics.counterValue("rcache_cache_hits_total", {{"cache", "pets"}}), 3.0);
}

TEST(CacheMetricsTest, GaugesAreReplaced) {
    CacheMetrics metrics;
    metrics.record("rcache_cache_entries", 10, {{"cache", "pets"}});
    metrics.record("rcache_cache_entries", 4, {{"cache", "pets"}});
    EXPECT_DOUBLE_EQ(metrics.gaugeValue("rcache_cache_entries", {{"cache", "pets"}}), 4.0);
    // A gauge is not readable as a counter.
    EXPECT_DOUBLE_EQ(metrics.counterValue("rcache_cache_entries", {{"cache", "pets"}}), 0.0);
}

TEST(CacheMetricsTest, LabelSetsAreSeparateSeries) {
    CacheMetrics metrics;
    metrics.record("rcache_cache_misses_total", 1, {{"cache", "pets"}});
    metrics.record("rcache_cache_misses_total", 5, {{"cache", "owners"}});
    EXPECT_EQ(metrics.seriesCount(), 2u);
    EXPECT_DOUBLE_EQ(metrics.counterValue("rcache_cache_misses_total", {{"cache", "owners"}}), 5.0);
    EXPECT_DOUBLE_EQ(metrics.counterTotal("rcache_cache_misses_total"), 6.0);
}

TEST(CacheMetricsTest, AbsentSeriesReadsZero) {
    CacheMetrics metrics;
    EXPECT_DOUBLE_EQ(metrics.counterValue("nope_total"), 0.0);
    EXPECT_DOUBLE_EQ(metrics.gaugeValue("nope"), 0.0);
    EXPECT_DOUBLE_EQ(metrics.counterTotal("nope_total"), 0.0);
}

TEST(CacheMetricsTest, ScrapeUsesPrometheusTextFormat) {
    CacheMetrics metrics;
    metrics.record("rcache_circuit_state", 1, {{"breaker", "pets"}});
    metrics.record("rcache_retry_attempts_total", 3, {{"operation", "get_pet"}});

    auto text = metrics.scrape();
    EXPECT_NE(text.find("# TYPE rcache_circuit_state gauge"), std::string::npos);
    EXPECT_NE(text.find("rcache_circuit_state{breaker=\"pets\"} 1"), std::string::npos);
    EXPECT_NE(text.find("# TYPE rcache_retry_attempts_total counter"), std::string::npos);
    EXPECT_NE(text.find("rcache_retry_attempts_total{operation=\"get_pet\"} 3"),
              std::string::npos);
}

TEST(CacheMetricsTest, ScrapeEscapesLabelValues) {
    CacheMetrics metrics;
    metrics.record("odd_total", 1, {{"cache", "a\"b"}});
    EXPECT_NE(metrics.scrape().find("odd_total{cache=\"a\\\"b\"} 1"), std::string::npos);
}

TEST(CacheMetricsTest, ResetClearsSeries) {
    CacheMetrics metrics;
    metrics.record("x_total", 1, {});
    metrics.reset();
    EXPECT_EQ(metrics.seriesCount(), 0u);
    EXPECT_TRUE(metrics.scrape().empty());
}

TEST(CacheMetricsTest, ConcurrentCounterUpdates) {
    CacheMetrics metrics;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&metrics] {
            for (int i = 0; i < kPerThread; ++i) {
                metrics.record("rcache_cache_hits_total", 1, {{"cache", "pets"}});
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_DOUBLE_EQ(metrics.counterValue("rcache_cache_hits_total", {{"cache", "pets"}}),
                     kThreads * kPerThread);
}
