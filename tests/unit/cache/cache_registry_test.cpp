#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "rcache/cache/cache_registry.hpp"
#include "rcache/foundation/cache_metrics.hpp"

using namespace rcache::cache;
using namespace rcache::foundation;
using namespace std::chrono_literals;

namespace {

struct Pet {
    int id = 0;
    std::string name;
};

}  // namespace

class CacheRegistryTest : public ::testing::Test {
protected:
    ManualClock clock_;
    CacheMetrics metrics_;
    CacheRegistry registry_{clock_, metrics_};
};

TEST_F(CacheRegistryTest, RegisterAndFind) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets", {.defaultTtl = 5s})
                     .hasValue()));

    auto found = registry_.find<std::string, Pet>("pets");
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value()->name(), "pets");
    EXPECT_EQ(found.value()->policy().defaultTtl, 5s);
    EXPECT_TRUE(registry_.contains("pets"));
    EXPECT_EQ(registry_.cacheCount(), 1u);
}

TEST_F(CacheRegistryTest, FindReturnsSameInstance) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    auto a = registry_.find<std::string, Pet>("pets").value();
    auto b = registry_.find<std::string, Pet>("pets").value();
    EXPECT_EQ(a.get(), b.get());

    ASSERT_TRUE(a->put("pet:1", Pet{1, "rex"}).hasValue());
    EXPECT_EQ(b->size(), 1u);
}

TEST_F(CacheRegistryTest, DuplicateNameRejected) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    auto dup = registry_.registerCache<int, int>("pets");
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::CacheAlreadyRegistered);

    // The original registration is untouched.
    EXPECT_TRUE((registry_.find<std::string, Pet>("pets").hasValue()));
}

TEST_F(CacheRegistryTest, UnknownNameNotFound) {
    auto missing = registry_.find<std::string, Pet>("ghosts");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::CacheNotFound);
    EXPECT_TRUE(registry_.handle("ghosts").hasError());
}

TEST_F(CacheRegistryTest, WrongTypesAreRejected) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));

    auto wrongValue = registry_.find<std::string, int>("pets");
    ASSERT_TRUE(wrongValue.hasError());
    EXPECT_EQ(wrongValue.error().code(), ErrorCode::CacheTypeMismatch);

    auto wrongKey = registry_.find<int, Pet>("pets");
    ASSERT_TRUE(wrongKey.hasError());
    EXPECT_EQ(wrongKey.error().code(), ErrorCode::CacheTypeMismatch);
}

TEST_F(CacheRegistryTest, WithCacheRunsAgainstTypedCache) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));

    auto put = registry_.withCache<std::string, Pet>(
        "pets", [](ResourceCache<std::string, Pet>& cache) {
            (void)cache.put("pet:7", Pet{7, "fido"});
        });
    EXPECT_TRUE(put.hasValue());

    auto name = registry_.withCache<std::string, Pet>(
        "pets", [](ResourceCache<std::string, Pet>& cache) {
            return cache.get("pet:7").value_or(Pet{}).name;
        });
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "fido");

    bool called = false;
    auto mismatch = registry_.withCache<int, int>(
        "pets", [&called](ResourceCache<int, int>&) { called = true; });
    EXPECT_TRUE(mismatch.hasError());
    EXPECT_FALSE(called);
}

TEST_F(CacheRegistryTest, HandleExposesCapabilityOnly) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    auto typed = registry_.find<std::string, Pet>("pets").value();
    ASSERT_TRUE(typed->put("pet:1", Pet{1, "rex"}).hasValue());

    auto handle = registry_.handle("pets");
    ASSERT_TRUE(handle.hasValue());
    EXPECT_EQ(handle.value()->size(), 1u);
    handle.value()->invalidateAll();
    EXPECT_EQ(typed->size(), 0u);
}

TEST_F(CacheRegistryTest, UnregisterKeepsOutstandingHandles) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    auto typed = registry_.find<std::string, Pet>("pets").value();

    EXPECT_TRUE(registry_.unregisterCache("pets").hasValue());
    EXPECT_FALSE(registry_.contains("pets"));
    EXPECT_TRUE(typed->put("pet:1", Pet{1, "rex"}).hasValue());

    auto again = registry_.unregisterCache("pets");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::CacheNotFound);
}

TEST_F(CacheRegistryTest, NamesAreSorted) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    ASSERT_TRUE((registry_.registerCache<int, std::string>("owners").hasValue()));
    ASSERT_TRUE((registry_.registerCache<int, int>("inventory").hasValue()));
    EXPECT_EQ(registry_.names(), (std::vector<std::string>{"inventory", "owners", "pets"}));
}

TEST_F(CacheRegistryTest, AggregateStatsAcrossTypes) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    ASSERT_TRUE((registry_.registerCache<int, std::string>("owners").hasValue()));
    auto pets = registry_.find<std::string, Pet>("pets").value();
    auto owners = registry_.find<int, std::string>("owners").value();

    ASSERT_TRUE(pets->put("pet:1", Pet{1, "rex"}).hasValue());
    (void)pets->get("pet:1");
    (void)pets->get("pet:2");
    (void)owners->get(1);

    auto all = registry_.aggregateStats();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all["pets"].hits, 1u);
    EXPECT_EQ(all["pets"].misses, 1u);
    EXPECT_EQ(all["pets"].size, 1u);
    EXPECT_EQ(all["owners"].misses, 1u);

    auto total = registry_.totalStats();
    EXPECT_EQ(total.hits, 1u);
    EXPECT_EQ(total.misses, 2u);
    EXPECT_EQ(total.entriesCreated, 1u);
}

TEST_F(CacheRegistryTest, InvalidateAllAndSweepCoverEveryCache) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    ASSERT_TRUE((registry_.registerCache<int, int>("numbers").hasValue()));
    auto pets = registry_.find<std::string, Pet>("pets").value();
    auto numbers = registry_.find<int, int>("numbers").value();

    ASSERT_TRUE(pets->put("pet:1", Pet{1, "rex"}, 1s).hasValue());
    ASSERT_TRUE(numbers->put(1, 1, 1s).hasValue());
    ASSERT_TRUE(numbers->put(2, 2, 1min).hasValue());
    clock_.advance(2s);
    EXPECT_EQ(registry_.sweepExpired(), 2u);
    EXPECT_EQ(numbers->size(), 1u);

    registry_.invalidateAll();
    EXPECT_EQ(registry_.totalStats().size, 0u);
}

TEST_F(CacheRegistryTest, PublishMetricsWritesGauges) {
    ASSERT_TRUE((registry_.registerCache<std::string, Pet>("pets").hasValue()));
    auto pets = registry_.find<std::string, Pet>("pets").value();
    ASSERT_TRUE(pets->put("pet:1", Pet{1, "rex"}).hasValue());
    (void)pets->get("pet:1");
    (void)pets->get("pet:1");
    (void)pets->get("pet:9");
    (void)pets->get("pet:9");

    registry_.publishMetrics();
    MetricLabels labels{{"cache", "pets"}};
    EXPECT_DOUBLE_EQ(metrics_.gaugeValue("rcache_cache_entries", labels), 1.0);
    EXPECT_DOUBLE_EQ(metrics_.gaugeValue("rcache_cache_hit_ratio", labels), 0.5);
}

TEST(CacheRegistryIsolationTest, InstancesDoNotShareState) {
    ManualClock clock;
    CacheRegistry a(clock, NullMetricsSink::instance());
    CacheRegistry b(clock, NullMetricsSink::instance());
    ASSERT_TRUE((a.registerCache<int, int>("shared-name").hasValue()));
    EXPECT_TRUE((b.registerCache<int, int>("shared-name").hasValue()));
    EXPECT_FALSE((a.find<int, int>("shared-name").value().get() ==
                  b.find<int, int>("shared-name").value().get()));
}
