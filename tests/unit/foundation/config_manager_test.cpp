#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "rcache/foundation/config_manager.hpp"

using namespace rcache::foundation;

namespace {

constexpr const char* kYaml = R"(
cache:
  default_ttl_ms: 5000
  max_capacity: 100
  coalesce_fetches: true
retry:
  backoff_multiplier: 1.5
resources:
  pets:
    cache:
      default_ttl_ms: 1000
  owners:
    retry:
      max_attempts: 5
)";

}  // namespace

TEST(ConfigManagerTest, LoadFromStringFlattensKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kYaml).hasValue());

    EXPECT_EQ(config.get<int>("cache.default_ttl_ms").value(), 5000);
    EXPECT_TRUE(config.get<bool>("cache.coalesce_fetches").value());
    EXPECT_DOUBLE_EQ(config.get<double>("retry.backoff_multiplier").value(), 1.5);
    EXPECT_EQ(config.get<int>("resources.pets.cache.default_ttl_ms").value(), 1000);
}

TEST(ConfigManagerTest, MissingKeyIsNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kYaml).hasValue());

    auto missing = config.get<int>("cache.nope");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_FALSE(config.hasKey("cache.nope"));
    EXPECT_FALSE(config.hasKey("cache"));  // only leaves are stored
}

TEST(ConfigManagerTest, WrongTypeIsMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("cache:\n  max_capacity: lots\n").hasValue());

    auto bad = config.get<int>("cache.max_capacity");
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, GetOrOnlyFallsBackWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: text\n").hasValue());

    EXPECT_EQ(config.getOr<int>("b", 9).value(), 9);
    auto typed = config.getOr<int>("a", 9);
    ASSERT_TRUE(typed.hasError());
    EXPECT_EQ(typed.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, MalformedYamlFailsToLoad) {
    ConfigManager config;
    auto result = config.loadFromString("cache: [unterminated\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, MissingFileFailsToLoad) {
    ConfigManager config;
    auto result = config.load("/nonexistent/rcache/config.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "rcache_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << kYaml;
    }
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());
    EXPECT_EQ(config.get<int>("cache.max_capacity").value(), 100);
    std::filesystem::remove(path);
}

TEST(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\n").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2\n").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST(ConfigManagerTest, KeysWithPrefixAndChildNames) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kYaml).hasValue());

    auto keys = config.keysWithPrefix("cache");
    EXPECT_EQ(keys, (std::vector<std::string>{
        "cache.coalesce_fetches", "cache.default_ttl_ms", "cache.max_capacity"}));

    EXPECT_EQ(config.childNames("resources"),
              (std::vector<std::string>{"owners", "pets"}));
    EXPECT_TRUE(config.childNames("nothing").empty());
}

TEST(ConfigManagerTest, SetNotifiesWatchers) {
    ConfigManager config;
    std::vector<std::string> changed;
    config.watch("cache.default_ttl_ms", [&](std::string_view key) {
        changed.emplace_back(key);
        // Callbacks run outside the lock and may read the new value.
        EXPECT_EQ(config.get<int>("cache.default_ttl_ms").value(), 42);
    });

    config.set("cache.default_ttl_ms", 42);
    config.set("cache.max_capacity", 1);

    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], "cache.default_ttl_ms");
}
