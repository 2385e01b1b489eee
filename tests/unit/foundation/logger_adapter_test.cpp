#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "rcache/foundation/cache_logger.hpp"
#include "support/mock_logger.hpp"

using namespace rcache::foundation;
using kcenon::common::interfaces::log_level;
using rcache::test_support::ScopedMockLogger;

class CacheLoggerTest : public ::testing::Test {
protected:
    ScopedMockLogger mock_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Cache), "Cache");
    EXPECT_EQ(logCategoryName(LogCategory::Registry), "Registry");
    EXPECT_EQ(logCategoryName(LogCategory::Retry), "Retry");
    EXPECT_EQ(logCategoryName(LogCategory::Circuit), "Circuit");
    EXPECT_EQ(logCategoryName(LogCategory::RateLimit), "RateLimit");
    EXPECT_EQ(logCategoryName(LogCategory::Handler), "Handler");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Category levels
// ---------------------------------------------------------------------------

TEST(CacheLoggerBasicTest, DefaultCategoryLevels) {
    CacheLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Cache), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Circuit), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::RateLimit), LogLevel::Warning);
}

TEST(CacheLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    CacheLogger logger;
    logger.setCategoryLevel(LogCategory::Retry, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Retry));

    logger.setCategoryLevel(LogCategory::Retry, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Retry));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Retry));
}

TEST(CacheLoggerBasicTest, OffDisablesEverything) {
    CacheLogger logger;
    logger.setCategoryLevel(LogCategory::Cache, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Cache));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(CacheLoggerBasicTest, InvalidCategoryReturnsOff) {
    CacheLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output formatting
// ---------------------------------------------------------------------------

TEST_F(CacheLoggerTest, LogFormatsMessageWithCategory) {
    CacheLogger logger;
    logger.log(LogLevel::Info, LogCategory::Cache, "cache registered");

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Cache] cache registered");
}

TEST_F(CacheLoggerTest, LogFiltersMessagesBelowLevel) {
    CacheLogger logger;
    logger.log(LogLevel::Info, LogCategory::RateLimit, "filtered");
    EXPECT_TRUE(mock_->records().empty());
}

TEST_F(CacheLoggerTest, LogWithContextIncludesFields) {
    CacheLogger logger;
    logger.setCategoryLevel(LogCategory::Retry, LogLevel::Debug);

    LogContext ctx;
    ctx.resource = "pets";
    ctx.key = "pet:42";
    ctx.breaker = "pets-api";
    ctx.extra["attempt"] = "2";
    logger.logWithContext(LogLevel::Debug, LogCategory::Retry, "retrying", ctx);

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Retry] retrying {"), std::string::npos);
    EXPECT_NE(msg.find("resource=pets"), std::string::npos);
    EXPECT_NE(msg.find("key=pet:42"), std::string::npos);
    EXPECT_NE(msg.find("breaker=pets-api"), std::string::npos);
    EXPECT_NE(msg.find("attempt=2"), std::string::npos);
}

TEST_F(CacheLoggerTest, EmptyContextOmitsBraces) {
    CacheLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "plain", LogContext{});
    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] plain");
}

TEST_F(CacheLoggerTest, FlushDelegatesToLogger) {
    CacheLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mock_->wasFlushed());
}

// ---------------------------------------------------------------------------
// Macros and singleton
// ---------------------------------------------------------------------------

TEST(CacheLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&CacheLogger::instance(), &CacheLogger::instance());
}

TEST_F(CacheLoggerTest, MacroLogsWhenEnabled) {
    CacheLogger::instance().setCategoryLevel(LogCategory::Handler, LogLevel::Debug);
    RCACHE_LOG_DEBUG(LogCategory::Handler, "macro test");
    EXPECT_EQ(mock_->countContaining("macro test"), 1u);
    CacheLogger::instance().setCategoryLevel(LogCategory::Handler, LogLevel::Info);
}

TEST_F(CacheLoggerTest, MacroSkipsWhenDisabled) {
    CacheLogger::instance().setCategoryLevel(LogCategory::Handler, LogLevel::Error);
    RCACHE_LOG_WARN(LogCategory::Handler, "should not appear");
    EXPECT_EQ(mock_->countContaining("should not appear"), 0u);
    CacheLogger::instance().setCategoryLevel(LogCategory::Handler, LogLevel::Info);
}

TEST_F(CacheLoggerTest, ConcurrentLogging) {
    CacheLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Cache, "msg");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mock_->records().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
