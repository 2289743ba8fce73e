#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "cre/foundation/combat_logger.hpp"
#include "cre/foundation/error_code.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace cre::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class CombatLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Stats), "Stats");
    EXPECT_EQ(logCategoryName(LogCategory::Trajectory), "Trajectory");
    EXPECT_EQ(logCategoryName(LogCategory::Damage), "Damage");
    EXPECT_EQ(logCategoryName(LogCategory::Status), "Status");
    EXPECT_EQ(logCategoryName(LogCategory::Spells), "Spells");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Category levels
// ---------------------------------------------------------------------------

TEST(CombatLoggerBasicTest, DefaultCategoryLevels) {
    CombatLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::ECS), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Stats), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Trajectory), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Damage), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Status), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Spells), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(CombatLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    CombatLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Spells));

    logger.setCategoryLevel(LogCategory::Spells, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Spells));

    logger.setCategoryLevel(LogCategory::Spells, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Spells));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Spells));
}

TEST(CombatLoggerBasicTest, OffDisablesEverything) {
    CombatLogger logger;
    logger.setCategoryLevel(LogCategory::Damage, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Damage));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(CombatLoggerBasicTest, InvalidCategoryReturnsOff) {
    CombatLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

TEST(CombatLoggerBasicTest, MoveKeepsLevels) {
    CombatLogger a;
    a.setCategoryLevel(LogCategory::Core, LogLevel::Error);
    CombatLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Core), LogLevel::Error);
}

// ---------------------------------------------------------------------------
// Basic logging
// ---------------------------------------------------------------------------

TEST_F(CombatLoggerTest, LogFormatsMessageWithCategory) {
    CombatLogger logger;
    logger.log(LogLevel::Info, LogCategory::Core, "Combat phase started");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Core] Combat phase started");
}

TEST_F(CombatLoggerTest, LogFiltersMessagesBelowLevel) {
    CombatLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Config, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(CombatLoggerTest, LevelsMapToKcenon) {
    CombatLogger logger;
    logger.setCategoryLevel(LogCategory::Damage, LogLevel::Trace);

    logger.log(LogLevel::Trace, LogCategory::Damage, "trace");
    logger.log(LogLevel::Debug, LogCategory::Damage, "debug");
    logger.log(LogLevel::Warning, LogCategory::Damage, "warn");
    logger.log(LogLevel::Critical, LogCategory::Damage, "critical");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::debug);
    EXPECT_EQ(records[2].level, log_level::warning);
    EXPECT_EQ(records[3].level, log_level::critical);
}

// ---------------------------------------------------------------------------
// Structured logging with context
// ---------------------------------------------------------------------------

TEST_F(CombatLoggerTest, LogWithContextIncludesFields) {
    CombatLogger logger;

    LogContext ctx;
    ctx.entity = 12;
    ctx.spellId = "ice_lance";
    ctx.extra["damage"] = "18";

    logger.logWithContext(LogLevel::Debug, LogCategory::Damage, "Hit resolved", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_EQ(msg.rfind("[Damage] Hit resolved {", 0), 0u);
    EXPECT_NE(msg.find("entity=12"), std::string::npos);
    EXPECT_NE(msg.find("spell=ice_lance"), std::string::npos);
    EXPECT_NE(msg.find("damage=18"), std::string::npos);
    EXPECT_EQ(msg.back(), '}');
}

TEST_F(CombatLoggerTest, LogWithEmptyContextOmitsBraces) {
    CombatLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Spells, "Loaded", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Spells] Loaded");
}

TEST_F(CombatLoggerTest, LogWithContextFilteredBelowLevel) {
    CombatLogger logger;
    logger.setCategoryLevel(LogCategory::Status, LogLevel::Warning);

    LogContext ctx;
    ctx.entity = 1;
    logger.logWithContext(LogLevel::Debug, LogCategory::Status, "filtered", ctx);

    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Flush
// ---------------------------------------------------------------------------

TEST_F(CombatLoggerTest, FlushDelegatesToLogger) {
    CombatLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// Singleton and CRE_LOG macros
// ---------------------------------------------------------------------------

TEST(CombatLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&CombatLogger::instance(), &CombatLogger::instance());
}

TEST_F(CombatLoggerTest, MacroLogsWhenEnabled) {
    CombatLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Debug);
    CRE_LOG_DEBUG(LogCategory::Core, "macro test");
    CombatLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] macro test");
}

TEST_F(CombatLoggerTest, MacroSkipsWhenDisabled) {
    CombatLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    CRE_LOG_WARN(LogCategory::Core, "should not appear");
    CombatLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);

    EXPECT_TRUE(mockLogger_->records().empty());
}
