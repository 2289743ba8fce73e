/// @file combat_logger.cpp
/// @brief CombatLogger implementation on kcenon logger interfaces.

#include "cre/foundation/combat_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace cre::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // ECS
    LogLevel::Info,   // Stats
    LogLevel::Debug,  // Trajectory
    LogLevel::Debug,  // Damage
    LogLevel::Debug,  // Status
    LogLevel::Info,   // Spells
    LogLevel::Info    // Config
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entity) {
        append("entity", std::to_string(*ctx.entity));
    }
    if (ctx.spellId && !ctx.spellId->empty()) {
        append("spell", *ctx.spellId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

static std::string formatLine(LogCategory cat, std::string_view msg,
                              std::string_view ctx) {
    std::string line;
    line.reserve(msg.size() + ctx.size() + 20);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    if (!ctx.empty()) {
        line += " {";
        line += ctx;
        line += '}';
    }
    return line;
}

struct CombatLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("cre.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named category logger if registered, otherwise the default logger.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }
};

CombatLogger::CombatLogger() : impl_(std::make_unique<Impl>()) {}

CombatLogger::~CombatLogger() = default;

CombatLogger::CombatLogger(CombatLogger&&) noexcept = default;
CombatLogger& CombatLogger::operator=(CombatLogger&&) noexcept = default;

void CombatLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    // A failed write must never disturb the simulation tick.
    auto result = impl_->getLogger(cat)->log(mapLevel(level), formatLine(cat, msg, {}));
    (void)result;
}

void CombatLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto result = impl_->getLogger(cat)->log(
        mapLevel(level), formatLine(cat, msg, formatContext(ctx)));
    (void)result;
}

void CombatLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel CombatLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool CombatLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

CombatResult<void> CombatLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return CombatResult<void>::ok();
}

CombatLogger& CombatLogger::instance() {
    static CombatLogger inst;
    return inst;
}

} // namespace cre::foundation
