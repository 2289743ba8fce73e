#pragma once

/// @file combat_logger.hpp
/// @brief CombatLogger wrapping kcenon logger interfaces for categorized,
///        structured engine logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cre/foundation/combat_result.hpp"

namespace cre::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core       = 0, ///< World lifecycle, phase changes
    ECS        = 1, ///< Entity and scheduler bookkeeping
    Stats      = 2, ///< Derived stat computation
    Trajectory = 3, ///< Projectile spawn, motion, expiry
    Damage     = 4, ///< Hit resolution, health and energy
    Status     = 5, ///< Status effect application and ticks
    Spells     = 6, ///< Spell definitions and casting
    Config     = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Stats", "Trajectory", "Damage", "Status", "Spells", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// @code
///   LogContext ctx;
///   ctx.entity = target.raw;
///   ctx.spellId = "ice_lance";
///   ctx.extra["damage"] = "18";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Damage,
///                         "Hit resolved", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entity;
    std::optional<std::string> spellId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger on top of kcenon's logger registry.
///
/// Each category is routed to a named logger ("cre.<Category>") when one is
/// registered, otherwise to the registry's default logger. PIMPL keeps the
/// kcenon headers out of the public API.
///
/// Default levels:
/// | Category   | Default |
/// |------------|---------|
/// | Core       | Info    |
/// | ECS        | Info    |
/// | Stats      | Info    |
/// | Trajectory | Debug   |
/// | Damage     | Debug   |
/// | Status     | Debug   |
/// | Spells     | Info    |
/// | Config     | Info    |
class CombatLogger {
public:
    CombatLogger();
    ~CombatLogger();

    CombatLogger(const CombatLogger&) = delete;
    CombatLogger& operator=(const CombatLogger&) = delete;
    CombatLogger(CombatLogger&&) noexcept;
    CombatLogger& operator=(CombatLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as "{key=value, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    CombatResult<void> flush();

    /// Process-wide instance used by the CRE_LOG macros.
    static CombatLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cre::foundation

/// @name CRE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CRE_MIN_LOG_LEVEL (0=Trace .. 6=Off) before including this header
/// to strip calls below the threshold at compile time.
/// @{

#ifndef CRE_MIN_LOG_LEVEL
    #define CRE_MIN_LOG_LEVEL 0
#endif

#define CRE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CRE_MIN_LOG_LEVEL &&                        \
            ::cre::foundation::CombatLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::cre::foundation::CombatLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CRE_LOG_TRACE(cat, msg) \
    CRE_LOG(::cre::foundation::LogLevel::Trace, (cat), (msg))

#define CRE_LOG_DEBUG(cat, msg) \
    CRE_LOG(::cre::foundation::LogLevel::Debug, (cat), (msg))

#define CRE_LOG_INFO(cat, msg) \
    CRE_LOG(::cre::foundation::LogLevel::Info, (cat), (msg))

#define CRE_LOG_WARN(cat, msg) \
    CRE_LOG(::cre::foundation::LogLevel::Warning, (cat), (msg))

#define CRE_LOG_ERROR(cat, msg) \
    CRE_LOG(::cre::foundation::LogLevel::Error, (cat), (msg))

/// @}
