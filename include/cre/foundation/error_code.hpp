#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat resolution engine.

#include <cstdint>
#include <string_view>

namespace cre::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // ECS (0x0100 - 0x01FF)
    EntityNotFound = 0x0100,
    ComponentNotFound = 0x0101,
    SystemError = 0x0102,

    // Stats (0x0200 - 0x02FF)
    InvalidStats = 0x0200,

    // Projectile (0x0300 - 0x03FF)
    InvalidProjectileConfig = 0x0300,
    UnknownSpell = 0x0301,

    // Combat (0x0400 - 0x04FF)
    MissingComponent = 0x0400,
    SpellOnCooldown = 0x0401,
    InsufficientEnergy = 0x0402,
    CasterNotFound = 0x0403,
    CombatPhaseInactive = 0x0404,

    // Config (0x0500 - 0x05FF)
    ConfigLoadFailed = 0x0500,
    ConfigKeyNotFound = 0x0501,
    ConfigTypeMismatch = 0x0502,
    SpellDataInvalid = 0x0503,

    // Logger (0x0600 - 0x06FF)
    LoggerError = 0x0600,
    LoggerFlushFailed = 0x0601,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "ECS";
        case 0x0200: return "Stats";
        case 0x0300: return "Projectile";
        case 0x0400: return "Combat";
        case 0x0500: return "Config";
        case 0x0600: return "Logger";
        default: return "Unknown";
    }
}

} // namespace cre::foundation
