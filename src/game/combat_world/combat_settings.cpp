#include "cre/game/combat_settings.hpp"

#include <cmath>
#include <string>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using foundation::CombatError;
using foundation::CombatResult;
using foundation::ErrorCode;

namespace {

template <typename T>
bool readSetting(const foundation::ConfigManager& config, std::string_view key, T& out,
                 CombatError& error) {
    auto value = config.getOr<T>(key, out);
    if (value.hasError()) {
        error = value.error();
        return false;
    }
    out = value.value();
    return true;
}

bool positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

}  // namespace

CombatResult<CombatSettings> LoadCombatSettings(const foundation::ConfigManager& config) {
    CombatSettings settings;
    CombatError error;

    double strengthAgility = settings.stats.strengthAgilityMultiplier;
    double intelligence = settings.stats.intelligenceMultiplier;

    if (!readSetting(config, "combat.physics_tick_rate", settings.physicsTickRate, error) ||
        !readSetting(config, "combat.status_tick_interval", settings.statusTickInterval, error) ||
        !readSetting(config, "combat.spatial_cell_size", settings.spatialCellSize, error) ||
        !readSetting(config, "combat.random_seed", settings.randomSeed, error) ||
        !readSetting(config, "stats.strength_agility_multiplier", strengthAgility, error) ||
        !readSetting(config, "stats.intelligence_multiplier", intelligence, error)) {
        return CombatResult<CombatSettings>::err(error);
    }

    if (!positive(settings.physicsTickRate)) {
        return foundation::makeError<CombatSettings>(
            ErrorCode::InvalidArgument, "combat.physics_tick_rate must be positive");
    }
    if (!positive(settings.statusTickInterval)) {
        return foundation::makeError<CombatSettings>(
            ErrorCode::InvalidArgument, "combat.status_tick_interval must be positive");
    }
    if (!positive(settings.spatialCellSize)) {
        return foundation::makeError<CombatSettings>(
            ErrorCode::InvalidArgument, "combat.spatial_cell_size must be positive");
    }
    if (!std::isfinite(strengthAgility) || strengthAgility < 0.0 ||
        !std::isfinite(intelligence) || intelligence < 0.0) {
        return foundation::makeError<CombatSettings>(
            ErrorCode::InvalidArgument, "stat multipliers must be non-negative");
    }

    settings.stats.strengthAgilityMultiplier = strengthAgility;
    settings.stats.intelligenceMultiplier = intelligence;

    CRE_LOG_INFO(foundation::LogCategory::Config,
                 "Combat settings: " + std::to_string(settings.physicsTickRate) + " Hz physics, " +
                     std::to_string(settings.statusTickInterval) + " s status interval");
    return CombatResult<CombatSettings>::ok(settings);
}

}  // namespace cre::game
