#pragma once

/// @file combat_settings.hpp
/// @brief Tunables of a combat world and their configuration keys.

#include <cstdint>

#include "cre/foundation/combat_result.hpp"
#include "cre/foundation/config_manager.hpp"
#include "cre/game/spatial_index.hpp"
#include "cre/game/stat_derivation.hpp"

namespace cre::game {

/// | Key                                  | Field               | Default |
/// |--------------------------------------|---------------------|---------|
/// | combat.physics_tick_rate             | physicsTickRate     | 60      |
/// | combat.status_tick_interval          | statusTickInterval  | 1.0     |
/// | combat.spatial_cell_size             | spatialCellSize     | 64      |
/// | combat.random_seed                   | randomSeed          | 0       |
/// | stats.strength_agility_multiplier    | stats               | 1.25    |
/// | stats.intelligence_multiplier        | stats               | 1.15    |
struct CombatSettings {
    float physicsTickRate = 60.0f;     ///< Hz
    float statusTickInterval = 1.0f;   ///< Seconds between status ticks.
    float spatialCellSize = kDefaultCellSize;
    uint64_t randomSeed = 0;           ///< 0 seeds from std::random_device.
    StatDerivationParams stats;

    [[nodiscard]] float PhysicsStep() const noexcept { return 1.0f / physicsTickRate; }
};

/// Read CombatSettings from @p config. Absent keys keep their defaults.
/// @return ConfigTypeMismatch for a value of the wrong type, InvalidArgument
///         for a non-positive rate, interval or cell size, or a negative
///         multiplier.
[[nodiscard]] foundation::CombatResult<CombatSettings>
LoadCombatSettings(const foundation::ConfigManager& config);

}  // namespace cre::game
