#pragma once

/// @file combat_events.hpp
/// @brief Typed notifications published by a combat world.

#include <cstdint>

#include "cre/ecs/entity.hpp"
#include "cre/foundation/signal.hpp"
#include "cre/game/combat_types.hpp"

namespace cre::game {

/// Observer hub for presentation layers.
///
/// Every signal fires synchronously inside the tick that caused it.
struct CombatEvents {
    /// (entity, current, max)
    foundation::Signal<cre::ecs::Entity, int32_t, int32_t> healthChanged;
    /// (entity, overkill)
    foundation::Signal<cre::ecs::Entity, int32_t> defeated;
    /// (entity, current, max)
    foundation::Signal<cre::ecs::Entity, int32_t, int32_t> energyChanged;
    /// (entity, overkill)
    foundation::Signal<cre::ecs::Entity, int32_t> exhausted;
    /// (entity, amount restored)
    foundation::Signal<cre::ecs::Entity, int32_t> energyRestored;
    foundation::Signal<cre::ecs::Entity, StatusEffectKind> statusApplied;
};

}  // namespace cre::game
