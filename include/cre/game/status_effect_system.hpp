#pragma once

/// @file status_effect_system.hpp
/// @brief Periodic status effect damage on the fixed status tick.

#include <cstdint>
#include <string_view>

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/system_scheduler.hpp"
#include "cre/foundation/random_source.hpp"
#include "cre/game/combat_components.hpp"
#include "cre/game/damage_pipeline.hpp"

namespace cre::game {

/// One status tick of a damaging effect is a burst of sub-ticks, each
/// rolled separately (U is inclusive):
///
/// | Kind      | Sub-ticks          | Damage per sub-tick |
/// |-----------|--------------------|---------------------|
/// | corroding | 4*level + U(0,5)   | 2*level + U(0,5)    |
/// | burned    | 3*level + U(0,2)   | 2*level + U(0,3)    |
/// | chill     | 0                  | -                   |
///
/// Chill and None roll nothing and return 0.
[[nodiscard]] int32_t RollSubTicks(const StatusEffectInstance& effect,
                                   foundation::RandomSource& rng);

/// Roll the damage of one sub-tick of @p effect.
[[nodiscard]] int32_t RollSubTickDamage(const StatusEffectInstance& effect,
                                        foundation::RandomSource& rng);

/// Runs once per status interval in the FixedUpdate stage.
///
/// Every sub-tick goes through DamagePipeline::ApplyPeriodicDamage(), so a
/// status tick can defeat its holder exactly like a hit. Ticking an entity
/// stops as soon as it is defeated. Each instance loses one tick of
/// duration per status tick and is removed at zero.
class StatusEffectSystem final : public cre::ecs::ISystem {
public:
    StatusEffectSystem(cre::ecs::ComponentStorage<StatusHolder>& statuses,
                       cre::ecs::ComponentStorage<Health>& healths,
                       DamagePipeline& pipeline,
                       foundation::RandomSource& rng);

    void Execute(float deltaTime) override;

    [[nodiscard]] cre::ecs::SystemStage GetStage() const override {
        return cre::ecs::SystemStage::FixedUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "StatusEffectSystem"; }

    /// Status ticks processed since construction.
    [[nodiscard]] uint64_t TickCount() const noexcept { return ticks_; }

private:
    bool tickEntity(cre::ecs::Entity entity, StatusHolder& holder);

    cre::ecs::ComponentStorage<StatusHolder>& statuses_;
    cre::ecs::ComponentStorage<Health>& healths_;
    DamagePipeline& pipeline_;
    foundation::RandomSource& rng_;
    uint64_t ticks_ = 0;
};

}  // namespace cre::game
