#pragma once

/// @file damage_pipeline.hpp
/// @brief Hit resolution into Health, Energy and status effect state.

#include <cstdint>
#include <functional>
#include <string_view>

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/entity_manager.hpp"
#include "cre/ecs/system_scheduler.hpp"
#include "cre/game/combat_components.hpp"
#include "cre/game/combat_events.hpp"
#include "cre/game/projectile_components.hpp"

namespace cre::game {

/// Scale @p damage by a 0-100 resistance percentage.
///
/// The result is floored and stays at least 1 for positive damage unless
/// the target is fully resistant.
[[nodiscard]] int32_t ApplyResistance(int32_t damage, float resistancePercent) noexcept;

/// Connects hit detection to combatant state.
///
/// Execute() drains the HitQueue filled by the TrajectorySystem earlier in
/// the same tick. The public mutators are also the entry points for status
/// ticks and for collaborators outside the projectile path, so every health
/// change takes the same route and raises the same events.
///
/// A target without Health is a silent no-op. A target without a
/// StatusHolder takes damage but never receives a status effect.
class DamagePipeline final : public cre::ecs::ISystem {
public:
    /// Called once per defeated entity, after the defeated event.
    using DefeatHandler = std::function<void(cre::ecs::Entity)>;

    DamagePipeline(cre::ecs::EntityManager& entities,
                   cre::ecs::ComponentStorage<Health>& healths,
                   cre::ecs::ComponentStorage<Energy>& energies,
                   cre::ecs::ComponentStorage<StatusHolder>& statuses,
                   cre::ecs::ComponentStorage<Resistances>& resistances,
                   HitQueue& hits,
                   CombatEvents& events);

    void Execute(float deltaTime) override;

    [[nodiscard]] cre::ecs::SystemStage GetStage() const override {
        return cre::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "DamagePipeline"; }

    /// Apply one projectile hit.
    HealthChange Resolve(const ProjectileHit& hit);

    /// Apply @p damage of @p damageType after resistance and then schedule
    /// the status effect. Kind None or a non-positive duration schedules
    /// nothing; a target defeated by this hit receives no status.
    HealthChange TakeDamageAndEffect(cre::ecs::Entity entity, int32_t damage,
                                     DamageType damageType, StatusEffectKind effectKind,
                                     int32_t duration, int32_t level,
                                     float slowAmount = 0.0f,
                                     cre::ecs::Entity source = {});

    /// Damage from a status tick.
    HealthChange ApplyPeriodicDamage(cre::ecs::Entity entity, int32_t damage,
                                     DamageType damageType);

    HealthChange ApplyHeal(cre::ecs::Entity entity, int32_t amount);

    EnergyChange ApplyExhaustion(cre::ecs::Entity entity, int32_t amount);

    EnergyChange ApplyEnergyBoost(cre::ecs::Entity entity, int32_t amount);

    EnergyChange RestoreEnergy(cre::ecs::Entity entity);

    void SetDefeatHandler(DefeatHandler handler) { defeatHandler_ = std::move(handler); }

    /// Hits resolved since construction.
    [[nodiscard]] std::size_t ResolvedCount() const noexcept { return resolved_; }

private:
    HealthChange applyDamage(cre::ecs::Entity entity, int32_t damage, DamageType damageType);
    void publishHealth(cre::ecs::Entity entity, const Health& health, const HealthChange& change);
    void publishEnergy(cre::ecs::Entity entity, const Energy& energy, const EnergyChange& change);

    cre::ecs::EntityManager& entities_;
    cre::ecs::ComponentStorage<Health>& healths_;
    cre::ecs::ComponentStorage<Energy>& energies_;
    cre::ecs::ComponentStorage<StatusHolder>& statuses_;
    cre::ecs::ComponentStorage<Resistances>& resistances_;
    HitQueue& hits_;
    CombatEvents& events_;

    DefeatHandler defeatHandler_;
    std::size_t resolved_ = 0;
};

}  // namespace cre::game
