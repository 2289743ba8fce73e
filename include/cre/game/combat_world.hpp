#pragma once

/// @file combat_world.hpp
/// @brief One combat encounter: storages, systems and the casting front end.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/entity_manager.hpp"
#include "cre/ecs/system_scheduler.hpp"
#include "cre/foundation/combat_result.hpp"
#include "cre/foundation/random_source.hpp"
#include "cre/game/combat_components.hpp"
#include "cre/game/combat_events.hpp"
#include "cre/game/combat_settings.hpp"
#include "cre/game/damage_pipeline.hpp"
#include "cre/game/projectile_components.hpp"
#include "cre/game/spatial_index.hpp"
#include "cre/game/spell_book.hpp"
#include "cre/game/terrain_query.hpp"
#include "cre/game/trajectory_system.hpp"

namespace cre::game {

/// Initial state of a combatant.
struct CombatantDesc {
    Vector3 position;
    CombatTeam team = CombatTeam::Enemy;
    float hitRadius = 16.0f;
    int32_t maxHealth = 100;
    int32_t maxEnergy = 100;
};

/// Facade over one combat encounter.
///
/// Owns the entity manager, every component storage, the system scheduler
/// with its systems, the spatial index, the random source and the event hub.
/// The spell book is borrowed and must outlive the world.
///
/// A physics tick (Step) runs, in order: cooldowns, projectile motion,
/// collision, hit resolution, status ticks when due, deferred destruction.
/// Nothing advances while the combat phase is inactive; a new world starts
/// inactive.
///
/// @code
///   CombatWorld world(settings, &spells);
///   auto hero = world.CreateCombatant({.team = CombatTeam::Player});
///   world.BeginCombatPhase();
///   auto cast = world.CastSpell(hero, "ice_lance", {1, 0, 0});
///   world.Step(settings.PhysicsStep());
/// @endcode
class CombatWorld {
public:
    explicit CombatWorld(const CombatSettings& settings = {}, const SpellBook* spells = nullptr);
    ~CombatWorld();

    CombatWorld(const CombatWorld&) = delete;
    CombatWorld& operator=(const CombatWorld&) = delete;
    CombatWorld(CombatWorld&&) = delete;
    CombatWorld& operator=(CombatWorld&&) = delete;

    // ── Combatants ──────────────────────────────────────────────────────

    [[nodiscard]] cre::ecs::Entity CreateCombatant(const CombatantDesc& desc);

    /// Derive and store combat stats for @p entity.
    foundation::CombatResult<DerivedCombatStats>
    SetCharacterStats(cre::ecs::Entity entity, const CharacterStats& stats);

    foundation::CombatResult<void> SetPosition(cre::ecs::Entity entity, const Vector3& position);

    foundation::CombatResult<void> SetResistance(cre::ecs::Entity entity, DamageType type,
                                                 float percent);

    /// Record the upgrade level @p entity casts @p spellId at.
    foundation::CombatResult<void> LearnSpell(cre::ecs::Entity entity, const std::string& spellId,
                                              int32_t level = 1);

    // ── Casting ─────────────────────────────────────────────────────────

    /// Cast @p spellId from the caster's position toward @p direction.
    ///
    /// Checks run in this order and the first failure is returned:
    /// CombatPhaseInactive, CasterNotFound, UnknownSpell, SpellOnCooldown,
    /// InsufficientEnergy, InvalidProjectileConfig. A failed cast changes
    /// nothing. A successful one starts the cooldown and spends the energy
    /// cost; damage is rolled from the caster's CharacterSheet when it has
    /// one.
    ///
    /// @param targetPoint Ground-area destination; defaults to the end of
    ///        the spell's range along @p direction.
    foundation::CombatResult<cre::ecs::Entity>
    CastSpell(cre::ecs::Entity caster, std::string_view spellId, const Vector3& direction,
              std::optional<Vector3> targetPoint = std::nullopt);

    /// Spawn a projectile directly. The team is taken from the owner when it
    /// has one.
    foundation::CombatResult<cre::ecs::Entity> SpawnProjectile(const ProjectileSpec& spec);

    // ── Simulation ──────────────────────────────────────────────────────

    /// Advance one physics tick of @p deltaTime seconds. No-op while the
    /// combat phase is inactive.
    void Step(float deltaTime);

    void BeginCombatPhase();
    void EndCombatPhase();
    [[nodiscard]] bool IsCombatActive() const noexcept { return active_; }

    [[nodiscard]] uint64_t TickCount() const noexcept { return ticks_; }

    // ── Collaborators ───────────────────────────────────────────────────

    [[nodiscard]] CombatEvents& Events() noexcept { return events_; }
    [[nodiscard]] DamagePipeline& Damage() noexcept { return *pipeline_; }
    [[nodiscard]] foundation::RandomSource& Random() noexcept { return rng_; }
    [[nodiscard]] const CombatSettings& Settings() const noexcept { return settings_; }

    void SetSpellBook(const SpellBook* spells);
    [[nodiscard]] const SpellBook* Spells() const noexcept { return spells_; }

    /// nullptr disables terrain collision.
    void SetTerrain(const TerrainQuery* terrain);

    [[nodiscard]] cre::ecs::EntityManager& Entities() noexcept { return entities_; }
    [[nodiscard]] cre::ecs::SystemScheduler& Scheduler() noexcept { return scheduler_; }
    [[nodiscard]] const SpatialIndex& Index() const noexcept { return index_; }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(cre::ecs::Entity entity) const noexcept;
    [[nodiscard]] const Health* HealthOf(cre::ecs::Entity entity) const;
    [[nodiscard]] const Energy* EnergyOf(cre::ecs::Entity entity) const;
    [[nodiscard]] const StatusHolder* StatusOf(cre::ecs::Entity entity) const;
    [[nodiscard]] const CharacterSheet* SheetOf(cre::ecs::Entity entity) const;
    [[nodiscard]] const SpellCooldowns* CooldownsOf(cre::ecs::Entity entity) const;
    [[nodiscard]] std::optional<Vector3> PositionOf(cre::ecs::Entity entity) const;

    /// Strongest active chill slow on @p entity, 0 when none.
    [[nodiscard]] float SlowOf(cre::ecs::Entity entity) const;

    [[nodiscard]] const Projectile* ProjectileOf(cre::ecs::Entity entity) const;
    [[nodiscard]] std::vector<cre::ecs::Entity> Projectiles() const;
    [[nodiscard]] std::size_t ActiveProjectiles() const;

private:
    void handleFork(const ForkRequest& request);
    void handleDefeat(cre::ecs::Entity entity);
    [[nodiscard]] bool spellExists(std::string_view id) const;

    CombatSettings settings_;
    const SpellBook* spells_ = nullptr;
    bool active_ = false;
    uint64_t ticks_ = 0;

    cre::ecs::EntityManager entities_;

    cre::ecs::ComponentStorage<Transform> transforms_;
    cre::ecs::ComponentStorage<HitVolume> volumes_;
    cre::ecs::ComponentStorage<TeamMember> teams_;
    cre::ecs::ComponentStorage<Health> healths_;
    cre::ecs::ComponentStorage<Energy> energies_;
    cre::ecs::ComponentStorage<StatusHolder> statuses_;
    cre::ecs::ComponentStorage<Resistances> resistances_;
    cre::ecs::ComponentStorage<CharacterSheet> sheets_;
    cre::ecs::ComponentStorage<SpellLoadout> loadouts_;
    cre::ecs::ComponentStorage<SpellCooldowns> cooldowns_;
    cre::ecs::ComponentStorage<Projectile> projectiles_;

    SpatialIndex index_;
    HitQueue hits_;
    CombatEvents events_;
    foundation::RandomSource rng_;

    cre::ecs::SystemScheduler scheduler_;
    TrajectorySystem* trajectory_ = nullptr;
    DamagePipeline* pipeline_ = nullptr;
};

}  // namespace cre::game
