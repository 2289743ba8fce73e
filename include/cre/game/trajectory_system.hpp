#pragma once

/// @file trajectory_system.hpp
/// @brief Per-tick projectile motion, collision detection and expiry.

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/entity_manager.hpp"
#include "cre/ecs/system_scheduler.hpp"
#include "cre/foundation/combat_result.hpp"
#include "cre/game/combat_components.hpp"
#include "cre/game/projectile_components.hpp"
#include "cre/game/spatial_index.hpp"
#include "cre/game/terrain_query.hpp"

namespace cre::game {

/// Advances every live projectile by one physics tick.
///
/// Execute() runs in three passes so that no projectile sees another's
/// partial state:
///   1. Motion: every projectile moves by its archetype rule and is expired
///      when it runs out of range or lifetime. Ground-area projectiles
///      detonate here.
///   2. Collision: every projectile still live is tested against the hit
///      volumes of eligible targets. A hit is recorded only when a target
///      enters the projectile's volume.
///   3. Forks: split requests collected in passes 1 and 2 go to the fork
///      handler, which spawns the children.
///
/// Hits are appended to the shared HitQueue and resolved by the
/// DamagePipeline later in the same tick. Destroyed projectiles go through
/// EntityManager::DestroyDeferred().
class TrajectorySystem final : public cre::ecs::ISystem {
public:
    using ForkHandler = std::function<void(const ForkRequest&)>;

    TrajectorySystem(cre::ecs::EntityManager& entities,
                     cre::ecs::ComponentStorage<Projectile>& projectiles,
                     cre::ecs::ComponentStorage<Transform>& transforms,
                     cre::ecs::ComponentStorage<TeamMember>& teams,
                     cre::ecs::ComponentStorage<Health>& healths,
                     SpatialIndex& index,
                     HitQueue& hits);

    void Execute(float deltaTime) override;

    [[nodiscard]] cre::ecs::SystemStage GetStage() const override {
        return cre::ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override { return "TrajectorySystem"; }

    /// Validate @p spec and create the projectile.
    /// @return The projectile entity or InvalidProjectileConfig.
    [[nodiscard]] foundation::CombatResult<cre::ecs::Entity> Spawn(const ProjectileSpec& spec);

    /// Expire every projectile owned by @p owner.
    void CancelOwnedBy(cre::ecs::Entity owner);

    /// Projectiles not yet expired.
    [[nodiscard]] std::size_t ActiveCount() const;

    void SetForkHandler(ForkHandler handler) { forkHandler_ = std::move(handler); }

    /// The terrain is not owned and must outlive the system. nullptr disables
    /// terrain collision.
    void SetTerrain(const TerrainQuery* terrain) noexcept { terrain_ = terrain; }

    void SetSpellLookup(SpellExists lookup) { spellExists_ = std::move(lookup); }

private:
    void advance(cre::ecs::Entity entity, Projectile& p, float dt);
    void integrateStraight(Projectile& p, float dt);
    void steerToward(Projectile& p, const Vector3& targetPos, float strength);
    void advanceBoomerang(cre::ecs::Entity entity, Projectile& p, float dt);
    void advanceGroundArea(cre::ecs::Entity entity, Projectile& p, float dt);
    bool forkConditionMet(const Projectile& p) const;

    void detectCollisions(cre::ecs::Entity entity, Projectile& p);
    void onEnter(cre::ecs::Entity entity, Projectile& p, cre::ecs::Entity target);

    [[nodiscard]] bool isEligibleTarget(const Projectile& p, cre::ecs::Entity target) const;
    [[nodiscard]] std::optional<cre::ecs::Entity>
    nearestTarget(const Projectile& p, const Vector3& from, float maxRadius, bool skipStruck) const;
    [[nodiscard]] std::optional<Vector3> ownerPosition(const Projectile& p) const;

    void emitHit(cre::ecs::Entity entity, const Projectile& p, cre::ecs::Entity target,
                 int32_t damage, bool area);
    void queueFork(cre::ecs::Entity entity, Projectile& p);
    void expire(cre::ecs::Entity entity, Projectile& p, std::string_view reason);

    cre::ecs::EntityManager& entities_;
    cre::ecs::ComponentStorage<Projectile>& projectiles_;
    cre::ecs::ComponentStorage<Transform>& transforms_;
    cre::ecs::ComponentStorage<TeamMember>& teams_;
    cre::ecs::ComponentStorage<Health>& healths_;
    SpatialIndex& index_;
    HitQueue& hits_;

    ForkHandler forkHandler_;
    SpellExists spellExists_;
    const TerrainQuery* terrain_ = nullptr;
    std::vector<ForkRequest> pendingForks_;
};

}  // namespace cre::game
