#pragma once

/// @file projectile_components.hpp
/// @brief In-flight projectile state and the hit records it produces.

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "cre/ecs/entity.hpp"
#include "cre/game/combat_types.hpp"
#include "cre/game/math_types.hpp"
#include "cre/game/projectile_types.hpp"

namespace cre::game {

/// Ground-area lifecycle.
enum class GroundAreaPhase : uint8_t {
    Travelling,
    Waiting,
    Detonated
};

/// A live projectile.
///
/// Built from a ProjectileSpec at spawn; the TrajectorySystem is the only
/// writer afterwards.
struct Projectile {
    std::string spellId;
    cre::ecs::Entity owner;
    CombatTeam team = CombatTeam::Player;
    TrajectoryParams params;

    Vector3 position;
    Vector3 velocity;
    float speed = 0.0f;
    float range = 0.0f;
    float hitRadius = 0.0f;

    int32_t damage = 0;
    DamageType damageType = DamageType::Physical;
    StatusPayload status;

    float elapsed = 0.0f;
    float distanceTravelled = 0.0f;  ///< Current leg or chain segment.

    // Sine-wave base point and spiral centre, with the launch heading.
    Vector3 anchor;
    Vector3 heading;

    float angle = 0.0f;          ///< Orbit and spiral angle (rad).
    float spiralRadius = 0.0f;

    bool returning = false;      ///< Boomerang return leg.

    int32_t chainsRemaining = 0;
    int32_t pierceRemaining = 0;
    cre::ecs::Entity chainTarget;

    GroundAreaPhase areaPhase = GroundAreaPhase::Travelling;
    Vector3 targetPoint;
    float arrivalTimer = 0.0f;

    bool forkPending = false;
    bool expired = false;        ///< Queued for destruction this tick.

    /// Targets this projectile has damaged (pierce and chain never repeat).
    std::unordered_set<cre::ecs::Entity> struck;

    /// Targets overlapping the projectile as of the last collision pass.
    std::unordered_set<cre::ecs::Entity> contacts;

    [[nodiscard]] TrajectoryArchetype Archetype() const noexcept { return params.archetype; }
};

/// One damage application produced by the trajectory system and consumed by
/// the damage pipeline in the same tick.
struct ProjectileHit {
    cre::ecs::Entity projectile;
    cre::ecs::Entity owner;
    cre::ecs::Entity target;
    std::string spellId;
    int32_t damage = 0;
    DamageType damageType = DamageType::Physical;
    StatusPayload status;
    Vector3 point;
    bool area = false;  ///< Ground-area detonation rather than a contact hit.
};

using HitQueue = std::vector<ProjectileHit>;

/// Request to split a forking projectile into children.
struct ForkRequest {
    cre::ecs::Entity parent;
    cre::ecs::Entity owner;
    CombatTeam team = CombatTeam::Player;
    std::string parentSpellId;
    std::string childSpellId;
    Vector3 position;
    std::vector<Vector3> headings;
};

/// Child headings for a fork: @p count headings evenly spread over
/// @p spreadDegrees centred on @p heading. A single child keeps the heading.
[[nodiscard]] std::vector<Vector3> ForkHeadings(const Vector3& heading, int32_t count,
                                                float spreadDegrees);

}  // namespace cre::game
