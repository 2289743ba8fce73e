#pragma once

/// @file projectile_types.hpp
/// @brief Trajectory archetypes, their parameters and spawn validation.

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "cre/ecs/entity.hpp"
#include "cre/foundation/combat_result.hpp"
#include "cre/game/combat_types.hpp"
#include "cre/game/math_types.hpp"

namespace cre::game {

/// Kinematic rule a projectile follows each physics tick.
enum class TrajectoryArchetype : uint8_t {
    Straight,
    Homing,
    Orbiting,
    SineWave,
    Boomerang,
    Chain,
    Piercing,
    GroundArea,
    Spiral,
    Forking,
    GrowingOrb
};

/// When a forking projectile splits.
enum class ForkCondition : uint8_t {
    Distance,   ///< Distance travelled reaches the condition value.
    Timer,      ///< Elapsed seconds reach the condition value.
    OnFirstHit  ///< The first hit lands, then the split happens.
};

/// Data names: STRAIGHT, HOMING, ORBITING, SINE_WAVE, BOOMERANG, CHAIN,
/// PIERCING, GROUND_AOE, SPIRAL, FORKING, GROWING_ORB.
[[nodiscard]] std::string_view ToString(TrajectoryArchetype archetype);
[[nodiscard]] std::optional<TrajectoryArchetype> ParseArchetype(std::string_view name);

/// Data names: DISTANCE, TIMER, ON_FIRST_HIT.
[[nodiscard]] std::string_view ToString(ForkCondition condition);
[[nodiscard]] std::optional<ForkCondition> ParseForkCondition(std::string_view name);

/// Archetype-specific parameters. Fields irrelevant to the selected
/// archetype are ignored. Defaults follow the shipped spell data.
struct TrajectoryParams {
    TrajectoryArchetype archetype = TrajectoryArchetype::Straight;

    // Homing and chain steering; unset means 0.05 (homing) or 0.1 (chain).
    std::optional<float> homingStrength;

    // Orbiting
    float orbitRadius = 75.0f;
    float angularSpeed = 2.0f;  ///< rad/s
    float initialAngle = 0.0f;  ///< rad

    // Orbiting and spiral lifetime; unset means 10 s (orbit) or 1.5 s (spiral).
    std::optional<float> duration;

    // Sine wave
    float amplitude = 30.0f;
    float frequency = 5.0f;

    // Chain
    int32_t maxChains = 3;
    float chainRadius = 150.0f;

    // Piercing
    int32_t pierceCount = 3;

    // Ground area
    float travelSpeed = 500.0f;
    float aoeRadius = 75.0f;
    int32_t aoeDamage = 30;
    float delayAfterArrival = 0.3f;

    // Forking
    ForkCondition forkCondition = ForkCondition::Distance;
    float forkConditionValue = 150.0f;
    int32_t forkCount = 3;
    float forkAngleSpread = 45.0f;  ///< degrees
    std::string childSpellId;

    // Spiral
    float expansionSpeed = 40.0f;
    float rotationSpeed = 720.0f;  ///< degrees/s
    float baseTravelSpeed = 150.0f;

    // Spiral start radius and growing-orb start hit radius.
    float initialRadius = 5.0f;

    // Growing orb
    float maxRadius = 30.0f;
    float growthRate = 10.0f;
    float growthDuration = std::numeric_limits<float>::infinity();

    [[nodiscard]] float EffectiveHomingStrength() const {
        return homingStrength.value_or(archetype == TrajectoryArchetype::Chain ? 0.1f : 0.05f);
    }

    [[nodiscard]] float EffectiveDuration() const {
        return duration.value_or(archetype == TrajectoryArchetype::Spiral ? 1.5f : 10.0f);
    }
};

/// Highest status effect level a payload may carry.
inline constexpr int32_t kMaxStatusLevel = 100;

/// Status effect a projectile leaves on the targets it damages.
struct StatusPayload {
    StatusEffectKind kind = StatusEffectKind::None;
    int32_t duration = 0;  ///< In status ticks.
    int32_t level = 1;
    float slowAmount = 0.0f;
};

/// Everything needed to put one projectile in flight.
struct ProjectileSpec {
    std::string spellId;
    cre::ecs::Entity owner;
    CombatTeam team = CombatTeam::Player;

    Vector3 origin;
    Vector3 direction{1.0f, 0.0f, 0.0f};
    std::optional<Vector3> targetPoint;  ///< Ground-area destination.

    int32_t damage = 0;
    DamageType damageType = DamageType::Physical;
    StatusPayload status;

    float speed = 300.0f;
    float range = 500.0f;
    float hitRadius = 5.0f;

    TrajectoryParams trajectory;
};

/// Answers whether a spell id names a known spell (fork children).
using SpellExists = std::function<bool(std::string_view)>;

/// Reject malformed parameters before anything is spawned.
/// @return InvalidProjectileConfig naming the offending field.
[[nodiscard]] foundation::CombatResult<void>
ValidateProjectileSpec(const ProjectileSpec& spec, const SpellExists& spellExists);

}  // namespace cre::game
