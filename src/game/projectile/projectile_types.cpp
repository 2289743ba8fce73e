/// @file projectile_types.cpp
/// @brief Archetype names and spawn-time parameter validation.

#include "cre/game/projectile_types.hpp"

#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace cre::game {

using foundation::CombatError;
using foundation::CombatResult;
using foundation::ErrorCode;

namespace {

constexpr std::array<std::pair<TrajectoryArchetype, std::string_view>, 11> kArchetypeNames = {{
    {TrajectoryArchetype::Straight, "STRAIGHT"},
    {TrajectoryArchetype::Homing, "HOMING"},
    {TrajectoryArchetype::Orbiting, "ORBITING"},
    {TrajectoryArchetype::SineWave, "SINE_WAVE"},
    {TrajectoryArchetype::Boomerang, "BOOMERANG"},
    {TrajectoryArchetype::Chain, "CHAIN"},
    {TrajectoryArchetype::Piercing, "PIERCING"},
    {TrajectoryArchetype::GroundArea, "GROUND_AOE"},
    {TrajectoryArchetype::Spiral, "SPIRAL"},
    {TrajectoryArchetype::Forking, "FORKING"},
    {TrajectoryArchetype::GrowingOrb, "GROWING_ORB"},
}};

constexpr std::array<std::pair<ForkCondition, std::string_view>, 3> kForkConditionNames = {{
    {ForkCondition::Distance, "DISTANCE"},
    {ForkCondition::Timer, "TIMER"},
    {ForkCondition::OnFirstHit, "ON_FIRST_HIT"},
}};

CombatResult<void> invalid(const ProjectileSpec& spec, std::string_view what) {
    std::string message = "invalid projectile config";
    if (!spec.spellId.empty()) {
        message += " for '" + spec.spellId + "'";
    }
    message += ": ";
    message += what;
    return CombatResult<void>::err(
        CombatError(ErrorCode::InvalidProjectileConfig, std::move(message), spec.spellId));
}

bool nonNegative(float v) {
    return std::isfinite(v) && v >= 0.0f;
}

} // namespace

std::string_view ToString(TrajectoryArchetype archetype) {
    for (const auto& [value, name] : kArchetypeNames) {
        if (value == archetype) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::optional<TrajectoryArchetype> ParseArchetype(std::string_view name) {
    for (const auto& [value, text] : kArchetypeNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view ToString(ForkCondition condition) {
    for (const auto& [value, name] : kForkConditionNames) {
        if (value == condition) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::optional<ForkCondition> ParseForkCondition(std::string_view name) {
    for (const auto& [value, text] : kForkConditionNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

CombatResult<void> ValidateProjectileSpec(const ProjectileSpec& spec,
                                          const SpellExists& spellExists) {
    const auto& t = spec.trajectory;

    if (spec.damage < 0) {
        return invalid(spec, "damage must not be negative");
    }
    if (!nonNegative(spec.speed)) {
        return invalid(spec, "speed must be a non-negative number");
    }
    if (!nonNegative(spec.range)) {
        return invalid(spec, "range must be a non-negative number");
    }
    if (!nonNegative(spec.hitRadius)) {
        return invalid(spec, "hit_radius must be a non-negative number");
    }
    if (!std::isfinite(spec.direction.x) || !std::isfinite(spec.direction.z)) {
        return invalid(spec, "direction must be finite");
    }
    if (spec.status.kind != StatusEffectKind::None) {
        if (spec.status.duration < 0) {
            return invalid(spec, "status duration must not be negative");
        }
        if (spec.status.level < 1 || spec.status.level > kMaxStatusLevel) {
            return invalid(spec, "status level must be within [1, " +
                                     std::to_string(kMaxStatusLevel) + "]");
        }
        if (!(spec.status.slowAmount >= 0.0f && spec.status.slowAmount <= 1.0f)) {
            return invalid(spec, "slow_amount must be within [0, 1]");
        }
    }

    switch (t.archetype) {
        case TrajectoryArchetype::Straight:
            break;

        case TrajectoryArchetype::Homing:
        case TrajectoryArchetype::Chain: {
            const float strength = t.EffectiveHomingStrength();
            if (!(strength >= 0.0f && strength <= 1.0f)) {
                return invalid(spec, "homing_strength must be within [0, 1]");
            }
            if (t.archetype == TrajectoryArchetype::Chain) {
                if (t.maxChains < 0) {
                    return invalid(spec, "max_chains must not be negative");
                }
                if (!nonNegative(t.chainRadius)) {
                    return invalid(spec, "chain_radius must be a non-negative number");
                }
            }
            break;
        }

        case TrajectoryArchetype::Orbiting:
            if (!nonNegative(t.orbitRadius)) {
                return invalid(spec, "orbit_radius must be a non-negative number");
            }
            if (!std::isfinite(t.angularSpeed) || !std::isfinite(t.initialAngle)) {
                return invalid(spec, "angular_speed and initial_angle must be finite");
            }
            if (!nonNegative(t.EffectiveDuration())) {
                return invalid(spec, "duration must be a non-negative number");
            }
            if (!spec.owner.isValid()) {
                return invalid(spec, "orbiting projectiles need an owner");
            }
            break;

        case TrajectoryArchetype::SineWave:
            if (!std::isfinite(t.amplitude) || !std::isfinite(t.frequency)) {
                return invalid(spec, "amplitude and frequency must be finite");
            }
            break;

        case TrajectoryArchetype::Boomerang:
            if (!spec.owner.isValid()) {
                return invalid(spec, "boomerang projectiles need an owner");
            }
            break;

        case TrajectoryArchetype::Piercing:
            if (t.pierceCount < 1) {
                return invalid(spec, "pierce_count must be at least 1");
            }
            break;

        case TrajectoryArchetype::GroundArea:
            if (!(std::isfinite(t.travelSpeed) && t.travelSpeed > 0.0f)) {
                return invalid(spec, "travel_speed must be positive");
            }
            if (!nonNegative(t.aoeRadius)) {
                return invalid(spec, "aoe_radius must be a non-negative number");
            }
            if (t.aoeDamage < 0) {
                return invalid(spec, "aoe_damage must not be negative");
            }
            if (!nonNegative(t.delayAfterArrival)) {
                return invalid(spec, "delay_after_arrival must be a non-negative number");
            }
            break;

        case TrajectoryArchetype::Spiral:
            if (!nonNegative(t.expansionSpeed) || !nonNegative(t.baseTravelSpeed) ||
                !nonNegative(t.initialRadius)) {
                return invalid(spec, "spiral radii and speeds must be non-negative numbers");
            }
            if (!std::isfinite(t.rotationSpeed)) {
                return invalid(spec, "rotation_speed must be finite");
            }
            if (!nonNegative(t.EffectiveDuration())) {
                return invalid(spec, "duration must be a non-negative number");
            }
            break;

        case TrajectoryArchetype::Forking:
            if (t.forkCount < 1) {
                return invalid(spec, "fork_count must be positive");
            }
            if (!nonNegative(t.forkConditionValue)) {
                return invalid(spec, "fork_condition_value must be a non-negative number");
            }
            if (!(t.forkAngleSpread >= 0.0f && t.forkAngleSpread <= 360.0f)) {
                return invalid(spec, "fork_angle_spread must be within [0, 360]");
            }
            if (t.childSpellId.empty()) {
                return invalid(spec, "child_spell_id is required");
            }
            if (t.childSpellId == spec.spellId) {
                return invalid(spec, "child_spell_id must not reference the forking spell");
            }
            if (!spellExists || !spellExists(t.childSpellId)) {
                return invalid(spec, "unknown child_spell_id '" + t.childSpellId + "'");
            }
            break;

        case TrajectoryArchetype::GrowingOrb:
            if (!nonNegative(t.initialRadius) || !nonNegative(t.growthRate)) {
                return invalid(spec, "initial_radius and growth_rate must be non-negative numbers");
            }
            if (!(t.maxRadius >= t.initialRadius) || !std::isfinite(t.maxRadius)) {
                return invalid(spec, "max_radius must be at least initial_radius");
            }
            if (std::isnan(t.growthDuration) || t.growthDuration < 0.0f) {
                return invalid(spec, "growth_duration must not be negative");
            }
            break;
    }

    return CombatResult<void>::ok();
}

}  // namespace cre::game
