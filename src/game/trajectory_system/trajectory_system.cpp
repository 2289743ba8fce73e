/// @file trajectory_system.cpp
/// @brief Archetype kinematics, entry-based collision and fork requests.

#include "cre/game/trajectory_system.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using cre::ecs::Entity;
using foundation::CombatResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr float kInfinity = std::numeric_limits<float>::infinity();

Vector3 flatten(const Vector3& v) {
    return {v.x, 0.0f, v.z};
}

bool blockedByTerrain(TrajectoryArchetype archetype) {
    return archetype != TrajectoryArchetype::Piercing &&
           archetype != TrajectoryArchetype::GroundArea;
}

void logProjectile(LogLevel level, std::string_view msg, Entity entity, const Projectile& p) {
    auto& logger = foundation::CombatLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Trajectory)) {
        return;
    }
    LogContext ctx;
    ctx.entity = entity.raw;
    ctx.spellId = p.spellId;
    ctx.extra["archetype"] = std::string(ToString(p.Archetype()));
    logger.logWithContext(level, LogCategory::Trajectory, msg, ctx);
}

} // namespace

std::vector<Vector3> ForkHeadings(const Vector3& heading, int32_t count, float spreadDegrees) {
    std::vector<Vector3> headings;
    if (count <= 0) {
        return headings;
    }

    Vector3 base = flatten(heading).Normalized();
    if (base.LengthSquared() == 0.0f) {
        base = Vector3{1.0f, 0.0f, 0.0f};
    }
    if (count == 1) {
        headings.push_back(base);
        return headings;
    }

    const float baseAngle = base.Heading();
    const float spread = DegToRad(spreadDegrees);
    const float step = spread / static_cast<float>(count - 1);
    headings.reserve(static_cast<std::size_t>(count));
    for (int32_t i = 0; i < count; ++i) {
        headings.push_back(Vector3::FromHeading(baseAngle - spread / 2.0f + step * static_cast<float>(i)));
    }
    return headings;
}

TrajectorySystem::TrajectorySystem(cre::ecs::EntityManager& entities,
                                   cre::ecs::ComponentStorage<Projectile>& projectiles,
                                   cre::ecs::ComponentStorage<Transform>& transforms,
                                   cre::ecs::ComponentStorage<TeamMember>& teams,
                                   cre::ecs::ComponentStorage<Health>& healths,
                                   SpatialIndex& index,
                                   HitQueue& hits)
    : entities_(entities),
      projectiles_(projectiles),
      transforms_(transforms),
      teams_(teams),
      healths_(healths),
      index_(index),
      hits_(hits) {}

// ── Spawning ────────────────────────────────────────────────────────────

CombatResult<Entity> TrajectorySystem::Spawn(const ProjectileSpec& spec) {
    auto valid = ValidateProjectileSpec(spec, spellExists_);
    if (valid.hasError()) {
        CRE_LOG_WARN(LogCategory::Trajectory, std::string(valid.error().message()));
        return CombatResult<Entity>::err(valid.error());
    }

    Projectile p;
    p.spellId = spec.spellId;
    p.owner = spec.owner;
    p.team = spec.team;
    p.params = spec.trajectory;
    p.position = spec.origin;
    p.speed = spec.speed;
    p.range = spec.range;
    p.hitRadius = spec.hitRadius;
    p.damage = spec.damage;
    p.damageType = spec.damageType;
    p.status = spec.status;

    Vector3 dir = flatten(spec.direction).Normalized();
    if (dir.LengthSquared() == 0.0f) {
        dir = Vector3{1.0f, 0.0f, 0.0f};
    }
    p.heading = dir;
    p.anchor = spec.origin;
    p.velocity = dir * spec.speed;

    const auto& t = spec.trajectory;
    switch (t.archetype) {
        case TrajectoryArchetype::Orbiting: {
            p.angle = t.initialAngle;
            auto center = ownerPosition(p).value_or(spec.origin);
            p.position = center + Vector3::FromHeading(p.angle) * t.orbitRadius;
            break;
        }
        case TrajectoryArchetype::Spiral:
            p.spiralRadius = t.initialRadius;
            p.angle = dir.Heading();
            p.position = p.anchor + Vector3::FromHeading(p.angle) * p.spiralRadius;
            break;
        case TrajectoryArchetype::Chain:
            p.chainsRemaining = t.maxChains;
            break;
        case TrajectoryArchetype::Piercing:
            p.pierceRemaining = t.pierceCount;
            break;
        case TrajectoryArchetype::GroundArea: {
            p.targetPoint = spec.targetPoint.value_or(spec.origin + dir * spec.range);
            p.targetPoint.y = spec.origin.y;
            auto toTarget = flatten(p.targetPoint - p.position);
            if (toTarget.LengthSquared() == 0.0f) {
                p.areaPhase = GroundAreaPhase::Waiting;
                p.arrivalTimer = t.delayAfterArrival;
                p.velocity = Vector3::Zero();
            } else {
                p.velocity = toTarget.Normalized() * t.travelSpeed;
            }
            break;
        }
        case TrajectoryArchetype::GrowingOrb:
            p.hitRadius = t.initialRadius;
            break;
        default:
            break;
    }

    const auto entity = entities_.Create();
    auto& stored = projectiles_.Add(entity, std::move(p));
    logProjectile(LogLevel::Debug, "Projectile spawned", entity, stored);
    return CombatResult<Entity>::ok(entity);
}

void TrajectorySystem::CancelOwnedBy(Entity owner) {
    for (auto entity : projectiles_.Entities()) {
        auto& p = projectiles_.Get(entity);
        if (p.owner == owner && !p.expired) {
            expire(entity, p, "Projectile cancelled, owner removed");
        }
    }
}

std::size_t TrajectorySystem::ActiveCount() const {
    return static_cast<std::size_t>(std::count_if(
        projectiles_.begin(), projectiles_.end(),
        [](const Projectile& p) { return !p.expired; }));
}

// ── Tick ────────────────────────────────────────────────────────────────

void TrajectorySystem::Execute(float deltaTime) {
    pendingForks_.clear();
    const auto handles = projectiles_.Entities();

    for (auto entity : handles) {
        auto* p = projectiles_.TryGet(entity);
        if (p == nullptr || p->expired) {
            continue;
        }
        advance(entity, *p, deltaTime);
    }

    for (auto entity : handles) {
        auto* p = projectiles_.TryGet(entity);
        if (p == nullptr || p->expired || p->Archetype() == TrajectoryArchetype::GroundArea) {
            continue;
        }
        detectCollisions(entity, *p);
    }

    // Fork children are added to the projectile storage, so they are spawned
    // only after both passes are done with it.
    auto forks = std::move(pendingForks_);
    pendingForks_.clear();
    for (const auto& request : forks) {
        if (forkHandler_) {
            forkHandler_(request);
        } else {
            CRE_LOG_WARN(LogCategory::Trajectory,
                         "Fork of '" + request.parentSpellId + "' dropped, no fork handler");
        }
    }
}

// ── Motion ──────────────────────────────────────────────────────────────

void TrajectorySystem::advance(Entity entity, Projectile& p, float dt) {
    const auto& t = p.params;
    p.elapsed += dt;

    switch (t.archetype) {
        case TrajectoryArchetype::Straight:
        case TrajectoryArchetype::Piercing:
        case TrajectoryArchetype::Forking:
            integrateStraight(p, dt);
            break;

        case TrajectoryArchetype::Homing: {
            auto target = nearestTarget(p, p.position, kInfinity, false);
            if (target) {
                if (auto pos = index_.PositionOf(*target)) {
                    steerToward(p, *pos, t.EffectiveHomingStrength());
                }
            }
            integrateStraight(p, dt);
            break;
        }

        case TrajectoryArchetype::Chain: {
            std::optional<Entity> target;
            if (isEligibleTarget(p, p.chainTarget) && !p.struck.contains(p.chainTarget)) {
                target = p.chainTarget;
            } else {
                target = nearestTarget(p, p.position, kInfinity, true);
            }
            if (target) {
                if (auto pos = index_.PositionOf(*target)) {
                    steerToward(p, *pos, t.EffectiveHomingStrength());
                }
            }
            integrateStraight(p, dt);
            break;
        }

        case TrajectoryArchetype::Orbiting: {
            auto center = ownerPosition(p);
            if (!center) {
                expire(entity, p, "Orbit ended, owner gone");
                return;
            }
            if (p.elapsed > t.EffectiveDuration()) {
                expire(entity, p, "Orbit duration elapsed");
                return;
            }
            p.angle += t.angularSpeed * dt;
            const auto previous = p.position;
            p.position = *center + Vector3::FromHeading(p.angle) * t.orbitRadius;
            p.velocity = dt > 0.0f ? (p.position - previous) * (1.0f / dt) : Vector3::Zero();
            break;
        }

        case TrajectoryArchetype::SineWave: {
            p.anchor += p.heading * (p.speed * dt);
            p.distanceTravelled += p.speed * dt;
            const Vector3 lateral{-p.heading.z, 0.0f, p.heading.x};
            const float offset = t.amplitude * std::sin(t.frequency * p.elapsed);
            p.position = p.anchor + lateral * offset;
            break;
        }

        case TrajectoryArchetype::Boomerang:
            advanceBoomerang(entity, p, dt);
            break;

        case TrajectoryArchetype::GroundArea:
            advanceGroundArea(entity, p, dt);
            return;

        case TrajectoryArchetype::Spiral: {
            if (p.elapsed > t.EffectiveDuration()) {
                expire(entity, p, "Spiral duration elapsed");
                return;
            }
            p.anchor += p.heading * (t.baseTravelSpeed * dt);
            p.spiralRadius += t.expansionSpeed * dt;
            p.angle += DegToRad(t.rotationSpeed) * dt;
            p.position = p.anchor + Vector3::FromHeading(p.angle) * p.spiralRadius;
            break;
        }

        case TrajectoryArchetype::GrowingOrb: {
            integrateStraight(p, dt);
            if (p.hitRadius < t.maxRadius && p.elapsed <= t.growthDuration) {
                p.hitRadius = std::min(t.maxRadius, p.hitRadius + t.growthRate * dt);
            }
            break;
        }
    }

    if (p.expired) {
        return;
    }

    switch (t.archetype) {
        case TrajectoryArchetype::Straight:
        case TrajectoryArchetype::Homing:
        case TrajectoryArchetype::Chain:
        case TrajectoryArchetype::Piercing:
        case TrajectoryArchetype::SineWave:
        case TrajectoryArchetype::GrowingOrb:
            if (p.distanceTravelled > p.range) {
                expire(entity, p, "Projectile out of range");
                return;
            }
            break;
        case TrajectoryArchetype::Forking:
            if (forkConditionMet(p)) {
                queueFork(entity, p);
                return;
            }
            if (p.distanceTravelled > p.range) {
                expire(entity, p, "Fork range reached without splitting");
                return;
            }
            break;
        default:
            break;
    }

    if (terrain_ != nullptr && blockedByTerrain(t.archetype) && terrain_->IsBlocked(p.position)) {
        expire(entity, p, "Projectile hit terrain");
    }
}

void TrajectorySystem::integrateStraight(Projectile& p, float dt) {
    p.position += p.velocity * dt;
    p.distanceTravelled += p.velocity.Length() * dt;
}

void TrajectorySystem::steerToward(Projectile& p, const Vector3& targetPos, float strength) {
    const auto toTarget = flatten(targetPos - p.position).Normalized();
    if (toTarget.LengthSquared() == 0.0f) {
        return;
    }
    const auto blended = Lerp(p.velocity, toTarget * p.speed, strength);
    if (blended.LengthSquared() > 1e-12f) {
        p.velocity = blended.Normalized() * p.speed;
    }
}

void TrajectorySystem::advanceBoomerang(Entity entity, Projectile& p, float dt) {
    auto ownerPos = ownerPosition(p);
    if (!ownerPos) {
        expire(entity, p, "Boomerang lost its owner");
        return;
    }

    const float step = p.speed * dt;
    if (!p.returning) {
        p.position += p.velocity * dt;
        p.distanceTravelled += step;
        if (p.distanceTravelled >= p.range / 2.0f) {
            p.returning = true;
            p.distanceTravelled = 0.0f;
        }
        return;
    }

    const auto toOwner = flatten(*ownerPos - p.position);
    if (toOwner.Length() <= step) {
        p.position = Vector3{ownerPos->x, p.position.y, ownerPos->z};
        expire(entity, p, "Boomerang returned");
        return;
    }

    p.velocity = toOwner.Normalized() * p.speed;
    p.position += p.velocity * dt;
    p.distanceTravelled += step;

    if (p.distanceTravelled > 1.5f * p.range) {
        expire(entity, p, "Boomerang return leg exhausted");
    }
}

void TrajectorySystem::advanceGroundArea(Entity entity, Projectile& p, float dt) {
    const auto& t = p.params;

    if (p.areaPhase == GroundAreaPhase::Travelling) {
        const auto toTarget = flatten(p.targetPoint - p.position);
        const float step = t.travelSpeed * dt;
        if (toTarget.Length() > step) {
            p.position += toTarget.Normalized() * step;
            return;
        }
        p.position = p.targetPoint;
        p.velocity = Vector3::Zero();
        p.areaPhase = GroundAreaPhase::Waiting;
        p.arrivalTimer = t.delayAfterArrival;
        logProjectile(LogLevel::Trace, "Ground area arrived", entity, p);
        // Without a delay the blast lands on the arrival tick.
        if (p.arrivalTimer > 1e-6f) {
            return;
        }
    } else if (p.areaPhase == GroundAreaPhase::Waiting) {
        p.arrivalTimer -= dt;
        if (p.arrivalTimer > 1e-6f) {
            return;
        }
    } else {
        return;
    }

    for (auto target : index_.QueryRadius(p.position, t.aoeRadius)) {
        if (isEligibleTarget(p, target)) {
            emitHit(entity, p, target, t.aoeDamage, true);
        }
    }
    p.areaPhase = GroundAreaPhase::Detonated;
    expire(entity, p, "Ground area detonated");
}

bool TrajectorySystem::forkConditionMet(const Projectile& p) const {
    switch (p.params.forkCondition) {
        case ForkCondition::Distance:
            return p.distanceTravelled >= p.params.forkConditionValue;
        case ForkCondition::Timer:
            return p.elapsed >= p.params.forkConditionValue;
        case ForkCondition::OnFirstHit:
            return false;
    }
    return false;
}

// ── Collision ───────────────────────────────────────────────────────────

void TrajectorySystem::detectCollisions(Entity entity, Projectile& p) {
    std::vector<Entity> overlapping;
    for (auto target : index_.QueryOverlap(p.position, p.hitRadius)) {
        if (isEligibleTarget(p, target)) {
            overlapping.push_back(target);
        }
    }

    for (auto target : overlapping) {
        if (p.contacts.contains(target)) {
            continue;
        }
        onEnter(entity, p, target);
        if (p.expired) {
            return;
        }
    }

    p.contacts = std::unordered_set<Entity>(overlapping.begin(), overlapping.end());
}

void TrajectorySystem::onEnter(Entity entity, Projectile& p, Entity target) {
    switch (p.Archetype()) {
        case TrajectoryArchetype::Piercing:
            if (p.struck.contains(target)) {
                return;
            }
            p.struck.insert(target);
            emitHit(entity, p, target, p.damage, false);
            if (--p.pierceRemaining <= 0) {
                expire(entity, p, "Pierce count exhausted");
            }
            return;

        case TrajectoryArchetype::Chain: {
            if (p.struck.contains(target)) {
                return;
            }
            p.struck.insert(target);
            emitHit(entity, p, target, p.damage, false);
            if (p.chainsRemaining <= 0) {
                expire(entity, p, "Chain exhausted");
                return;
            }
            auto next = nearestTarget(p, p.position, p.params.chainRadius, true);
            if (!next) {
                expire(entity, p, "Chain found no next target");
                return;
            }
            --p.chainsRemaining;
            p.chainTarget = *next;
            p.distanceTravelled = 0.0f;
            if (auto pos = index_.PositionOf(*next)) {
                auto dir = flatten(*pos - p.position).Normalized();
                if (dir.LengthSquared() > 0.0f) {
                    p.velocity = dir * p.speed;
                }
            }
            logProjectile(LogLevel::Trace, "Chain jumped", entity, p);
            return;
        }

        case TrajectoryArchetype::Forking:
            emitHit(entity, p, target, p.damage, false);
            if (p.params.forkCondition == ForkCondition::OnFirstHit) {
                queueFork(entity, p);
            } else {
                expire(entity, p, "Projectile hit target");
            }
            return;

        default:
            emitHit(entity, p, target, p.damage, false);
            expire(entity, p, "Projectile hit target");
            return;
    }
}

bool TrajectorySystem::isEligibleTarget(const Projectile& p, Entity target) const {
    if (!target.isValid() || target == p.owner || !entities_.IsAlive(target)) {
        return false;
    }
    const auto* team = teams_.TryGet(target);
    if (team == nullptr || !AreOpposed(p.team, team->team)) {
        return false;
    }
    const auto* health = healths_.TryGet(target);
    return health == nullptr || !health->IsDefeated();
}

std::optional<Entity> TrajectorySystem::nearestTarget(const Projectile& p, const Vector3& from,
                                                      float maxRadius, bool skipStruck) const {
    return index_.Nearest(from, maxRadius, [&](Entity candidate) {
        if (skipStruck && p.struck.contains(candidate)) {
            return false;
        }
        return isEligibleTarget(p, candidate);
    });
}

std::optional<Vector3> TrajectorySystem::ownerPosition(const Projectile& p) const {
    if (!entities_.IsAlive(p.owner)) {
        return std::nullopt;
    }
    if (const auto* transform = transforms_.TryGet(p.owner)) {
        return transform->position;
    }
    return std::nullopt;
}

// ── Outputs ─────────────────────────────────────────────────────────────

void TrajectorySystem::emitHit(Entity entity, const Projectile& p, Entity target,
                               int32_t damage, bool area) {
    ProjectileHit hit;
    hit.projectile = entity;
    hit.owner = p.owner;
    hit.target = target;
    hit.spellId = p.spellId;
    hit.damage = damage;
    hit.damageType = p.damageType;
    hit.status = p.status;
    hit.point = p.position;
    hit.area = area;
    hits_.push_back(std::move(hit));
}

void TrajectorySystem::queueFork(Entity entity, Projectile& p) {
    p.forkPending = true;

    ForkRequest request;
    request.parent = entity;
    request.owner = p.owner;
    request.team = p.team;
    request.parentSpellId = p.spellId;
    request.childSpellId = p.params.childSpellId;
    request.position = p.position;
    request.headings = ForkHeadings(p.velocity, p.params.forkCount, p.params.forkAngleSpread);
    pendingForks_.push_back(std::move(request));

    expire(entity, p, "Projectile forked");
}

void TrajectorySystem::expire(Entity entity, Projectile& p, std::string_view reason) {
    if (p.expired) {
        return;
    }
    p.expired = true;
    entities_.DestroyDeferred(entity);
    logProjectile(LogLevel::Debug, reason, entity, p);
}

}  // namespace cre::game
