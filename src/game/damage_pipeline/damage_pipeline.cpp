/// @file damage_pipeline.cpp
/// @brief DamagePipeline implementation.
///
/// Every health change goes through applyDamage() or ApplyHeal(), which
/// mutate Health through its clamping mutators and publish the change:
///   healthChanged on every change, then defeated once, then the defeat
///   handler and deferred destruction.

#include "cre/game/damage_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using cre::ecs::Entity;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

int32_t ApplyResistance(int32_t damage, float resistancePercent) noexcept {
    if (damage <= 0) {
        return 0;
    }
    const float resistance = std::clamp(resistancePercent, 0.0f, 100.0f);
    if (resistance >= 100.0f) {
        return 0;
    }
    const auto scaled = static_cast<int32_t>(
        std::floor(static_cast<double>(damage) * (1.0 - resistance / 100.0)));
    return std::max(scaled, 1);
}

DamagePipeline::DamagePipeline(cre::ecs::EntityManager& entities,
                               cre::ecs::ComponentStorage<Health>& healths,
                               cre::ecs::ComponentStorage<Energy>& energies,
                               cre::ecs::ComponentStorage<StatusHolder>& statuses,
                               cre::ecs::ComponentStorage<Resistances>& resistances,
                               HitQueue& hits,
                               CombatEvents& events)
    : entities_(entities),
      healths_(healths),
      energies_(energies),
      statuses_(statuses),
      resistances_(resistances),
      hits_(hits),
      events_(events) {}

void DamagePipeline::Execute(float /*deltaTime*/) {
    // Handlers may spawn or cancel projectiles, which can queue new hits.
    HitQueue pending;
    pending.swap(hits_);
    for (const auto& hit : pending) {
        Resolve(hit);
    }
}

HealthChange DamagePipeline::Resolve(const ProjectileHit& hit) {
    ++resolved_;

    auto& logger = foundation::CombatLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Damage)) {
        LogContext ctx;
        ctx.entity = hit.target.raw;
        ctx.spellId = hit.spellId;
        ctx.extra["damage"] = std::to_string(hit.damage);
        ctx.extra["type"] = std::string(ToString(hit.damageType));
        if (hit.area) {
            ctx.extra["area"] = "true";
        }
        logger.logWithContext(LogLevel::Debug, LogCategory::Damage, "Resolving hit", ctx);
    }

    return TakeDamageAndEffect(hit.target, hit.damage, hit.damageType, hit.status.kind,
                               hit.status.duration, hit.status.level, hit.status.slowAmount,
                               hit.owner);
}

HealthChange DamagePipeline::TakeDamageAndEffect(Entity entity, int32_t damage,
                                                 DamageType damageType,
                                                 StatusEffectKind effectKind,
                                                 int32_t duration, int32_t level,
                                                 float slowAmount, Entity source) {
    if (!healths_.Has(entity)) {
        return {};
    }

    auto change = applyDamage(entity, damage, damageType);

    if (effectKind == StatusEffectKind::None || duration <= 0) {
        return change;
    }
    if (healths_.Get(entity).IsDefeated()) {
        return change;
    }
    auto* holder = statuses_.TryGet(entity);
    if (holder == nullptr) {
        return change;
    }

    StatusEffectInstance instance;
    instance.kind = effectKind;
    instance.level = std::clamp(level, 1, kMaxStatusLevel);
    instance.remainingTicks = duration;
    instance.sourceType = damageType;
    instance.slowAmount = effectKind == StatusEffectKind::Chill ? slowAmount : 0.0f;
    instance.source = source;
    const auto& applied = holder->Apply(instance);

    CRE_LOG_DEBUG(LogCategory::Status,
                  "Applied " + std::string(ToString(applied.kind)) + " level " +
                      std::to_string(applied.level) + " for " +
                      std::to_string(applied.remainingTicks) + " ticks to entity " +
                      std::to_string(entity.raw));
    events_.statusApplied.emit(entity, applied.kind);
    return change;
}

HealthChange DamagePipeline::ApplyPeriodicDamage(Entity entity, int32_t damage,
                                                 DamageType damageType) {
    if (!healths_.Has(entity)) {
        return {};
    }
    return applyDamage(entity, damage, damageType);
}

HealthChange DamagePipeline::ApplyHeal(Entity entity, int32_t amount) {
    auto* health = healths_.TryGet(entity);
    if (health == nullptr) {
        return {};
    }
    auto change = health->ApplyHeal(amount);
    publishHealth(entity, *health, change);
    return change;
}

EnergyChange DamagePipeline::ApplyExhaustion(Entity entity, int32_t amount) {
    auto* energy = energies_.TryGet(entity);
    if (energy == nullptr) {
        return {};
    }
    auto change = energy->ApplyExhaustion(amount);
    publishEnergy(entity, *energy, change);
    if (change.exhausted) {
        CRE_LOG_DEBUG(LogCategory::Damage,
                      "Entity " + std::to_string(entity.raw) + " exhausted, overkill " +
                          std::to_string(change.overkill));
        events_.exhausted.emit(entity, change.overkill);
    }
    return change;
}

EnergyChange DamagePipeline::ApplyEnergyBoost(Entity entity, int32_t amount) {
    auto* energy = energies_.TryGet(entity);
    if (energy == nullptr) {
        return {};
    }
    auto change = energy->ApplyBoost(amount);
    publishEnergy(entity, *energy, change);
    return change;
}

EnergyChange DamagePipeline::RestoreEnergy(Entity entity) {
    auto* energy = energies_.TryGet(entity);
    if (energy == nullptr) {
        return {};
    }
    auto change = energy->FullRestore();
    publishEnergy(entity, *energy, change);
    events_.energyRestored.emit(entity, change.current - change.previous);
    return change;
}

// ── Internals ───────────────────────────────────────────────────────────

HealthChange DamagePipeline::applyDamage(Entity entity, int32_t damage, DamageType damageType) {
    auto& health = healths_.Get(entity);

    float resistance = 0.0f;
    if (const auto* res = resistances_.TryGet(entity)) {
        resistance = res->Get(damageType);
    }
    const int32_t finalDamage = ApplyResistance(damage, resistance);

    auto change = health.ApplyDamage(finalDamage);
    publishHealth(entity, health, change);
    return change;
}

void DamagePipeline::publishHealth(Entity entity, const Health& health,
                                   const HealthChange& change) {
    if (change.Changed()) {
        events_.healthChanged.emit(entity, health.current, health.max);
    }
    if (!change.defeated) {
        return;
    }

    auto& logger = foundation::CombatLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Damage)) {
        LogContext ctx;
        ctx.entity = entity.raw;
        ctx.extra["overkill"] = std::to_string(change.overkill);
        logger.logWithContext(LogLevel::Info, LogCategory::Damage, "Entity defeated", ctx);
    }

    events_.defeated.emit(entity, change.overkill);
    if (defeatHandler_) {
        defeatHandler_(entity);
    }
    entities_.DestroyDeferred(entity);
}

void DamagePipeline::publishEnergy(Entity entity, const Energy& energy,
                                   const EnergyChange& change) {
    if (change.Changed()) {
        events_.energyChanged.emit(entity, energy.current, energy.max);
    }
}

}  // namespace cre::game
