/// @file status_effect_system.cpp
/// @brief StatusEffectSystem implementation.

#include "cre/game/status_effect_system.hpp"

#include <string>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using cre::ecs::Entity;
using foundation::LogCategory;

int32_t RollSubTicks(const StatusEffectInstance& effect, foundation::RandomSource& rng) {
    switch (effect.kind) {
        case StatusEffectKind::Corroding:
            return 4 * effect.level + rng.UniformInt(0, 5);
        case StatusEffectKind::Burned:
            return 3 * effect.level + rng.UniformInt(0, 2);
        case StatusEffectKind::Chill:
        case StatusEffectKind::None:
            return 0;
    }
    return 0;
}

int32_t RollSubTickDamage(const StatusEffectInstance& effect, foundation::RandomSource& rng) {
    switch (effect.kind) {
        case StatusEffectKind::Corroding:
            return 2 * effect.level + rng.UniformInt(0, 5);
        case StatusEffectKind::Burned:
            return 2 * effect.level + rng.UniformInt(0, 3);
        case StatusEffectKind::Chill:
        case StatusEffectKind::None:
            return 0;
    }
    return 0;
}

StatusEffectSystem::StatusEffectSystem(cre::ecs::ComponentStorage<StatusHolder>& statuses,
                                       cre::ecs::ComponentStorage<Health>& healths,
                                       DamagePipeline& pipeline,
                                       foundation::RandomSource& rng)
    : statuses_(statuses), healths_(healths), pipeline_(pipeline), rng_(rng) {}

void StatusEffectSystem::Execute(float /*deltaTime*/) {
    ++ticks_;
    for (auto entity : statuses_.Entities()) {
        auto* holder = statuses_.TryGet(entity);
        if (holder == nullptr || holder->effects.empty()) {
            continue;
        }
        if (!tickEntity(entity, *holder)) {
            continue;
        }
        holder->RemoveExpired();
    }
}

bool StatusEffectSystem::tickEntity(Entity entity, StatusHolder& holder) {
    auto isDefeated = [&] {
        const auto* health = healths_.TryGet(entity);
        return health != nullptr && health->IsDefeated();
    };

    if (isDefeated()) {
        return false;
    }

    for (auto& effect : holder.effects) {
        const int32_t subTicks = RollSubTicks(effect, rng_);
        int32_t total = 0;
        for (int32_t i = 0; i < subTicks; ++i) {
            const int32_t damage = RollSubTickDamage(effect, rng_);
            auto change = pipeline_.ApplyPeriodicDamage(entity, damage, effect.sourceType);
            total += change.applied;
            if (isDefeated()) {
                CRE_LOG_DEBUG(LogCategory::Status,
                              std::string(ToString(effect.kind)) + " defeated entity " +
                                  std::to_string(entity.raw));
                return false;
            }
        }

        if (subTicks > 0) {
            CRE_LOG_TRACE(LogCategory::Status,
                          std::string(ToString(effect.kind)) + " dealt " +
                              std::to_string(total) + " over " + std::to_string(subTicks) +
                              " sub-ticks to entity " + std::to_string(entity.raw));
        }

        --effect.remainingTicks;
        ++effect.tickAccumulator;
    }
    return true;
}

}  // namespace cre::game
