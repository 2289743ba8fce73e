#include "cre/game/cooldown_system.hpp"

namespace cre::game {

CooldownSystem::CooldownSystem(cre::ecs::ComponentStorage<SpellCooldowns>& cooldowns)
    : cooldowns_(cooldowns) {}

void CooldownSystem::Execute(float deltaTime) {
    for (auto& cooldowns : cooldowns_) {
        cooldowns.Tick(deltaTime);
    }
}

}  // namespace cre::game
