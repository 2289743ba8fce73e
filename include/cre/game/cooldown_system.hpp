#pragma once

/// @file cooldown_system.hpp
/// @brief Counts spell cooldowns down at the start of every tick.

#include <string_view>

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/system_scheduler.hpp"
#include "cre/game/combat_components.hpp"

namespace cre::game {

class CooldownSystem final : public cre::ecs::ISystem {
public:
    explicit CooldownSystem(cre::ecs::ComponentStorage<SpellCooldowns>& cooldowns);

    void Execute(float deltaTime) override;

    [[nodiscard]] cre::ecs::SystemStage GetStage() const override {
        return cre::ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "CooldownSystem"; }

private:
    cre::ecs::ComponentStorage<SpellCooldowns>& cooldowns_;
};

}  // namespace cre::game
