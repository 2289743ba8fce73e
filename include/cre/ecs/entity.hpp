#pragma once

/// @file entity.hpp
/// @brief Versioned entity handle shared by combatants and projectiles.
///
/// A handle packs a 24-bit slot index with an 8-bit generation. When a
/// defeated combatant or an expired projectile is destroyed its slot is
/// recycled under a new generation, so handles held elsewhere (a projectile's
/// owner, a homing target, a status effect's source) stop resolving.

#include <cstdint>
#include <functional>
#include <limits>

namespace cre::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kVersionBits = 8;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace cre::ecs

template <>
struct std::hash<cre::ecs::Entity> {
    std::size_t operator()(const cre::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
