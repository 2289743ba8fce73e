#pragma once

/// @file combat_types.hpp
/// @brief Enumerations shared by the combat modules.

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cre::game {

/// Damage classification for resistances and status sources.
enum class DamageType : uint8_t {
    Physical,
    Fire,
    Ice,
    Magic
};

constexpr std::size_t kDamageTypeCount = 4;

/// Status effects a hit can leave behind.
enum class StatusEffectKind : uint8_t {
    None,       ///< Hit carries no status payload.
    Corroding,  ///< Damage over time, heavier and longer bursts.
    Burned,     ///< Damage over time.
    Chill       ///< No damage; slows the holder.
};

/// Collision sides. Neutral entities are never hit by projectiles.
enum class CombatTeam : uint8_t {
    Player,
    Enemy,
    Neutral
};

/// The five weighted character attributes, in tie-break order.
enum class Attribute : uint8_t {
    Strength,
    Vitality,
    Agility,
    Intelligence,
    Luck
};

constexpr std::size_t kAttributeCount = 5;

constexpr std::string_view ToString(DamageType type) {
    switch (type) {
        case DamageType::Physical: return "physical";
        case DamageType::Fire:     return "fire";
        case DamageType::Ice:      return "ice";
        case DamageType::Magic:    return "magic";
    }
    return "unknown";
}

constexpr std::string_view ToString(StatusEffectKind kind) {
    switch (kind) {
        case StatusEffectKind::None:      return "none";
        case StatusEffectKind::Corroding: return "corroding";
        case StatusEffectKind::Burned:    return "burned";
        case StatusEffectKind::Chill:     return "chill";
    }
    return "unknown";
}

constexpr std::string_view ToString(Attribute attr) {
    switch (attr) {
        case Attribute::Strength:     return "strength";
        case Attribute::Vitality:     return "vitality";
        case Attribute::Agility:      return "agility";
        case Attribute::Intelligence: return "intelligence";
        case Attribute::Luck:         return "luck";
    }
    return "unknown";
}

namespace detail {

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l)) ==
                      std::tolower(static_cast<unsigned char>(r));
           });
}

} // namespace detail

/// Case-insensitive lookup of a DamageType by name.
inline std::optional<DamageType> ParseDamageType(std::string_view name) {
    for (auto t : {DamageType::Physical, DamageType::Fire, DamageType::Ice, DamageType::Magic}) {
        if (detail::equalsIgnoreCase(name, ToString(t))) {
            return t;
        }
    }
    return std::nullopt;
}

inline std::optional<StatusEffectKind> ParseStatusEffectKind(std::string_view name) {
    for (auto k : {StatusEffectKind::None, StatusEffectKind::Corroding,
                   StatusEffectKind::Burned, StatusEffectKind::Chill}) {
        if (detail::equalsIgnoreCase(name, ToString(k))) {
            return k;
        }
    }
    return std::nullopt;
}

inline std::optional<Attribute> ParseAttribute(std::string_view name) {
    for (auto a : {Attribute::Strength, Attribute::Vitality, Attribute::Agility,
                   Attribute::Intelligence, Attribute::Luck}) {
        if (detail::equalsIgnoreCase(name, ToString(a))) {
            return a;
        }
    }
    return std::nullopt;
}

}  // namespace cre::game
