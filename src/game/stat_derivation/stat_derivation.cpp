/// @file stat_derivation.cpp
/// @brief Dominant-attribute stat derivation and attack damage rolls.

#include "cre/game/stat_derivation.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using foundation::CombatError;
using foundation::CombatResult;
using foundation::ErrorCode;

namespace {

constexpr std::array<Attribute, kAttributeCount> kAttributeOrder = {
    Attribute::Strength, Attribute::Vitality, Attribute::Agility,
    Attribute::Intelligence, Attribute::Luck
};

CombatResult<DerivedCombatStats> invalid(std::string message) {
    CRE_LOG_WARN(foundation::LogCategory::Stats, message);
    return CombatResult<DerivedCombatStats>::err(
        CombatError(ErrorCode::InvalidStats, std::move(message)));
}

double classMultiplier(Attribute dominant, const StatDerivationParams& params) {
    switch (dominant) {
        case Attribute::Strength:
        case Attribute::Agility:
            return params.strengthAgilityMultiplier;
        case Attribute::Intelligence:
            return params.intelligenceMultiplier;
        case Attribute::Vitality:
        case Attribute::Luck:
            return 1.0;
    }
    return 1.0;
}

} // namespace

CharacterStats CharacterStats::WithValues(double strength, double vitality, double agility,
                                          double intelligence, double luck, int32_t level) {
    CharacterStats stats;
    stats.Set(Attribute::Strength, strength);
    stats.Set(Attribute::Vitality, vitality);
    stats.Set(Attribute::Agility, agility);
    stats.Set(Attribute::Intelligence, intelligence);
    stats.Set(Attribute::Luck, luck);
    stats.level = level;
    return stats;
}

CombatResult<DerivedCombatStats>
DeriveCombatStats(const CharacterStats& stats, const StatDerivationParams& params) {
    if (stats.level < 1) {
        return invalid("level must be at least 1, got " + std::to_string(stats.level));
    }
    if (!std::isfinite(stats.weaponDamageBonus) || stats.weaponDamageBonus < 0.0) {
        return invalid("weapon damage bonus must be a non-negative number");
    }

    double sum = 0.0;
    for (auto attr : kAttributeOrder) {
        auto it = stats.attributes.find(attr);
        if (it == stats.attributes.end()) {
            return invalid("missing attribute: " + std::string(ToString(attr)));
        }
        const auto& av = it->second;
        if (!std::isfinite(av.value) || av.value < 0.0) {
            return invalid("invalid value for attribute: " + std::string(ToString(attr)));
        }
        if (!std::isfinite(av.weight) || av.weight < 0.0) {
            return invalid("invalid weight for attribute: " + std::string(ToString(attr)));
        }
        sum += av.value;
    }

    // Highest raw value wins; the weapon's main stat breaks ties, then the
    // fixed attribute order.
    double best = -std::numeric_limits<double>::infinity();
    for (auto attr : kAttributeOrder) {
        best = std::max(best, stats.attributes.at(attr).value);
    }
    Attribute dominant = Attribute::Strength;
    if (stats.attributes.at(stats.weaponMainStat).value == best) {
        dominant = stats.weaponMainStat;
    } else {
        for (auto attr : kAttributeOrder) {
            if (stats.attributes.at(attr).value == best) {
                dominant = attr;
                break;
            }
        }
    }

    const auto& dominantAttr = stats.attributes.at(dominant);
    const double luck = stats.attributes.at(Attribute::Luck).value;
    const double level = static_cast<double>(stats.level);

    DerivedCombatStats out;
    out.dominantAttribute = dominant;
    out.dominantValue = dominantAttr.value * classMultiplier(dominant, params);
    out.buildAverage = (sum - dominantAttr.value) / 4.0;

    out.critChance = luck + out.dominantValue * dominantAttr.weight;
    out.critOverflow = std::max(0.0, out.critChance - 100.0);
    out.critDamage = luck * (out.dominantValue + level);
    out.hitChance = (out.dominantValue + level) * luck;
    out.hitOverflow = std::max(0.0, out.hitChance - 100.0);
    out.attackDamageBonus = out.dominantValue * level + stats.weaponDamageBonus + out.hitOverflow;

    return CombatResult<DerivedCombatStats>::ok(out);
}

AttackRoll ResolveAttackDamage(const DerivedCombatStats& derived, int32_t baseDamage,
                               double critRoll) {
    AttackRoll roll;
    double damage = static_cast<double>(baseDamage) + derived.attackDamageBonus;

    if (critRoll < std::min(derived.critChance, 100.0)) {
        roll.critical = true;
        damage = damage * (1.0 + derived.critDamage / 100.0) + derived.critOverflow;
    }

    damage = std::floor(std::max(0.0, damage));
    constexpr double kMax = static_cast<double>(std::numeric_limits<int32_t>::max());
    roll.damage = static_cast<int32_t>(std::min(damage, kMax));
    return roll;
}

AttackRoll ResolveAttackDamage(const DerivedCombatStats& derived, int32_t baseDamage,
                               foundation::RandomSource& rng) {
    return ResolveAttackDamage(derived, baseDamage, rng.UniformReal(0.0, 100.0));
}

}  // namespace cre::game
