#pragma once

/// @file stat_derivation.hpp
/// @brief Raw character attributes to derived combat stats.

#include <cstdint>
#include <map>

#include "cre/foundation/combat_result.hpp"
#include "cre/foundation/random_source.hpp"
#include "cre/game/combat_types.hpp"

namespace cre::game {

/// One attribute: raw value and the weight applied when it dominates.
struct AttributeValue {
    double value = 0.0;
    double weight = 1.0;
};

/// Source of truth for a character's combat numbers.
///
/// All five attributes must be present for derivation to succeed.
struct CharacterStats {
    std::map<Attribute, AttributeValue> attributes;
    int32_t level = 1;
    Attribute weaponMainStat = Attribute::Strength;
    double weaponDamageBonus = 0.0;

    void Set(Attribute attr, double value, double weight = 1.0) {
        attributes[attr] = AttributeValue{value, weight};
    }

    /// Convenience constructor with unit weights.
    static CharacterStats WithValues(double strength, double vitality, double agility,
                                     double intelligence, double luck, int32_t level = 1);
};

/// Tunable class multipliers applied to the dominant attribute.
struct StatDerivationParams {
    double strengthAgilityMultiplier = 1.25;
    double intelligenceMultiplier = 1.15;
};

struct DerivedCombatStats {
    double critChance = 0.0;
    double critOverflow = 0.0;
    double critDamage = 0.0;
    double hitChance = 0.0;
    double hitOverflow = 0.0;
    double attackDamageBonus = 0.0;

    Attribute dominantAttribute = Attribute::Strength;
    double dominantValue = 0.0;  ///< After the class multiplier.
    double buildAverage = 0.0;   ///< Mean raw value of the other four attributes.

    bool operator==(const DerivedCombatStats&) const = default;
};

/// Derive combat stats.
///
/// Pure: identical input always yields identical output.
/// @return InvalidStats for a missing attribute, a negative or non-finite
///         value or weight, a level below 1, or a negative or non-finite
///         weapon damage bonus.
[[nodiscard]] foundation::CombatResult<DerivedCombatStats>
DeriveCombatStats(const CharacterStats& stats, const StatDerivationParams& params = {});

/// Outcome of one attack damage roll.
struct AttackRoll {
    int32_t damage = 0;
    bool critical = false;
};

/// Apply derived stats to a base damage value.
///
/// damage = base + attackDamageBonus; the roll is a crit when
/// @p critRoll (in [0, 100)) is below min(critChance, 100). A crit multiplies
/// by (1 + critDamage / 100) and then adds critOverflow. The result is
/// floored and never negative.
[[nodiscard]] AttackRoll ResolveAttackDamage(const DerivedCombatStats& derived,
                                             int32_t baseDamage, double critRoll);

/// Same as above with the crit roll drawn from @p rng.
[[nodiscard]] AttackRoll ResolveAttackDamage(const DerivedCombatStats& derived,
                                             int32_t baseDamage,
                                             foundation::RandomSource& rng);

}  // namespace cre::game
