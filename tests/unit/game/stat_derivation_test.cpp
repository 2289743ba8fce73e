#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "cre/foundation/random_source.hpp"
#include "cre/game/stat_derivation.hpp"

using namespace cre::game;
using cre::foundation::ErrorCode;

// ===========================================================================
// DeriveCombatStats: worked example
// ===========================================================================

// STR 14, VIT 10, AGI 9, INT 7, LUK 5 at level 3, unit weights.
// Dominant = strength, 14 * 1.25 = 17.5.
TEST(StatDerivationTest, StrengthBuildWorkedExample) {
    auto result = DeriveCombatStats(CharacterStats::WithValues(14, 10, 9, 7, 5, 3));
    ASSERT_TRUE(result.hasValue());
    const auto& d = result.value();

    EXPECT_EQ(d.dominantAttribute, Attribute::Strength);
    EXPECT_DOUBLE_EQ(d.dominantValue, 17.5);
    EXPECT_DOUBLE_EQ(d.buildAverage, 7.75);
    EXPECT_DOUBLE_EQ(d.critChance, 22.5);
    EXPECT_DOUBLE_EQ(d.critOverflow, 0.0);
    EXPECT_DOUBLE_EQ(d.critDamage, 102.5);
    EXPECT_DOUBLE_EQ(d.hitChance, 102.5);
    EXPECT_DOUBLE_EQ(d.hitOverflow, 2.5);
    EXPECT_DOUBLE_EQ(d.attackDamageBonus, 55.0);
}

TEST(StatDerivationTest, IntelligenceBuildUsesItsOwnMultiplier) {
    StatDerivationParams params;
    params.intelligenceMultiplier = 2.0;
    auto result = DeriveCombatStats(CharacterStats::WithValues(3, 4, 5, 20, 1), params);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().dominantAttribute, Attribute::Intelligence);
    EXPECT_DOUBLE_EQ(result.value().dominantValue, 40.0);
    EXPECT_DOUBLE_EQ(result.value().critChance, 41.0);
}

TEST(StatDerivationTest, VitalityAndLuckHaveNoClassMultiplier) {
    auto result = DeriveCombatStats(CharacterStats::WithValues(1, 30, 1, 1, 2));
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().dominantAttribute, Attribute::Vitality);
    EXPECT_DOUBLE_EQ(result.value().dominantValue, 30.0);
}

TEST(StatDerivationTest, DominantWeightScalesCritChance) {
    auto stats = CharacterStats::WithValues(10, 1, 1, 1, 4);
    stats.Set(Attribute::Strength, 10, 2.0);
    auto result = DeriveCombatStats(stats);
    ASSERT_TRUE(result.hasValue());
    EXPECT_DOUBLE_EQ(result.value().critChance, 4.0 + 12.5 * 2.0);
}

TEST(StatDerivationTest, CritOverflowAboveHundred) {
    auto result = DeriveCombatStats(CharacterStats::WithValues(80, 1, 1, 1, 10));
    ASSERT_TRUE(result.hasValue());
    EXPECT_DOUBLE_EQ(result.value().critChance, 110.0);
    EXPECT_DOUBLE_EQ(result.value().critOverflow, 10.0);
}

TEST(StatDerivationTest, WeaponMainStatBreaksTies) {
    auto stats = CharacterStats::WithValues(10, 5, 10, 3, 2);
    stats.weaponMainStat = Attribute::Agility;
    auto result = DeriveCombatStats(stats);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().dominantAttribute, Attribute::Agility);
}

TEST(StatDerivationTest, FixedOrderBreaksTiesWhenWeaponStatIsLower) {
    auto stats = CharacterStats::WithValues(10, 5, 10, 3, 2);
    stats.weaponMainStat = Attribute::Vitality;
    auto result = DeriveCombatStats(stats);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().dominantAttribute, Attribute::Strength);
}

TEST(StatDerivationTest, WeaponBonusAddsToAttackBonus) {
    auto stats = CharacterStats::WithValues(4, 1, 1, 1, 1);
    auto base = DeriveCombatStats(stats);
    stats.weaponDamageBonus = 12.0;
    auto boosted = DeriveCombatStats(stats);
    ASSERT_TRUE(base.hasValue());
    ASSERT_TRUE(boosted.hasValue());
    EXPECT_DOUBLE_EQ(boosted.value().attackDamageBonus - base.value().attackDamageBonus, 12.0);
}

TEST(StatDerivationTest, Deterministic) {
    auto stats = CharacterStats::WithValues(9, 8, 7, 6, 5, 4);
    auto a = DeriveCombatStats(stats);
    auto b = DeriveCombatStats(stats);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_EQ(a.value(), b.value());
}

TEST(StatDerivationTest, AllZeroAttributesAreValid) {
    auto result = DeriveCombatStats(CharacterStats::WithValues(0, 0, 0, 0, 0));
    ASSERT_TRUE(result.hasValue());
    EXPECT_DOUBLE_EQ(result.value().critChance, 0.0);
    EXPECT_DOUBLE_EQ(result.value().buildAverage, 0.0);
}

// ===========================================================================
// DeriveCombatStats: rejected input
// ===========================================================================

TEST(StatDerivationTest, MissingAttributeIsInvalid) {
    auto stats = CharacterStats::WithValues(1, 1, 1, 1, 1);
    stats.attributes.erase(Attribute::Luck);
    auto result = DeriveCombatStats(stats);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidStats);
}

TEST(StatDerivationTest, NegativeValueOrWeightIsInvalid) {
    auto negativeValue = CharacterStats::WithValues(1, -1, 1, 1, 1);
    EXPECT_EQ(DeriveCombatStats(negativeValue).error().code(), ErrorCode::InvalidStats);

    auto negativeWeight = CharacterStats::WithValues(1, 1, 1, 1, 1);
    negativeWeight.Set(Attribute::Agility, 1, -0.5);
    EXPECT_EQ(DeriveCombatStats(negativeWeight).error().code(), ErrorCode::InvalidStats);
}

TEST(StatDerivationTest, NonFiniteValueIsInvalid) {
    auto stats = CharacterStats::WithValues(std::numeric_limits<double>::quiet_NaN(), 1, 1, 1, 1);
    EXPECT_TRUE(DeriveCombatStats(stats).hasError());
}

TEST(StatDerivationTest, LevelBelowOneIsInvalid) {
    auto stats = CharacterStats::WithValues(1, 1, 1, 1, 1, 0);
    EXPECT_EQ(DeriveCombatStats(stats).error().code(), ErrorCode::InvalidStats);
}

TEST(StatDerivationTest, NegativeWeaponBonusIsInvalid) {
    auto stats = CharacterStats::WithValues(1, 1, 1, 1, 1);
    stats.weaponDamageBonus = -3.0;
    EXPECT_EQ(DeriveCombatStats(stats).error().code(), ErrorCode::InvalidStats);
}

// ===========================================================================
// ResolveAttackDamage
// ===========================================================================

TEST(AttackRollTest, NonCriticalAddsBonus) {
    auto d = DeriveCombatStats(CharacterStats::WithValues(14, 10, 9, 7, 5, 3)).value();
    auto roll = ResolveAttackDamage(d, 10, 50.0);
    EXPECT_FALSE(roll.critical);
    EXPECT_EQ(roll.damage, 65);
}

TEST(AttackRollTest, CriticalMultipliesAndFloors) {
    auto d = DeriveCombatStats(CharacterStats::WithValues(14, 10, 9, 7, 5, 3)).value();
    auto roll = ResolveAttackDamage(d, 10, 10.0);
    EXPECT_TRUE(roll.critical);
    // 65 * (1 + 102.5 / 100) = 131.625
    EXPECT_EQ(roll.damage, 131);
}

TEST(AttackRollTest, CritOverflowAddsFlatDamage) {
    DerivedCombatStats d;
    d.critChance = 130.0;
    d.critOverflow = 30.0;
    d.critDamage = 0.0;
    auto roll = ResolveAttackDamage(d, 20, 99.9);
    EXPECT_TRUE(roll.critical);
    EXPECT_EQ(roll.damage, 50);
}

TEST(AttackRollTest, NeverNegative) {
    DerivedCombatStats d;
    auto roll = ResolveAttackDamage(d, -40, 99.0);
    EXPECT_EQ(roll.damage, 0);
}

TEST(AttackRollTest, SeededRngIsReproducible) {
    auto d = DeriveCombatStats(CharacterStats::WithValues(14, 10, 9, 7, 5, 3)).value();
    cre::foundation::RandomSource a(5);
    cre::foundation::RandomSource b(5);
    for (int i = 0; i < 20; ++i) {
        auto ra = ResolveAttackDamage(d, 10, a);
        auto rb = ResolveAttackDamage(d, 10, b);
        EXPECT_EQ(ra.damage, rb.damage);
        EXPECT_EQ(ra.critical, rb.critical);
        EXPECT_TRUE(ra.damage == 65 || ra.damage == 131);
    }
}
