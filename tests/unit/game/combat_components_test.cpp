#include <gtest/gtest.h>

#include "cre/game/combat_components.hpp"

using namespace cre::game;

// ===========================================================================
// Team rules
// ===========================================================================

TEST(TeamTest, OpposedTeams) {
    EXPECT_TRUE(AreOpposed(CombatTeam::Player, CombatTeam::Enemy));
    EXPECT_TRUE(AreOpposed(CombatTeam::Enemy, CombatTeam::Player));
    EXPECT_FALSE(AreOpposed(CombatTeam::Player, CombatTeam::Player));
    EXPECT_FALSE(AreOpposed(CombatTeam::Player, CombatTeam::Neutral));
    EXPECT_FALSE(AreOpposed(CombatTeam::Neutral, CombatTeam::Enemy));
}

TEST(ResistancesTest, ClampedToPercentRange) {
    Resistances res;
    res.Set(DamageType::Fire, 150.0f);
    res.Set(DamageType::Ice, -5.0f);
    EXPECT_FLOAT_EQ(res.Get(DamageType::Fire), 100.0f);
    EXPECT_FLOAT_EQ(res.Get(DamageType::Ice), 0.0f);
    EXPECT_FLOAT_EQ(res.Get(DamageType::Magic), 0.0f);
}

// ===========================================================================
// Health
// ===========================================================================

TEST(HealthTest, DamageReducesCurrent) {
    Health hp(100);
    auto change = hp.ApplyDamage(18);
    EXPECT_EQ(hp.current, 82);
    EXPECT_EQ(change.previous, 100);
    EXPECT_EQ(change.applied, 18);
    EXPECT_FALSE(change.defeated);
}

TEST(HealthTest, DefeatReportsOverkillAndClamps) {
    Health hp(10);
    auto change = hp.ApplyDamage(15);
    EXPECT_EQ(hp.current, 0);
    EXPECT_TRUE(hp.IsDefeated());
    EXPECT_TRUE(change.defeated);
    EXPECT_EQ(change.overkill, 5);
    EXPECT_EQ(change.applied, 10);
}

TEST(HealthTest, ExactlyZeroDefeatsWithoutOverkill) {
    Health hp(10);
    auto change = hp.ApplyDamage(10);
    EXPECT_TRUE(change.defeated);
    EXPECT_EQ(change.overkill, 0);
}

TEST(HealthTest, ExceedAllowsNegativeAndOverheal) {
    Health hp(10);
    hp.exceed = true;
    hp.ApplyHeal(20);
    EXPECT_EQ(hp.current, 30);
    hp.ApplyDamage(45);
    EXPECT_EQ(hp.current, -15);
    EXPECT_TRUE(hp.IsDefeated());
}

TEST(HealthTest, HealClampsToMax) {
    Health hp(50);
    hp.ApplyDamage(20);
    auto change = hp.ApplyHeal(100);
    EXPECT_EQ(hp.current, 50);
    EXPECT_EQ(change.applied, 20);
}

TEST(HealthTest, GodModeIgnoresDamage) {
    Health hp(50);
    hp.godMode = true;
    auto change = hp.ApplyDamage(999);
    EXPECT_EQ(hp.current, 50);
    EXPECT_FALSE(change.Changed());
}

TEST(HealthTest, DefeatedIgnoresFurtherMutation) {
    Health hp(5);
    hp.ApplyDamage(5);
    auto again = hp.ApplyDamage(3);
    auto heal = hp.ApplyHeal(3);
    EXPECT_FALSE(again.defeated);
    EXPECT_FALSE(again.Changed());
    EXPECT_FALSE(heal.Changed());
    EXPECT_EQ(hp.current, 0);
}

TEST(HealthTest, NonPositiveAmountsIgnored) {
    Health hp(50);
    EXPECT_FALSE(hp.ApplyDamage(0).Changed());
    EXPECT_FALSE(hp.ApplyDamage(-4).Changed());
    EXPECT_FALSE(hp.ApplyHeal(-4).Changed());
}

// ===========================================================================
// Energy
// ===========================================================================

TEST(EnergyTest, ExhaustionPastZeroSetsNoEnergy) {
    Energy energy(100);
    energy.current = 10;
    auto change = energy.ApplyExhaustion(15);
    EXPECT_EQ(energy.current, 0);
    EXPECT_TRUE(energy.noEnergy);
    EXPECT_TRUE(change.exhausted);
    EXPECT_EQ(change.overkill, 5);
}

TEST(EnergyTest, ExhaustedFlagOnlyOnTransition) {
    Energy energy(10);
    EXPECT_TRUE(energy.ApplyExhaustion(10).exhausted);
    EXPECT_FALSE(energy.ApplyExhaustion(5).exhausted);
    EXPECT_TRUE(energy.noEnergy);
}

TEST(EnergyTest, BoostIgnoredWhileNoEnergy) {
    Energy energy(100);
    energy.ApplyExhaustion(100);
    auto boost = energy.ApplyBoost(40);
    EXPECT_FALSE(boost.Changed());
    EXPECT_EQ(energy.current, 0);
    EXPECT_TRUE(energy.noEnergy);
}

TEST(EnergyTest, FullRestoreClearsNoEnergy) {
    Energy energy(100);
    energy.ApplyExhaustion(120);
    auto change = energy.FullRestore();
    EXPECT_TRUE(change.restored);
    EXPECT_EQ(change.previous, 0);
    EXPECT_EQ(energy.current, 100);
    EXPECT_FALSE(energy.noEnergy);
}

TEST(EnergyTest, BoostClampsUnlessExceed) {
    Energy energy(100);
    energy.ApplyExhaustion(30);
    energy.ApplyBoost(50);
    EXPECT_EQ(energy.current, 100);

    energy.exceed = true;
    energy.ApplyBoost(50);
    EXPECT_EQ(energy.current, 150);
}

TEST(EnergyTest, GodModeBlocksExhaustionButNotBoost) {
    Energy energy(100);
    energy.ApplyExhaustion(40);
    energy.godMode = true;
    EXPECT_FALSE(energy.ApplyExhaustion(60).Changed());
    EXPECT_EQ(energy.current, 60);
    energy.ApplyBoost(10);
    EXPECT_EQ(energy.current, 70);
}

// ===========================================================================
// StatusHolder
// ===========================================================================

TEST(StatusHolderTest, ReapplyRefreshesToStrongerAndLonger) {
    StatusHolder holder;
    holder.Apply({StatusEffectKind::Burned, 1, 5, DamageType::Fire});
    holder.Apply({StatusEffectKind::Burned, 3, 2, DamageType::Magic});

    ASSERT_EQ(holder.effects.size(), 1u);
    const auto* burned = holder.Find(StatusEffectKind::Burned);
    ASSERT_NE(burned, nullptr);
    EXPECT_EQ(burned->level, 3);
    EXPECT_EQ(burned->remainingTicks, 5);
    EXPECT_EQ(burned->sourceType, DamageType::Magic);
}

TEST(StatusHolderTest, DifferentKindsCoexist) {
    StatusHolder holder;
    holder.Apply({StatusEffectKind::Burned, 1, 3, DamageType::Fire});
    holder.Apply({StatusEffectKind::Corroding, 1, 3, DamageType::Magic});
    EXPECT_EQ(holder.effects.size(), 2u);
    EXPECT_TRUE(holder.Has(StatusEffectKind::Corroding));

    holder.Remove(StatusEffectKind::Burned);
    EXPECT_FALSE(holder.Has(StatusEffectKind::Burned));
    EXPECT_EQ(holder.effects.size(), 1u);
}

TEST(StatusHolderTest, SlowTakesStrongestActiveChill) {
    StatusHolder holder;
    StatusEffectInstance chill{StatusEffectKind::Chill, 1, 2, DamageType::Ice};
    chill.slowAmount = 0.3f;
    holder.Apply(chill);
    EXPECT_FLOAT_EQ(holder.SlowAmount(), 0.3f);

    chill.slowAmount = 0.1f;
    holder.Apply(chill);
    EXPECT_FLOAT_EQ(holder.SlowAmount(), 0.3f);

    holder.effects.front().remainingTicks = 0;
    EXPECT_FLOAT_EQ(holder.SlowAmount(), 0.0f);
    holder.RemoveExpired();
    EXPECT_TRUE(holder.effects.empty());
}

// ===========================================================================
// Spells
// ===========================================================================

TEST(SpellCooldownsTest, StartTickAndReady) {
    SpellCooldowns cooldowns;
    EXPECT_TRUE(cooldowns.IsReady("ice_lance"));

    cooldowns.Start("ice_lance", 1.0f);
    EXPECT_FALSE(cooldowns.IsReady("ice_lance"));
    EXPECT_FLOAT_EQ(cooldowns.Remaining("ice_lance"), 1.0f);

    cooldowns.Tick(0.5f);
    EXPECT_FALSE(cooldowns.IsReady("ice_lance"));
    cooldowns.Tick(0.5f);
    EXPECT_TRUE(cooldowns.IsReady("ice_lance"));
    EXPECT_TRUE(cooldowns.remaining.empty());
}

TEST(SpellCooldownsTest, ZeroCooldownIsNotRecorded) {
    SpellCooldowns cooldowns;
    cooldowns.Start("magic_bolt", 0.0f);
    EXPECT_TRUE(cooldowns.IsReady("magic_bolt"));
    EXPECT_FLOAT_EQ(cooldowns.Remaining("magic_bolt"), 0.0f);
}

TEST(SpellLoadoutTest, UnknownSpellDefaultsToLevelOne) {
    SpellLoadout loadout;
    loadout.levels["meteor"] = 3;
    EXPECT_EQ(loadout.LevelOf("meteor"), 3);
    EXPECT_EQ(loadout.LevelOf("ice_lance"), 1);
}
