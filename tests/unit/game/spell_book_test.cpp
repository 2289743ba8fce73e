#include <gtest/gtest.h>

#include <string>

#include "cre/game/spell_book.hpp"

using namespace cre::game;
using cre::foundation::ErrorCode;

namespace {

constexpr const char* kSpells = R"(
ice_lance:
  name: Ice Lance
  type: PROJECTILE
  damage: 18
  cooldown: 1.2
  energy_cost: 10
  range: 600
  speed: 450
  damage_type: ice
  status_effect: { kind: chill, duration: 2, slow_amount: 0.3 }
  trajectory_properties: { type: PIERCING, pierce_count: 1 }
  upgrades:
    level_2:
      damage: 24
      trajectory_properties: { pierce_count: 2 }
    level_3:
      divergence: frost
      status_effect: { duration: 3 }

meteor:
  type: PROJECTILE_AOE
  damage: 0
  trajectory_properties: { aoe_radius: 90 }

plain:
  damage: 4
)";

} // namespace

// ===========================================================================
// Loading
// ===========================================================================

TEST(SpellBookTest, LoadsDefinitions) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());
    EXPECT_EQ(book.Size(), 3u);

    const auto* ice = book.Find("ice_lance");
    ASSERT_NE(ice, nullptr);
    EXPECT_EQ(ice->name, "Ice Lance");
    EXPECT_EQ(ice->kind, SpellKind::Projectile);
    EXPECT_EQ(ice->level, 1);
    EXPECT_EQ(ice->damage, 18);
    EXPECT_FLOAT_EQ(ice->cooldown, 1.2f);
    EXPECT_EQ(ice->energyCost, 10);
    EXPECT_FLOAT_EQ(ice->range, 600.0f);
    EXPECT_FLOAT_EQ(ice->speed, 450.0f);
    EXPECT_EQ(ice->damageType, DamageType::Ice);
    EXPECT_EQ(ice->status.kind, StatusEffectKind::Chill);
    EXPECT_EQ(ice->status.duration, 2);
    EXPECT_FLOAT_EQ(ice->status.slowAmount, 0.3f);
    EXPECT_EQ(ice->trajectory.archetype, TrajectoryArchetype::Piercing);
    EXPECT_EQ(ice->trajectory.pierceCount, 1);
}

TEST(SpellBookTest, MissingFieldsUseDefaults) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    const auto* plain = book.Find("plain");
    ASSERT_NE(plain, nullptr);
    EXPECT_EQ(plain->name, "plain");
    EXPECT_EQ(plain->damage, 4);
    EXPECT_FLOAT_EQ(plain->cooldown, 1.0f);
    EXPECT_EQ(plain->energyCost, 0);
    EXPECT_EQ(plain->status.kind, StatusEffectKind::None);
    EXPECT_EQ(plain->trajectory.archetype, TrajectoryArchetype::Straight);
}

TEST(SpellBookTest, AoeSpellWithoutTypeFallsBackToGroundArea) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    const auto* meteor = book.Find("meteor");
    ASSERT_NE(meteor, nullptr);
    EXPECT_EQ(meteor->kind, SpellKind::ProjectileAoe);
    EXPECT_EQ(meteor->trajectory.archetype, TrajectoryArchetype::GroundArea);
    EXPECT_FLOAT_EQ(meteor->trajectory.aoeRadius, 90.0f);
}

TEST(SpellBookTest, EmptyDocumentLoadsNothing) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString("").hasValue());
    EXPECT_EQ(book.Size(), 0u);
}

TEST(SpellBookTest, LoadsShippedSpellFile) {
    SpellBook book;
    auto result = book.LoadFromFile("config/spells.yaml");
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    for (const char* id : {"magic_bolt", "ice_lance", "seeking_spark", "chain_lightning",
                           "flame_wheel", "serpent_wave", "bone_boomerang", "meteor",
                           "acid_spiral", "splitting_bolt", "bolt_fragment", "arcane_orb"}) {
        EXPECT_TRUE(book.Contains(id)) << id;
    }
    EXPECT_EQ(book.Find("splitting_bolt")->trajectory.childSpellId, "bolt_fragment");
    EXPECT_EQ(book.Find("arcane_orb")->trajectory.archetype, TrajectoryArchetype::GrowingOrb);
}

// ===========================================================================
// Upgrades
// ===========================================================================

TEST(SpellBookTest, UpgradesMergeCumulatively) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());
    EXPECT_EQ(book.MaxLevel("ice_lance"), 3);

    auto level2 = book.Resolve("ice_lance", 2);
    ASSERT_TRUE(level2.hasValue());
    EXPECT_EQ(level2.value().level, 2);
    EXPECT_EQ(level2.value().damage, 24);
    EXPECT_EQ(level2.value().trajectory.pierceCount, 2);
    // Nested maps merge key by key.
    EXPECT_EQ(level2.value().trajectory.archetype, TrajectoryArchetype::Piercing);

    auto level3 = book.Resolve("ice_lance", 3);
    ASSERT_TRUE(level3.hasValue());
    EXPECT_EQ(level3.value().damage, 24);
    EXPECT_EQ(level3.value().trajectory.pierceCount, 2);
    EXPECT_EQ(level3.value().status.duration, 3);
    EXPECT_EQ(level3.value().status.kind, StatusEffectKind::Chill);
    EXPECT_FLOAT_EQ(level3.value().status.slowAmount, 0.3f);
}

TEST(SpellBookTest, LevelPastLastUpgradeUsesLast) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    auto level9 = book.Resolve("ice_lance", 9);
    ASSERT_TRUE(level9.hasValue());
    EXPECT_EQ(level9.value().level, 3);

    EXPECT_EQ(book.MaxLevel("plain"), 1);
    EXPECT_EQ(book.Resolve("plain", 4).value().damage, 4);
}

TEST(SpellBookTest, FindReturnsBaseLevel) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());
    EXPECT_EQ(book.Find("ice_lance")->damage, 18);
}

// ===========================================================================
// Errors
// ===========================================================================

TEST(SpellBookTest, UnknownSpell) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    auto result = book.Resolve("fireball", 1);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownSpell);
    EXPECT_EQ(book.Find("fireball"), nullptr);
    EXPECT_EQ(book.MaxLevel("fireball"), 0);
}

TEST(SpellBookTest, LevelBelowOneRejected) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    auto result = book.Resolve("ice_lance", 0);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(SpellBookTest, UnknownArchetypeFailsLoad) {
    SpellBook book;
    auto result = book.LoadFromString("zap: { trajectory_properties: { type: ZIGZAG } }");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
    EXPECT_NE(result.error().message().find("ZIGZAG"), std::string::npos);
}

TEST(SpellBookTest, UnknownDamageTypeFailsLoad) {
    SpellBook book;
    auto result = book.LoadFromString("zap: { damage_type: plasma }");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
}

TEST(SpellBookTest, WrongFieldTypeFailsLoad) {
    SpellBook book;
    auto result = book.LoadFromString("zap: { damage: lots }");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
}

TEST(SpellBookTest, BadUpgradeKeyFailsLoad) {
    SpellBook book;
    EXPECT_TRUE(book.LoadFromString("zap: { upgrades: { level_1: { damage: 2 } } }").hasError());
    EXPECT_TRUE(book.LoadFromString("zap: { upgrades: { tier_2: { damage: 2 } } }").hasError());
    EXPECT_TRUE(book.LoadFromString("zap: { upgrades: { level_2: 5 } }").hasError());
}

TEST(SpellBookTest, UpgradeLevelAboveCapFailsLoad) {
    SpellBook book;
    auto result = book.LoadFromString(
        "bolt: { damage: 5, upgrades: { level_2000000000: { damage: 6 } } }");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
    EXPECT_EQ(book.Size(), 0u);

    EXPECT_TRUE(book.LoadFromString("bolt: { upgrades: { level_2147483647: { damage: 6 } } }")
                    .hasError());
    EXPECT_TRUE(book.LoadFromString("bolt: { upgrades: { level_99999999999: { damage: 6 } } }")
                    .hasError());

    const auto atCap = "bolt: { damage: 5, upgrades: { level_" +
                       std::to_string(kMaxSpellLevel) + ": { damage: 6 } } }";
    ASSERT_TRUE(book.LoadFromString(atCap).hasValue());
    EXPECT_EQ(book.MaxLevel("bolt"), kMaxSpellLevel);
    EXPECT_EQ(book.Resolve("bolt", kMaxSpellLevel).value().damage, 6);
    EXPECT_EQ(book.Resolve("bolt", kMaxSpellLevel - 1).value().damage, 5);
}

TEST(SpellBookTest, ForkCycleFailsLoad) {
    SpellBook book;
    auto result = book.LoadFromString(R"(
a:
  trajectory_properties:
    type: FORKING
    fork_condition_type: TIMER
    fork_condition_value: 0.05
    fork_count: 3
    child_spell_id: b
b:
  trajectory_properties:
    type: FORKING
    fork_condition_type: TIMER
    fork_condition_value: 0.05
    fork_count: 3
    child_spell_id: a
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
    EXPECT_NE(result.error().message().find("fork cycle"), std::string::npos);
    EXPECT_EQ(book.Size(), 0u);
}

TEST(SpellBookTest, ForkCycleThroughUpgradeFailsLoad) {
    SpellBook book;
    // Only level 2 forks into relay, which forks back into splitter.
    auto result = book.LoadFromString(R"(
splitter:
  trajectory_properties: { type: FORKING, fork_count: 2, child_spell_id: shard }
  upgrades:
    level_2: { trajectory_properties: { child_spell_id: relay } }
shard: { damage: 2 }
relay:
  trajectory_properties: { type: FORKING, fork_count: 2, child_spell_id: splitter }
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SpellDataInvalid);
}

TEST(SpellBookTest, ForkChainWithoutCycleLoads) {
    SpellBook book;
    auto result = book.LoadFromString(R"(
splitter:
  trajectory_properties: { type: FORKING, fork_count: 2, child_spell_id: relay }
relay:
  trajectory_properties: { type: FORKING, fork_count: 2, child_spell_id: shard }
shard:
  damage: 2
  trajectory_properties: { type: STRAIGHT, child_spell_id: splitter }
)");
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(book.Size(), 3u);
}

TEST(SpellBookTest, MalformedUpgradeFailsWholeLoad) {
    SpellBook book;
    auto result = book.LoadFromString(
        "zap: { damage: 3, upgrades: { level_2: { damage_type: plasma } } }");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(book.Size(), 0u);
}

TEST(SpellBookTest, FailedLoadKeepsPreviousContents) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    EXPECT_TRUE(book.LoadFromString("- not\n- a\n- map\n").hasError());
    EXPECT_TRUE(book.LoadFromString("zap: [unterminated").hasError());
    EXPECT_TRUE(book.LoadFromFile("does/not/exist.yaml").hasError());
    EXPECT_EQ(book.Size(), 3u);
}

TEST(SpellBookTest, ExistsFnAndIds) {
    SpellBook book;
    ASSERT_TRUE(book.LoadFromString(kSpells).hasValue());

    auto exists = book.ExistsFn();
    EXPECT_TRUE(exists("meteor"));
    EXPECT_FALSE(exists("fireball"));

    auto ids = book.SpellIds();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "ice_lance");
    EXPECT_EQ(ids[1], "meteor");
    EXPECT_EQ(ids[2], "plain");
}

TEST(SpellBookTest, SpellKindNames) {
    EXPECT_EQ(ToString(SpellKind::ProjectileAoe), "PROJECTILE_AOE");
    EXPECT_EQ(ParseSpellKind("projectile"), SpellKind::Projectile);
    EXPECT_FALSE(ParseSpellKind("BEAM").has_value());
}
