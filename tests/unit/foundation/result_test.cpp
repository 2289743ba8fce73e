#include <gtest/gtest.h>

#include <string>

#include "cre/core/result.hpp"
#include "cre/foundation/combat_result.hpp"

using namespace cre::foundation;

// --- cre::Result tests ---

TEST(ResultTest, OkValue) {
    auto result = cre::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = cre::Result<int>::err(cre::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = cre::Result<int>::err(cre::Error(7, "bad spell"));
    EXPECT_EQ(result.error().code, 7);
    EXPECT_EQ(result.error().message, "bad spell");
}

TEST(ResultTest, ValueOr) {
    auto ok = cre::Result<int>::ok(10);
    auto err = cre::Result<int>::err(cre::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = cre::Result<std::string, std::string>::ok("value");
    auto err = cre::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, MoveOutValue) {
    auto result = cre::Result<std::string>::ok("fireball");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "fireball");
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = cre::Result<void>::ok();
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(ok.hasError());

    auto err = cre::Result<void>::err(cre::Error("void error"));
    EXPECT_FALSE(static_cast<bool>(err));
    EXPECT_EQ(err.error().message, "void error");
}

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::EntityNotFound), "ECS");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidStats), "Stats");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidProjectileConfig), "Projectile");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownSpell), "Projectile");
    EXPECT_EQ(errorSubsystem(ErrorCode::SpellOnCooldown), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::CombatPhaseInactive), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::SpellDataInvalid), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, UnmappedRange) {
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x0F00)), "Unknown");
}

// --- CombatError tests ---

TEST(CombatErrorTest, DefaultConstruction) {
    CombatError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(CombatErrorTest, CodeAndMessage) {
    CombatError err(ErrorCode::InsufficientEnergy, "needs 10 energy");
    EXPECT_EQ(err.code(), ErrorCode::InsufficientEnergy);
    EXPECT_EQ(err.message(), "needs 10 energy");
    EXPECT_EQ(err.subsystem(), "Combat");
}

TEST(CombatErrorTest, WithContext) {
    CombatError err(ErrorCode::UnknownSpell, "no such spell", std::string("frost_nova"));
    ASSERT_TRUE(err.hasContext());
    const auto* id = err.context<std::string>();
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(*id, "frost_nova");
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- CombatResult tests ---

TEST(CombatResultTest, MakeError) {
    auto result = makeError<int>(ErrorCode::InvalidArgument, "bad input");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(CombatResultTest, VoidOk) {
    auto result = CombatResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}
