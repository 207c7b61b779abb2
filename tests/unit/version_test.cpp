#include <gtest/gtest.h>

#include <string>

#include "cce/cce.hpp"

using namespace cce::foundation;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(cce::Version::major, 0);
    EXPECT_EQ(cce::Version::minor, 1);
    EXPECT_EQ(cce::Version::patch, 0);
    EXPECT_STREQ(cce::Version::string, "0.1.0");
}

TEST(ResultTest, OkAndError) {
    auto ok = cce::Result<int>::ok(42);
    EXPECT_TRUE(ok.hasValue());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value(), 42);

    auto err = cce::Result<int>::err(cce::Error(404, "not found"));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().code, 404);
    EXPECT_EQ(err.valueOr(7), 7);
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = cce::Result<std::string, std::string>::ok("value");
    auto err = cce::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = GameResult<void>::ok();
    EXPECT_TRUE(ok.hasValue());

    auto err = GameResult<void>::err(GameError(ErrorCode::NotFound, "gone"));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().code(), ErrorCode::NotFound);
}

// ---------------------------------------------------------------------------
// ErrorCode / GameError
// ---------------------------------------------------------------------------

TEST(ErrorCodeTest, SubsystemByRange) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::InsufficientCharge), "Weapon");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoEvolutionSlots), "Progression");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoCompatibleCategory), "Crafting");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotActorsTurn), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::SnapshotInvalid), "Persistence");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x7F00)), "Unknown");
}

TEST(ErrorCodeTest, Families) {
    EXPECT_TRUE(isResourceError(ErrorCode::InsufficientCharge));
    EXPECT_TRUE(isResourceError(ErrorCode::EffectOnCooldown));
    EXPECT_FALSE(isResourceError(ErrorCode::NotEligible));
    EXPECT_TRUE(isStateError(ErrorCode::AlreadyAssigned));
    EXPECT_TRUE(isStateError(ErrorCode::CombatNotInProgress));
    EXPECT_FALSE(isStateError(ErrorCode::WeaponNotFound));
}

TEST(GameErrorTest, TypedContext) {
    GameError err(ErrorCode::InsufficientCharge, "not enough charge",
                  ResourceShortfall{ResourceKind::Charge, 40, 50});

    EXPECT_EQ(err.subsystem(), "Weapon");
    EXPECT_EQ(err.message(), "not enough charge");
    ASSERT_TRUE(err.hasContext());
    const auto* shortfall = err.context<ResourceShortfall>();
    ASSERT_NE(shortfall, nullptr);
    EXPECT_EQ(shortfall->available, 40);
    EXPECT_EQ(shortfall->required, 50);
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(GameErrorTest, DefaultIsUnknown) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_FALSE(err.isSuccess());
    EXPECT_FALSE(err.hasContext());
}

TEST(StrongIdTest, ValueAndValidity) {
    PlayerId none;
    PlayerId one(1);
    EXPECT_FALSE(none.isValid());
    EXPECT_TRUE(one.isValid());
    EXPECT_LT(none, one);
    EXPECT_EQ(std::hash<PlayerId>{}(one), std::hash<uint64_t>{}(1));
}
