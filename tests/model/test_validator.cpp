#include <gtest/gtest.h>

#include "nrating/core/model/Validator.h"
#include "test_support.h"

#include <string>
#include <vector>

using namespace nrating::core::model;
using nrating::testing::MakeGame;
using nrating::testing::MakePlayer;

namespace {

PlayerMap Pair(std::optional<int> a_rating = 1500, int a_games = 10) {
    PlayerMap players;
    players.emplace("A", MakePlayer("A", a_rating, a_games));
    players.emplace("B", MakePlayer("B", 1500, 10));
    return players;
}

}  // namespace

// ─── BuildPlayerMap ─────────────────────────────────────────────────────────

TEST(BuildPlayerMap, KeysPlayersByName) {
    PlayerMap players;
    Error error;
    ASSERT_TRUE(BuildPlayerMap({MakePlayer("Zed", 1400, 3), MakePlayer("Amy", std::nullopt, 0)}, players, &error));
    ASSERT_EQ(players.size(), 2u);
    EXPECT_EQ(players.at("Zed").prior_rating, 1400);
    EXPECT_TRUE(players.at("Amy").unrated());
}

TEST(BuildPlayerMap, DuplicateNameLeavesMapUntouched) {
    PlayerMap players;
    players.emplace("Old", MakePlayer("Old", 1000, 1));
    Error error;
    EXPECT_FALSE(BuildPlayerMap({MakePlayer("Amy", 1400, 3), MakePlayer("Amy", 1500, 4)}, players, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("Amy"), std::string::npos);
    ASSERT_EQ(players.size(), 1u);
    EXPECT_EQ(players.count("Old"), 1u);
}

TEST(BuildPlayerMap, RejectsEmptyName) {
    PlayerMap players;
    Error error;
    EXPECT_FALSE(BuildPlayerMap({MakePlayer("", 1400, 3)}, players, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

// ─── Validate ───────────────────────────────────────────────────────────────

TEST(Validate, AcceptsConsistentInput) {
    Error error;
    EXPECT_TRUE(Validate(Pair(), {MakeGame("A", "B", Outcome::kDraw), MakeGame("B", "A", Outcome::kPlayerAWins, 2)},
                         &error));
}

TEST(Validate, AcceptsUnratedPlayersAndNoGames) {
    Error error;
    EXPECT_TRUE(Validate(Pair(std::nullopt, 0), {}, &error));
}

TEST(Validate, RejectsNegativeRating) {
    Error error;
    EXPECT_FALSE(Validate(Pair(-1), {}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST(Validate, RejectsRatingAboveMaximum) {
    Error error;
    EXPECT_TRUE(Validate(Pair(kMaxRating), {}, &error));
    EXPECT_FALSE(Validate(Pair(kMaxRating + 1), {}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("9999"), std::string::npos);
}

TEST(Validate, RejectsNegativeLifetimeGames) {
    Error error;
    EXPECT_FALSE(Validate(Pair(1500, -3), {}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST(Validate, RejectsKeyNameMismatch) {
    PlayerMap players = Pair();
    players.emplace("C", MakePlayer("Not C", 1500, 1));
    Error error;
    EXPECT_FALSE(Validate(players, {}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST(Validate, RejectsSelfPlay) {
    Error error;
    EXPECT_FALSE(Validate(Pair(), {MakeGame("A", "A", Outcome::kDraw)}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("themselves"), std::string::npos);
}

TEST(Validate, RejectsUnknownPlayerOnEitherSide) {
    Error error;
    EXPECT_FALSE(Validate(Pair(), {MakeGame("Ghost", "B", Outcome::kDraw)}, &error));
    EXPECT_NE(error.message.find("Ghost"), std::string::npos);
    EXPECT_FALSE(Validate(Pair(), {MakeGame("A", "Phantom", Outcome::kDraw, 4)}, &error));
    EXPECT_NE(error.message.find("Phantom"), std::string::npos);
    EXPECT_NE(error.message.find("round 4"), std::string::npos);
}

TEST(Validate, RejectsOutOfRangeOutcome) {
    Error error;
    EXPECT_FALSE(Validate(Pair(), {MakeGame("A", "B", static_cast<Outcome>(9))}, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST(ErrorFormatting, IncludesKindPathAndLine) {
    Error error;
    EXPECT_FALSE(Fail(&error, ErrorKind::kFormat, "bad score", "event.tou", 7));
    EXPECT_EQ(error.ToString(), "FormatError: event.tou:7: bad score");
    EXPECT_FALSE(Fail(&error, ErrorKind::kConfig, "missing date"));
    EXPECT_EQ(error.ToString(), "ConfigError: missing date");
    EXPECT_FALSE(Fail(nullptr, ErrorKind::kIo, "ignored"));
}
