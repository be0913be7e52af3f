#include <gtest/gtest.h>

#include "nrating/core/stats/StandingsTable.h"
#include "test_support.h"

using nrating::core::model::Outcome;
using nrating::core::stats::StandingsTable;
using nrating::testing::MakeGame;

TEST(StandingsTable, TalliesWinsDrawsAndLosses) {
    StandingsTable table({"A", "B", "C"});
    table.RecordGames({
        MakeGame("A", "B", Outcome::kPlayerAWins, 1),
        MakeGame("C", "A", Outcome::kDraw, 2),
        MakeGame("B", "C", Outcome::kPlayerBWins, 3),
    });

    const auto* a = table.Find("A");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->games, 2);
    EXPECT_EQ(a->wins, 1);
    EXPECT_EQ(a->draws, 1);
    EXPECT_EQ(a->losses, 0);
    EXPECT_DOUBLE_EQ(a->points, 1.5);
    EXPECT_DOUBLE_EQ(a->score_percent(), 75.0);

    const auto* b = table.Find("B");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->losses, 2);
    EXPECT_DOUBLE_EQ(b->points, 0.0);
    EXPECT_EQ(table.games_played(), 3);
}

TEST(StandingsTable, IgnoresGamesOutsideTheTable) {
    StandingsTable table({"A", "B"});
    table.RecordGame(MakeGame("A", "Stranger", Outcome::kPlayerAWins));
    table.RecordGame(MakeGame("A", "A", Outcome::kDraw));
    EXPECT_EQ(table.games_played(), 0);
    EXPECT_EQ(table.Find("A")->games, 0);
    EXPECT_EQ(table.Find("Stranger"), nullptr);
}

TEST(StandingsTable, PlayerWithoutGamesScoresZeroPercent) {
    StandingsTable table({"Idle"});
    EXPECT_DOUBLE_EQ(table.Find("Idle")->score_percent(), 0.0);
}

TEST(StandingsTable, RankedOrdersByPointsThenWinsThenName) {
    StandingsTable table({"Dee", "Cal", "Bea", "Abe"});
    table.RecordGames({
        // Cal: 1 win 1 loss = 1.0. Bea: 2 draws = 1.0. Abe: 1 draw 1 loss = 0.5.
        MakeGame("Cal", "Abe", Outcome::kPlayerAWins, 1),
        MakeGame("Bea", "Dee", Outcome::kDraw, 1),
        MakeGame("Dee", "Cal", Outcome::kPlayerAWins, 2),
        MakeGame("Abe", "Bea", Outcome::kDraw, 2),
    });
    const auto ranked = table.Ranked();
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].name, "Dee");
    EXPECT_EQ(ranked[1].name, "Cal");
    EXPECT_EQ(ranked[2].name, "Bea");
    EXPECT_EQ(ranked[3].name, "Abe");
    // Construction order is preserved in standings().
    EXPECT_EQ(table.standings().front().name, "Dee");
    EXPECT_EQ(table.standings().back().name, "Abe");
}

TEST(StandingsTable, RankedSortsRoundsAscending) {
    StandingsTable table({"A", "B", "C"});
    table.RecordGame(MakeGame("A", "C", Outcome::kPlayerBWins, 3));
    table.RecordGame(MakeGame("B", "A", Outcome::kPlayerBWins, 1));
    const auto ranked = table.Ranked();
    for (const auto& entry : ranked) {
        if (entry.name != "A") {
            continue;
        }
        ASSERT_EQ(entry.rounds.size(), 2u);
        EXPECT_EQ(entry.rounds[0].round, 1);
        EXPECT_EQ(entry.rounds[0].opponent, "B");
        EXPECT_DOUBLE_EQ(entry.rounds[0].points, 1.0);
        EXPECT_EQ(entry.rounds[1].round, 3);
        EXPECT_DOUBLE_EQ(entry.rounds[1].points, 0.0);
    }
}
