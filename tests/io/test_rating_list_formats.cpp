#include <gtest/gtest.h>

#include "nrating/core/io/RatingListFormats.h"
#include "test_support.h"

#include <sstream>

using namespace nrating::core;
using nrating::testing::DatRow;

namespace {

std::vector<model::Player> ReadDat(const std::string& text, model::Error* error, bool* ok) {
    std::istringstream input(text);
    std::vector<model::Player> roster;
    *ok = io::ReadDatRatingList(input, "ratings.dat", roster, error);
    return roster;
}

std::vector<model::Player> ReadCsv(const std::string& text, model::Error* error, bool* ok) {
    std::istringstream input(text);
    std::vector<model::Player> roster;
    *ok = io::ReadCsvRatingList(input, "ratings.csv", roster, error);
    return roster;
}

}  // namespace

// ─── Fixed-width .dat ───────────────────────────────────────────────────────

TEST(DatRatingList, ReadsFixedWidthColumns) {
    const std::string text = "NICK     NAME                GAMES RAT  LASTPLAY\n" +
                             DatRow("Arthur Dent", 42, "1734", "20200525") + "\n" +
                             DatRow("Obelix", 3, "", "20191101") + "\n" + "\n";
    model::Error error;
    bool ok = false;
    const auto roster = ReadDat(text, &error, &ok);
    ASSERT_TRUE(ok) << error.ToString();
    ASSERT_EQ(roster.size(), 2u);

    EXPECT_EQ(roster[0].name, "Arthur Dent");
    EXPECT_EQ(roster[0].lifetime_games, 42);
    EXPECT_EQ(roster[0].prior_rating, 1734);
    EXPECT_EQ(roster[0].last_played, "20200525");

    EXPECT_EQ(roster[1].name, "Obelix");
    EXPECT_TRUE(roster[1].unrated());
    EXPECT_EQ(roster[1].lifetime_games, 3);
}

TEST(DatRatingList, HeadingOnlyYieldsEmptyRoster) {
    model::Error error;
    bool ok = false;
    const auto roster = ReadDat("heading\n", &error, &ok);
    EXPECT_TRUE(ok);
    EXPECT_TRUE(roster.empty());
}

TEST(DatRatingList, RejectsNonNumericRatingWithLine) {
    const std::string text = "heading\n" + DatRow("Arthur Dent", 4, "1500", "20200525") + "\n" +
                             DatRow("Bertie Wooster", 4, "abc", "20200525") + "\n";
    model::Error error;
    bool ok = true;
    ReadDat(text, &error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(error.kind, model::ErrorKind::kFormat);
    EXPECT_EQ(error.path, "ratings.dat");
    EXPECT_EQ(error.line, 3);
}

TEST(DatRatingList, RejectsRowWithoutName) {
    model::Error error;
    bool ok = true;
    ReadDat("heading\n" + DatRow("", 4, "1500", "20200525") + "\n", &error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(error.line, 2);
}

// ─── CSV ────────────────────────────────────────────────────────────────────

TEST(CsvRatingList, ReadsColumnsInAnyOrder) {
    const std::string text =
        "Games played,Name,Deviation,Rating\n"
        "12,\"Dent, Arthur\",80,1734\n"
        "0,Obelix,,\n";
    model::Error error;
    bool ok = false;
    const auto roster = ReadCsv(text, &error, &ok);
    ASSERT_TRUE(ok) << error.ToString();
    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].name, "Dent, Arthur");
    EXPECT_EQ(roster[0].prior_rating, 1734);
    EXPECT_EQ(roster[0].lifetime_games, 12);
    EXPECT_TRUE(roster[1].unrated());
}

TEST(CsvRatingList, GamesAndLastPlayedAreOptional) {
    model::Error error;
    bool ok = false;
    const auto roster = ReadCsv("name,rating,last played\nFred,1200,2020-01-01\n", &error, &ok);
    ASSERT_TRUE(ok) << error.ToString();
    ASSERT_EQ(roster.size(), 1u);
    EXPECT_EQ(roster[0].lifetime_games, 0);
    EXPECT_EQ(roster[0].last_played, "2020-01-01");
}

TEST(CsvRatingList, RejectsHeaderWithoutRating) {
    model::Error error;
    bool ok = true;
    ReadCsv("Name,Games\nFred,3\n", &error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(error.kind, model::ErrorKind::kFormat);
    EXPECT_EQ(error.line, 1);
}

TEST(CsvRatingList, RejectsEmptyInput) {
    model::Error error;
    bool ok = true;
    ReadCsv("", &error, &ok);
    EXPECT_FALSE(ok);
}

TEST(CsvRatingList, RejectsFractionalRating) {
    model::Error error;
    bool ok = true;
    ReadCsv("Name,Rating\nFred,1200.5\n", &error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(error.line, 2);
}

// ─── Name lists ─────────────────────────────────────────────────────────────

TEST(NameList, TrimsLinesAndSkipsBlanks) {
    std::istringstream input("  Idle Person \n\n\tObelix\r\n   \n");
    std::vector<std::string> names;
    model::Error error;
    ASSERT_TRUE(io::ReadNameList(input, "removed.txt", names, &error)) << error.ToString();
    const std::vector<std::string> expected = {"Idle Person", "Obelix"};
    EXPECT_EQ(names, expected);
}
