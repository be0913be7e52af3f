#include <gtest/gtest.h>

#include "nrating/core/rating/Expectation.h"

#include <cmath>
#include <limits>

using namespace nrating::core::rating;

// ─── ExpectedScore ──────────────────────────────────────────────────────────

TEST(ExpectedScore, EqualRatingsGiveHalf) {
    EXPECT_DOUBLE_EQ(ExpectedScore(1500.0, 1500.0), 0.5);
}

TEST(ExpectedScore, FourHundredPointGapIsTenToOne) {
    EXPECT_NEAR(ExpectedScore(1900.0, 1500.0), 10.0 / 11.0, 1e-12);
    EXPECT_NEAR(ExpectedScore(1500.0, 1900.0), 1.0 / 11.0, 1e-12);
}

TEST(ExpectedScore, BothSidesSumToOne) {
    const double pairs[][2] = {{1500, 1500}, {1200, 2100}, {2450, 1830}, {100, 2800}, {1601, 1599}};
    for (const auto& pair : pairs) {
        const double a = ExpectedScore(pair[0], pair[1]);
        const double b = ExpectedScore(pair[1], pair[0]);
        EXPECT_NEAR(a + b, 1.0, 1e-12) << pair[0] << " vs " << pair[1];
    }
}

TEST(ExpectedScore, HigherRatedIsFavoured) {
    EXPECT_GT(ExpectedScore(1700.0, 1500.0), 0.5);
    EXPECT_LT(ExpectedScore(1500.0, 1700.0), 0.5);
}

// ─── PerformanceRating ──────────────────────────────────────────────────────

TEST(PerformanceRating, FiftyPercentIsTheAverage) {
    EXPECT_DOUBLE_EQ(PerformanceRating(1600.0, 0.5, 800.0), 1600.0);
}

TEST(PerformanceRating, SeventyFivePercentInvertsTheCurve) {
    const double rating = PerformanceRating(1600.0, 0.75, 800.0);
    EXPECT_NEAR(rating, 1600.0 + 400.0 * std::log10(3.0), 1e-9);
    // Inverting: that rating is expected to score 75% against 1600.
    EXPECT_NEAR(ExpectedScore(rating, 1600.0), 0.75, 1e-12);
}

TEST(PerformanceRating, PerfectAndZeroScoresAreClamped) {
    EXPECT_DOUBLE_EQ(PerformanceRating(1600.0, 1.0, 800.0), 2400.0);
    EXPECT_DOUBLE_EQ(PerformanceRating(1600.0, 0.0, 800.0), 800.0);
}

TEST(PerformanceRating, LopsidedScoresRespectTheCap) {
    EXPECT_DOUBLE_EQ(PerformanceRating(1600.0, 0.999, 400.0), 2000.0);
    EXPECT_DOUBLE_EQ(PerformanceRating(1600.0, 0.001, 400.0), 1200.0);
}

// ─── RoundRating ────────────────────────────────────────────────────────────

TEST(RoundRating, HalfEvenSplitsTiesTowardEven) {
    EXPECT_EQ(RoundRating(1507.5, RoundingRule::kHalfEven), 1508);
    EXPECT_EQ(RoundRating(1492.5, RoundingRule::kHalfEven), 1492);
    EXPECT_EQ(RoundRating(1500.49, RoundingRule::kHalfEven), 1500);
    EXPECT_EQ(RoundRating(1500.51, RoundingRule::kHalfEven), 1501);
}

TEST(RoundRating, HalfUpAlwaysRoundsTiesUp) {
    EXPECT_EQ(RoundRating(1507.5, RoundingRule::kHalfUp), 1508);
    EXPECT_EQ(RoundRating(1492.5, RoundingRule::kHalfUp), 1493);
    EXPECT_EQ(RoundRating(1492.4, RoundingRule::kHalfUp), 1492);
}

TEST(RoundRating, SaturatesOutsideIntRange) {
    EXPECT_EQ(RoundRating(1e12, RoundingRule::kHalfEven), std::numeric_limits<int>::max());
    EXPECT_EQ(RoundRating(-1e12, RoundingRule::kHalfUp), std::numeric_limits<int>::min());
}

TEST(RoundingRuleNames, ParseWhatTheyPrint) {
    RoundingRule rule = RoundingRule::kHalfUp;
    EXPECT_TRUE(ParseRoundingRule(RoundingRuleName(RoundingRule::kHalfEven), rule));
    EXPECT_EQ(rule, RoundingRule::kHalfEven);
    EXPECT_FALSE(ParseRoundingRule("bankers", rule));
}
