#include "nrating/core/rating/Expectation.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nrating::core::rating {

namespace {

constexpr double kLogisticScale = 400.0;

}  // namespace

const char* RoundingRuleName(RoundingRule rule) {
    switch (rule) {
        case RoundingRule::kHalfEven:
            return "half_even";
        case RoundingRule::kHalfUp:
            return "half_up";
    }
    return "half_even";
}

bool ParseRoundingRule(const std::string& value, RoundingRule& rule) {
    if (value == "half_even") {
        rule = RoundingRule::kHalfEven;
        return true;
    }
    if (value == "half_up") {
        rule = RoundingRule::kHalfUp;
        return true;
    }
    return false;
}

double ExpectedScore(double rating, double opponent_rating) {
    return 1.0 / (1.0 + std::pow(10.0, (opponent_rating - rating) / kLogisticScale));
}

double PerformanceRating(double average_opponent, double score_fraction, double cap) {
    if (score_fraction <= 0.0) {
        return average_opponent - cap;
    }
    if (score_fraction >= 1.0) {
        return average_opponent + cap;
    }
    const double offset = kLogisticScale * std::log10(score_fraction / (1.0 - score_fraction));
    return average_opponent + std::clamp(offset, -cap, cap);
}

int RoundRating(double value, RoundingRule rule) {
    value = std::clamp(value, static_cast<double>(std::numeric_limits<int>::min()),
                       static_cast<double>(std::numeric_limits<int>::max()));
    const double lower = std::floor(value);
    const double fraction = value - lower;
    if (rule == RoundingRule::kHalfUp) {
        return static_cast<int>(fraction >= 0.5 ? lower + 1.0 : lower);
    }
    if (fraction < 0.5) {
        return static_cast<int>(lower);
    }
    if (fraction > 0.5) {
        return static_cast<int>(lower + 1.0);
    }
    const bool lower_is_even = std::fmod(lower, 2.0) == 0.0;
    return static_cast<int>(lower_is_even ? lower : lower + 1.0);
}

}  // namespace nrating::core::rating
