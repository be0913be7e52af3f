#pragma once

#include <string>

namespace nrating::core::rating {

enum class RoundingRule {
    kHalfEven,
    kHalfUp,
};

// Constants of the rating method. Every field can be overridden from the
// "rating" block of the JSON configuration.
struct RatingSettings {
    int default_rating = 1500;
    int provisional_games = 30;
    double k_standard = 15.0;
    double k_provisional = 30.0;
    int rating_floor = 100;
    RoundingRule rounding = RoundingRule::kHalfEven;
    double performance_cap = 800.0;
    int worker_threads = 1;
};

const char* RoundingRuleName(RoundingRule rule);
bool ParseRoundingRule(const std::string& value, RoundingRule& rule);

}  // namespace nrating::core::rating
