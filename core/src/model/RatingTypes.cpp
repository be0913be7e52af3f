#include "nrating/core/model/RatingTypes.h"

namespace nrating::core::model {

double GameResult::PointsFor(const std::string& name) const {
    if (outcome == Outcome::kDraw) {
        return 0.5;
    }
    const bool is_a = (player_a == name);
    if (outcome == Outcome::kPlayerAWins) {
        return is_a ? 1.0 : 0.0;
    }
    return is_a ? 0.0 : 1.0;
}

bool operator==(const RatingChange& lhs, const RatingChange& rhs) {
    return lhs.name == rhs.name &&
           lhs.old_rating == rhs.old_rating &&
           lhs.new_rating == rhs.new_rating &&
           lhs.performance_rating == rhs.performance_rating &&
           lhs.expected_score == rhs.expected_score &&
           lhs.actual_score == rhs.actual_score &&
           lhs.games_played == rhs.games_played &&
           lhs.k_factor == rhs.k_factor &&
           lhs.provisional == rhs.provisional &&
           lhs.lifetime_games == rhs.lifetime_games;
}

}  // namespace nrating::core::model
