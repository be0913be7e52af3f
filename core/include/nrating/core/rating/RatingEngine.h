#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"
#include "nrating/core/rating/RatingSettings.h"

#include <string>
#include <vector>

namespace nrating::core::rating {

// Computes one event's rating changes from the pre-event rating list.
//
// Every player is rated against the same immutable snapshot of prior
// ratings, so the result does not depend on the order players are
// processed in or on how many workers share the pass. The input map is
// never modified.
class RatingEngine {
public:
    explicit RatingEngine(RatingSettings settings);

    bool ComputeNewRatings(const model::PlayerMap& players,
                           const std::vector<model::GameResult>& games,
                           model::RatingChangeMap& out,
                           model::Error* error) const;

    // `processing_order` must name every player exactly once.
    bool ComputeNewRatings(const model::PlayerMap& players,
                           const std::vector<model::GameResult>& games,
                           const std::vector<std::string>& processing_order,
                           model::RatingChangeMap& out,
                           model::Error* error) const;

private:
    double EffectiveRating(const model::Player& player) const;
    model::RatingChange RatePlayer(const model::Player& player,
                                   const std::vector<const model::GameResult*>& games,
                                   const model::PlayerMap& snapshot) const;

    RatingSettings settings_;
};

}  // namespace nrating::core::rating
