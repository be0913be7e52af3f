#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <vector>

namespace nrating::core::model {

// Widest value the rating list columns hold.
constexpr int kMaxRating = 9999;

// Rejects duplicate names. On failure `players` is left untouched.
bool BuildPlayerMap(const std::vector<Player>& roster, PlayerMap& players, Error* error);

// Cross-reference and consistency checks run once before the engine.
bool Validate(const PlayerMap& players, const std::vector<GameResult>& games, Error* error);

}  // namespace nrating::core::model
