#pragma once

#include "nrating/core/rating/RatingSettings.h"

namespace nrating::core::rating {

// Logistic expectation of `rating` against `opponent_rating`:
// 1 / (1 + 10^((opponent - rating) / 400)).
double ExpectedScore(double rating, double opponent_rating);

// Inverse of ExpectedScore for a score fraction against an average
// opponent. Perfect and zero scores, and anything beyond `cap`, are
// clamped to average_opponent +/- cap.
double PerformanceRating(double average_opponent, double score_fraction, double cap);

int RoundRating(double value, RoundingRule rule);

}  // namespace nrating::core::rating
