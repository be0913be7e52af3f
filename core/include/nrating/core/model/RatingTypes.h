#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nrating::core::model {

enum class Outcome {
    kPlayerAWins,
    kPlayerBWins,
    kDraw,
};

struct Player {
    std::string name;
    std::optional<int> prior_rating;
    int lifetime_games = 0;
    std::string last_played;

    bool unrated() const { return !prior_rating.has_value(); }
};

struct GameResult {
    int round = 0;
    std::string player_a;
    std::string player_b;
    Outcome outcome = Outcome::kDraw;

    bool Involves(const std::string& name) const { return player_a == name || player_b == name; }
    const std::string& OpponentOf(const std::string& name) const {
        return player_a == name ? player_b : player_a;
    }
    // 1, 0.5 or 0 from the point of view of `name`.
    double PointsFor(const std::string& name) const;
};

struct Section {
    std::string name;
    std::vector<std::string> players;
};

struct TournamentRecord {
    std::string name;
    std::string date;
    std::vector<Section> sections;
    std::vector<GameResult> games;
};

struct RatingChange {
    std::string name;
    std::optional<int> old_rating;
    int new_rating = 0;
    double performance_rating = 0.0;
    double expected_score = 0.0;
    double actual_score = 0.0;
    int games_played = 0;
    double k_factor = 0.0;
    bool provisional = false;
    int lifetime_games = 0;

    int delta() const { return old_rating ? new_rating - *old_rating : 0; }
};

// Ordered by name so that every traversal is deterministic.
using PlayerMap = std::map<std::string, Player>;
using RatingChangeMap = std::map<std::string, RatingChange>;

bool operator==(const RatingChange& lhs, const RatingChange& rhs);
inline bool operator!=(const RatingChange& lhs, const RatingChange& rhs) { return !(lhs == rhs); }

}  // namespace nrating::core::model
