#include "nrating/core/model/Validator.h"

#include <sstream>
#include <unordered_map>
#include <utility>

namespace nrating::core::model {

namespace {

std::string DescribeGame(const GameResult& game) {
    std::ostringstream out;
    out << "round " << game.round << " game " << game.player_a << " vs " << game.player_b;
    return out.str();
}

bool IsKnownOutcome(Outcome outcome) {
    return outcome == Outcome::kPlayerAWins ||
           outcome == Outcome::kPlayerBWins ||
           outcome == Outcome::kDraw;
}

}  // namespace

bool BuildPlayerMap(const std::vector<Player>& roster, PlayerMap& players, Error* error) {
    PlayerMap built;
    for (const auto& player : roster) {
        if (player.name.empty()) {
            return Fail(error, ErrorKind::kValidation, "Player with empty name in rating list");
        }
        if (!built.emplace(player.name, player).second) {
            return Fail(error, ErrorKind::kValidation, "Duplicate player name: " + player.name);
        }
    }
    players = std::move(built);
    return true;
}

bool Validate(const PlayerMap& players, const std::vector<GameResult>& games, Error* error) {
    for (const auto& [name, player] : players) {
        if (player.name != name) {
            return Fail(error, ErrorKind::kValidation,
                        "Player entry keyed as '" + name + "' is named '" + player.name + "'");
        }
        if (player.prior_rating && *player.prior_rating < 0) {
            return Fail(error, ErrorKind::kValidation,
                        "Negative prior rating " + std::to_string(*player.prior_rating) +
                            " for player " + name);
        }
        if (player.prior_rating && *player.prior_rating > kMaxRating) {
            return Fail(error, ErrorKind::kValidation,
                        "Prior rating " + std::to_string(*player.prior_rating) + " for player " + name +
                            " is above " + std::to_string(kMaxRating));
        }
        if (player.lifetime_games < 0) {
            return Fail(error, ErrorKind::kValidation,
                        "Negative lifetime game count for player " + name);
        }
    }

    std::unordered_map<std::string, int> games_per_player;
    for (const auto& game : games) {
        if (game.player_a == game.player_b) {
            return Fail(error, ErrorKind::kValidation, "Player plays themselves: " + DescribeGame(game));
        }
        if (players.count(game.player_a) == 0) {
            return Fail(error, ErrorKind::kValidation,
                        "Unknown player '" + game.player_a + "' in " + DescribeGame(game));
        }
        if (players.count(game.player_b) == 0) {
            return Fail(error, ErrorKind::kValidation,
                        "Unknown player '" + game.player_b + "' in " + DescribeGame(game));
        }
        if (!IsKnownOutcome(game.outcome)) {
            return Fail(error, ErrorKind::kValidation, "Impossible outcome in " + DescribeGame(game));
        }
        games_per_player[game.player_a] += 1;
        games_per_player[game.player_b] += 1;
    }

    // Score bound: each game yields at most one point per side.
    std::unordered_map<std::string, double> points;
    for (const auto& game : games) {
        points[game.player_a] += game.PointsFor(game.player_a);
        points[game.player_b] += game.PointsFor(game.player_b);
    }
    for (const auto& [name, score] : points) {
        const int played = games_per_player[name];
        if (score < 0.0 || score > static_cast<double>(played)) {
            return Fail(error, ErrorKind::kValidation,
                        "Impossible score for player " + name + ": " + std::to_string(score) +
                            " from " + std::to_string(played) + " games");
        }
    }

    return true;
}

}  // namespace nrating::core::model
