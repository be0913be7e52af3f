#include "nrating/core/rating/RatingEngine.h"

#include "nrating/core/model/Validator.h"
#include "nrating/core/rating/Expectation.h"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace nrating::core::rating {

using model::ErrorKind;
using model::GameResult;
using model::Player;
using model::PlayerMap;
using model::RatingChange;

namespace {

// Joins whatever was started, including on the exception path.
class WorkerJoiner {
public:
    explicit WorkerJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~WorkerJoiner() { JoinAll(); }
    WorkerJoiner(const WorkerJoiner&) = delete;
    WorkerJoiner& operator=(const WorkerJoiner&) = delete;

    void JoinAll() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread>& threads_;
};

}  // namespace

RatingEngine::RatingEngine(RatingSettings settings) : settings_(std::move(settings)) {}

double RatingEngine::EffectiveRating(const Player& player) const {
    return static_cast<double>(player.prior_rating.value_or(settings_.default_rating));
}

RatingChange RatingEngine::RatePlayer(const Player& player,
                                      const std::vector<const GameResult*>& games,
                                      const PlayerMap& snapshot) const {
    RatingChange change;
    change.name = player.name;
    change.old_rating = player.prior_rating;
    change.games_played = static_cast<int>(games.size());
    change.provisional = player.lifetime_games < settings_.provisional_games;
    change.lifetime_games = player.lifetime_games + change.games_played;

    const double own_rating = EffectiveRating(player);
    if (games.empty()) {
        change.new_rating = player.prior_rating.value_or(settings_.default_rating);
        change.performance_rating = own_rating;
        return change;
    }

    double opponent_sum = 0.0;
    for (const auto* game : games) {
        const auto& opponent = snapshot.at(game->OpponentOf(player.name));
        const double opponent_rating = EffectiveRating(opponent);
        opponent_sum += opponent_rating;
        change.expected_score += ExpectedScore(own_rating, opponent_rating);
        change.actual_score += game->PointsFor(player.name);
    }

    const double count = static_cast<double>(games.size());
    change.performance_rating =
        PerformanceRating(opponent_sum / count, change.actual_score / count, settings_.performance_cap);

    double unrounded = 0.0;
    if (player.unrated()) {
        unrounded = change.performance_rating;
    } else {
        change.k_factor = change.provisional ? settings_.k_provisional : settings_.k_standard;
        unrounded = own_rating + change.k_factor * (change.actual_score - change.expected_score);
    }
    change.new_rating = std::max(RoundRating(unrounded, settings_.rounding), settings_.rating_floor);
    return change;
}

bool RatingEngine::ComputeNewRatings(const PlayerMap& players,
                                     const std::vector<GameResult>& games,
                                     model::RatingChangeMap& out,
                                     model::Error* error) const {
    std::vector<std::string> order;
    order.reserve(players.size());
    for (const auto& entry : players) {
        order.push_back(entry.first);
    }
    return ComputeNewRatings(players, games, order, out, error);
}

bool RatingEngine::ComputeNewRatings(const PlayerMap& players,
                                     const std::vector<GameResult>& games,
                                     const std::vector<std::string>& processing_order,
                                     model::RatingChangeMap& out,
                                     model::Error* error) const {
    if (!model::Validate(players, games, error)) {
        return false;
    }

    std::vector<const Player*> ordered;
    ordered.reserve(processing_order.size());
    std::unordered_set<std::string> seen;
    for (const auto& name : processing_order) {
        const auto it = players.find(name);
        if (it == players.end()) {
            return model::Fail(error, ErrorKind::kValidation, "Processing order names unknown player: " + name);
        }
        if (!seen.insert(name).second) {
            return model::Fail(error, ErrorKind::kValidation, "Processing order repeats player: " + name);
        }
        ordered.push_back(&it->second);
    }
    if (ordered.size() != players.size()) {
        return model::Fail(error, ErrorKind::kValidation, "Processing order does not cover every player");
    }

    std::unordered_map<std::string, std::vector<const GameResult*>> games_by_player;
    for (const auto& game : games) {
        games_by_player[game.player_a].push_back(&game);
        games_by_player[game.player_b].push_back(&game);
    }
    const std::vector<const GameResult*> no_games;
    const auto games_for = [&](const std::string& name) -> const std::vector<const GameResult*>& {
        const auto it = games_by_player.find(name);
        return it == games_by_player.end() ? no_games : it->second;
    };

    std::vector<RatingChange> results(ordered.size());
    const size_t workers =
        std::min(static_cast<size_t>(std::max(settings_.worker_threads, 1)), ordered.size());
    if (workers <= 1) {
        for (size_t i = 0; i < ordered.size(); ++i) {
            results[i] = RatePlayer(*ordered[i], games_for(ordered[i]->name), players);
        }
    } else {
        // Each worker owns a disjoint stride of `results`; the snapshot is read-only.
        const auto rate_stride = [&](size_t worker) {
            for (size_t i = worker; i < ordered.size(); i += workers) {
                results[i] = RatePlayer(*ordered[i], games_for(ordered[i]->name), players);
            }
        };
        std::vector<std::thread> threads;
        threads.reserve(workers);
        WorkerJoiner joiner(threads);
        size_t started = 0;
        try {
            for (; started < workers; ++started) {
                threads.emplace_back(rate_stride, started);
            }
        } catch (const std::system_error& ex) {
            std::cerr << "[rating] Started " << started << " of " << workers
                      << " workers (" << ex.what() << "); rating the rest on the calling thread" << '\n';
        }
        for (size_t worker = started; worker < workers; ++worker) {
            rate_stride(worker);
        }
        joiner.JoinAll();
    }

    model::RatingChangeMap computed;
    for (auto& change : results) {
        auto name = change.name;
        computed.emplace(std::move(name), std::move(change));
    }
    out = std::move(computed);
    return true;
}

}  // namespace nrating::core::rating
