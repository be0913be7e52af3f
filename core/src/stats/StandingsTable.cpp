#include "nrating/core/stats/StandingsTable.h"

#include <algorithm>
#include <utility>

namespace nrating::core::stats {

namespace {

void Tally(PlayerStats& stats, int round, const std::string& opponent, double points) {
    stats.games += 1;
    stats.points += points;
    if (points >= 1.0) {
        stats.wins += 1;
    } else if (points > 0.0) {
        stats.draws += 1;
    } else {
        stats.losses += 1;
    }
    stats.rounds.push_back(RoundEntry{round, opponent, points});
}

}  // namespace

StandingsTable::StandingsTable(std::vector<std::string> player_names) {
    standings_.reserve(player_names.size());
    for (auto& name : player_names) {
        PlayerStats stats;
        stats.name = std::move(name);
        standings_.push_back(std::move(stats));
    }
}

PlayerStats* StandingsTable::FindMutable(const std::string& name) {
    for (auto& entry : standings_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

const PlayerStats* StandingsTable::Find(const std::string& name) const {
    for (const auto& entry : standings_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

void StandingsTable::RecordGame(const model::GameResult& game) {
    auto* a = FindMutable(game.player_a);
    auto* b = FindMutable(game.player_b);
    if (!a || !b || a == b) {
        return;
    }
    Tally(*a, game.round, game.player_b, game.PointsFor(game.player_a));
    Tally(*b, game.round, game.player_a, game.PointsFor(game.player_b));
    games_played_ += 1;
}

void StandingsTable::RecordGames(const std::vector<model::GameResult>& games) {
    for (const auto& game : games) {
        RecordGame(game);
    }
}

std::vector<PlayerStats> StandingsTable::Ranked() const {
    auto sorted = standings_;
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.points != b.points) {
            return a.points > b.points;
        }
        if (a.wins != b.wins) {
            return a.wins > b.wins;
        }
        return a.name < b.name;
    });
    for (auto& entry : sorted) {
        std::stable_sort(entry.rounds.begin(), entry.rounds.end(),
                         [](const auto& x, const auto& y) { return x.round < y.round; });
    }
    return sorted;
}

}  // namespace nrating::core::stats
