#pragma once

#include "nrating/core/model/RatingTypes.h"

#include <string>
#include <vector>

namespace nrating::core::stats {

struct RoundEntry {
    int round = 0;
    std::string opponent;
    double points = 0.0;
};

struct PlayerStats {
    std::string name;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    double points = 0.0;
    std::vector<RoundEntry> rounds;

    double score_percent() const {
        if (games == 0) {
            return 0.0;
        }
        return (points / static_cast<double>(games)) * 100.0;
    }
};

class StandingsTable {
public:
    explicit StandingsTable(std::vector<std::string> player_names);

    // Games between players outside the table are ignored.
    void RecordGame(const model::GameResult& game);
    void RecordGames(const std::vector<model::GameResult>& games);

    // Players in the order the table was built with.
    const std::vector<PlayerStats>& standings() const { return standings_; }
    // Points, then wins, descending; name ascending breaks the remaining ties.
    std::vector<PlayerStats> Ranked() const;
    const PlayerStats* Find(const std::string& name) const;
    int games_played() const { return games_played_; }

private:
    PlayerStats* FindMutable(const std::string& name);

    std::vector<PlayerStats> standings_;
    int games_played_ = 0;
};

}  // namespace nrating::core::stats
