#pragma once

#include "nrating/core/model/RatingTypes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace nrating::testing {

using core::model::GameResult;
using core::model::Outcome;
using core::model::Player;

inline Player MakePlayer(const std::string& name, std::optional<int> rating, int lifetime_games) {
    Player player;
    player.name = name;
    player.prior_rating = rating;
    player.lifetime_games = lifetime_games;
    return player;
}

inline GameResult MakeGame(const std::string& a, const std::string& b, Outcome outcome, int round = 1) {
    GameResult game;
    game.round = round;
    game.player_a = a;
    game.player_b = b;
    game.outcome = outcome;
    return game;
}

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("nrating_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string File(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void WriteText(const std::string& path, const std::string& contents) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << contents;
}

inline std::string ReadText(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream text;
    text << input.rdbuf();
    return text.str();
}

// A fixed-width rating list row: nick 0-8, name 9-28, games 29-33,
// rating 34-38, blank, date 40-47.
inline std::string DatRow(const std::string& name, int games, const std::string& rating,
                          const std::string& date) {
    std::string row(9, ' ');
    std::string padded_name = name;
    padded_name.resize(20, ' ');
    row += padded_name;
    std::string games_field = std::to_string(games);
    row += std::string(5 - games_field.size(), ' ') + games_field;
    row += std::string(5 - rating.size(), ' ') + rating;
    row += ' ';
    row += date;
    return row;
}

// The four-player AUPAIR fixture: three rounds, one tie (Arthur v Fred).
inline const char* kTowelDayTou =
    "*M25.05.2020 Glorious Towel Day Tournament\n"
    "*A\n"
    "Arthur Dent 2500 2 1300 +3 2450 4\n"
    "Bertie Wooster 450 +1 250 4 2550 3\n"
    "Sgt. Fred Colon 200 4 1300 1 400 2\n"
    "Obelix 2400 3 2300 2 200 +1\n"
    "*** END OF FILE ***\n"
    "\n";

}  // namespace nrating::testing
