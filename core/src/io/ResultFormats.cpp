#include "nrating/core/io/ResultFormats.h"

#include "nrating/core/util/Text.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace nrating::core::io {

using model::ErrorKind;
using model::Fail;
using model::GameResult;
using model::Outcome;

namespace {

constexpr const char* kEndOfFile = "*** END OF FILE ***";
constexpr int kScorePrefixModulus = 1000;

struct TouPairing {
    int score = 0;
    int opponent = 0;
};

struct TouPlayerLine {
    std::string name;
    int line_no = 0;
    std::vector<TouPairing> pairings;
};

struct TouSection {
    std::string name;
    std::vector<TouPlayerLine> players;
};

bool HasLetter(const std::string& token) {
    return std::any_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

Outcome OutcomeFromScores(int score_a, int score_b) {
    if (score_a > score_b) {
        return Outcome::kPlayerAWins;
    }
    if (score_a < score_b) {
        return Outcome::kPlayerBWins;
    }
    return Outcome::kDraw;
}

// dd.mm.yyyy -> yyyy-mm-dd; empty when the text is not in that shape.
std::string NormalizeTouDate(const std::string& text) {
    if (text.size() != 10 || text[2] != '.' || text[5] != '.') {
        return {};
    }
    for (size_t i : {0u, 1u, 3u, 4u, 6u, 7u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return {};
        }
    }
    const int day = std::stoi(text.substr(0, 2));
    const int month = std::stoi(text.substr(3, 2));
    if (day < 1 || day > 31 || month < 1 || month > 12) {
        return {};
    }
    return text.substr(6, 4) + "-" + text.substr(3, 2) + "-" + text.substr(0, 2);
}

bool ParseTouHeader(const std::string& header, const std::string& path, model::TournamentRecord& record,
                    model::Error* error) {
    const std::string line = util::Trim(header);
    if (line.size() < 2 || line[0] != '*' || (line[1] != 'M' && line[1] != 'm')) {
        return Fail(error, ErrorKind::kFormat, "Header must start with *M<dd.mm.yyyy>", path, 1);
    }
    const auto space = line.find(' ');
    const std::string raw_date = line.substr(2, space == std::string::npos ? std::string::npos : space - 2);
    record.name = space == std::string::npos ? std::string() : util::Trim(line.substr(space + 1));
    record.date = NormalizeTouDate(raw_date);
    if (record.date.empty()) {
        std::cerr << "[io] Cannot parse tournament date '" << raw_date << "' as dd.mm.yyyy in " << path
                  << "; keeping it verbatim." << '\n';
        record.date = raw_date;
    }
    return true;
}

// Returns false with *error set on malformed numbers. A line without
// score pairs (a high-word line) yields an empty `out.pairings`.
bool ParseTouPlayerLine(const std::string& line, int line_no, const std::string& path, TouPlayerLine& out,
                        model::Error* error) {
    const auto tokens = util::SplitTokens(line);
    size_t name_tokens = 0;
    while (name_tokens < tokens.size() && HasLetter(tokens[name_tokens])) {
        ++name_tokens;
    }

    out.line_no = line_no;
    out.name.clear();
    for (size_t i = 0; i < name_tokens; ++i) {
        if (i > 0) {
            out.name += ' ';
        }
        out.name += tokens[i];
    }
    out.pairings.clear();

    const size_t score_tokens = tokens.size() - name_tokens;
    if (score_tokens < 2) {
        return true;
    }
    if (score_tokens % 2 != 0) {
        return Fail(error, ErrorKind::kFormat, "Unpaired score/opponent field for " + out.name, path, line_no);
    }
    for (size_t i = name_tokens; i < tokens.size(); i += 2) {
        const auto score = util::ParseInt(tokens[i]);
        const auto opponent = util::ParseInt(tokens[i + 1]);
        if (!score || *score < 0) {
            return Fail(error, ErrorKind::kFormat, "Score field contained a non-digit: " + tokens[i], path,
                        line_no);
        }
        if (!opponent) {
            return Fail(error, ErrorKind::kFormat, "Opponent field contained a non-digit: " + tokens[i + 1],
                        path, line_no);
        }
        out.pairings.push_back(TouPairing{*score % kScorePrefixModulus, *opponent});
    }
    return true;
}

bool ResolveTouSection(const TouSection& section, const std::string& path, const ResultReadOptions& options,
                       model::TournamentRecord& record, model::Error* error) {
    model::Section resolved;
    resolved.name = section.name;
    std::unordered_set<std::string> names;
    for (const auto& player : section.players) {
        if (!names.insert(player.name).second) {
            return Fail(error, ErrorKind::kFormat,
                        "Player listed twice in section " + section.name + ": " + player.name, path,
                        player.line_no);
        }
        if (!util::ContainsIgnoreCase(options.bye_names, player.name)) {
            resolved.players.push_back(player.name);
        }
    }

    const int count = static_cast<int>(section.players.size());
    for (int seat = 1; seat <= count; ++seat) {
        const auto& player = section.players[static_cast<size_t>(seat - 1)];
        for (size_t round = 0; round < player.pairings.size(); ++round) {
            const auto& pairing = player.pairings[round];
            if (pairing.opponent < 1 || pairing.opponent > count) {
                return Fail(error, ErrorKind::kFormat,
                            "Invalid opponent id " + std::to_string(pairing.opponent) + " for player " +
                                player.name + " in section " + section.name,
                            path, player.line_no);
            }
            if (pairing.opponent == seat) {
                continue;
            }
            const auto& opponent = section.players[static_cast<size_t>(pairing.opponent - 1)];
            if (round >= opponent.pairings.size() || opponent.pairings[round].opponent != seat) {
                return Fail(error, ErrorKind::kFormat,
                            "Round " + std::to_string(round + 1) + " pairing of " + player.name + " with " +
                                opponent.name + " is not mirrored on the opponent's line",
                            path, player.line_no);
            }
            if (seat > pairing.opponent) {
                continue;
            }
            if (util::ContainsIgnoreCase(options.bye_names, player.name) ||
                util::ContainsIgnoreCase(options.bye_names, opponent.name)) {
                continue;
            }
            GameResult game;
            game.round = static_cast<int>(round) + 1;
            game.player_a = player.name;
            game.player_b = opponent.name;
            game.outcome = OutcomeFromScores(pairing.score, opponent.pairings[round].score);
            record.games.push_back(std::move(game));
        }
    }

    record.sections.push_back(std::move(resolved));
    return true;
}

// True when the name reads back unchanged from a .tou player line.
bool IsTouWritableName(const std::string& name) {
    const auto tokens = util::SplitTokens(name);
    if (tokens.empty() || name[0] == '*') {
        return false;
    }
    std::string rejoined;
    for (const auto& token : tokens) {
        if (!HasLetter(token)) {
            return false;
        }
        if (!rejoined.empty()) {
            rejoined += ' ';
        }
        rejoined += token;
    }
    return rejoined == name;
}

int TouScore(const GameResult& game, const std::string& name) {
    return static_cast<int>(game.PointsFor(name) * 2.0);
}

bool IsCsvBye(const ResultReadOptions& options, const std::string& name) {
    return util::ToLower(name) == "bye" || util::ContainsIgnoreCase(options.bye_names, name);
}

}  // namespace

bool ReadTouResults(std::istream& input,
                    const std::string& path,
                    const ResultReadOptions& options,
                    model::TournamentRecord& record,
                    model::Error* error) {
    std::string line;
    if (!std::getline(input, line)) {
        return Fail(error, ErrorKind::kFormat, "Empty results file", path, 1);
    }

    model::TournamentRecord parsed;
    if (!ParseTouHeader(line, path, parsed, error)) {
        return false;
    }

    std::vector<TouSection> sections;
    int line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (line.empty() || line[0] == ' ') {
            continue;
        }
        const std::string trimmed = util::Trim(line);
        if (trimmed == kEndOfFile) {
            break;
        }
        if (trimmed[0] == '*') {
            TouSection section;
            section.name = util::Trim(trimmed.substr(1));
            sections.push_back(std::move(section));
            continue;
        }
        if (trimmed.size() < 3) {
            continue;
        }

        TouPlayerLine player;
        if (!ParseTouPlayerLine(trimmed, line_no, path, player, error)) {
            return false;
        }
        if (player.pairings.empty()) {
            continue;
        }
        if (player.name.empty()) {
            return Fail(error, ErrorKind::kFormat, "Result line without a player name", path, line_no);
        }
        if (sections.empty()) {
            return Fail(error, ErrorKind::kFormat, "Result line before the first *section line", path, line_no);
        }
        sections.back().players.push_back(std::move(player));
    }
    if (input.bad()) {
        return Fail(error, ErrorKind::kFormat, "Read error", path, line_no);
    }

    for (const auto& section : sections) {
        if (!ResolveTouSection(section, path, options, parsed, error)) {
            return false;
        }
    }
    record = std::move(parsed);
    return true;
}

bool ReadCsvResults(std::istream& input,
                    const std::string& path,
                    const ResultReadOptions& options,
                    model::TournamentRecord& record,
                    model::Error* error) {
    if (options.tournament_name.empty()) {
        return Fail(error, ErrorKind::kConfig, "A tournament name is required for CSV results", path);
    }
    if (options.tournament_date.empty()) {
        return Fail(error, ErrorKind::kConfig, "A tournament date is required for CSV results", path);
    }

    model::TournamentRecord parsed;
    parsed.name = options.tournament_name;
    parsed.date = options.tournament_date;
    model::Section section;
    section.name = "Main";
    std::unordered_set<std::string> seen;
    const auto add_player = [&](const std::string& name) {
        if (seen.insert(name).second) {
            section.players.push_back(name);
        }
    };

    std::string line;
    int line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        if (line_no == 1 || util::Trim(line).empty()) {
            continue;
        }
        const auto row = util::SplitCsvLine(line);
        if (row.size() < 6) {
            return Fail(error, ErrorKind::kFormat,
                        "Expected 6 columns (Submitted On, Round, Winner, Score, Opponent, Score), got " +
                            std::to_string(row.size()),
                        path, line_no);
        }
        const auto round = util::ParseInt(row[1]);
        const auto winner_score = util::ParseInt(row[3]);
        const auto opponent_score = util::ParseInt(row[5]);
        if (!round || *round < 1) {
            return Fail(error, ErrorKind::kFormat, "Round is not a positive integer: '" + row[1] + "'", path,
                        line_no);
        }
        if (!winner_score || !opponent_score) {
            return Fail(error, ErrorKind::kFormat, "Score is not an integer", path, line_no);
        }
        const std::string& winner = row[2];
        const std::string& opponent = row[4];
        if (winner.empty() || opponent.empty()) {
            return Fail(error, ErrorKind::kFormat, "Missing player name", path, line_no);
        }
        if (IsCsvBye(options, winner) || IsCsvBye(options, opponent)) {
            if (!IsCsvBye(options, winner)) {
                add_player(winner);
            }
            if (!IsCsvBye(options, opponent)) {
                add_player(opponent);
            }
            continue;
        }

        add_player(winner);
        add_player(opponent);
        GameResult game;
        game.round = *round;
        game.player_a = winner;
        game.player_b = opponent;
        game.outcome = OutcomeFromScores(*winner_score, *opponent_score);
        parsed.games.push_back(std::move(game));
    }
    if (input.bad()) {
        return Fail(error, ErrorKind::kFormat, "Read error", path, line_no);
    }

    parsed.sections.push_back(std::move(section));
    record = std::move(parsed);
    return true;
}

bool RenderTouResults(const model::TournamentRecord& record, std::string& contents, model::Error* error) {
    const std::string& date = record.date;
    if (date.size() != 10 || date[4] != '-' || date[7] != '-' || !util::DayNumber(date)) {
        return Fail(error, ErrorKind::kFormat, "Tournament date must be yyyy-mm-dd to write .tou: '" + date + "'");
    }

    struct Seat {
        size_t section = 0;
        int number = 0;
    };
    std::unordered_map<std::string, Seat> seats;
    for (size_t s = 0; s < record.sections.size(); ++s) {
        const auto& players = record.sections[s].players;
        for (size_t i = 0; i < players.size(); ++i) {
            if (!IsTouWritableName(players[i])) {
                return Fail(error, ErrorKind::kFormat,
                            "Player name cannot be written to .tou (every word needs a letter): '" + players[i] +
                                "'");
            }
            if (!seats.emplace(players[i], Seat{s, static_cast<int>(i) + 1}).second) {
                return Fail(error, ErrorKind::kFormat, "Player listed in more than one section: " + players[i]);
            }
        }
    }

    std::vector<int> rounds(record.sections.size(), 0);
    for (const auto& game : record.games) {
        const auto a = seats.find(game.player_a);
        const auto b = seats.find(game.player_b);
        if (a == seats.end() || b == seats.end() || a->second.section != b->second.section) {
            return Fail(error, ErrorKind::kFormat,
                        "Round " + std::to_string(game.round) + " game " + game.player_a + " vs " + game.player_b +
                            " does not belong to a single section");
        }
        if (game.round < 1) {
            return Fail(error, ErrorKind::kFormat, "Round numbers start at 1: " + std::to_string(game.round));
        }
        rounds[a->second.section] = std::max(rounds[a->second.section], game.round);
    }

    // pairings[section][seat - 1][round - 1]; opponent 0 marks an empty slot.
    std::vector<std::vector<std::vector<TouPairing>>> pairings(record.sections.size());
    for (size_t s = 0; s < record.sections.size(); ++s) {
        pairings[s].assign(record.sections[s].players.size(),
                           std::vector<TouPairing>(static_cast<size_t>(rounds[s])));
    }
    for (const auto& game : record.games) {
        const Seat& a = seats.at(game.player_a);
        const Seat& b = seats.at(game.player_b);
        const auto slot = static_cast<size_t>(game.round - 1);
        auto& a_slot = pairings[a.section][static_cast<size_t>(a.number - 1)][slot];
        auto& b_slot = pairings[b.section][static_cast<size_t>(b.number - 1)][slot];
        if (a_slot.opponent != 0 || b_slot.opponent != 0) {
            return Fail(error, ErrorKind::kFormat,
                        "Round " + std::to_string(game.round) + " has two games for " +
                            (a_slot.opponent != 0 ? game.player_a : game.player_b));
        }
        a_slot = TouPairing{TouScore(game, game.player_a), b.number};
        b_slot = TouPairing{TouScore(game, game.player_b), a.number};
    }

    std::ostringstream out;
    out << "*M" << date.substr(8, 2) << '.' << date.substr(5, 2) << '.' << date.substr(0, 4);
    if (!record.name.empty()) {
        out << ' ' << record.name;
    }
    out << '\n';
    for (size_t s = 0; s < record.sections.size(); ++s) {
        const auto& section = record.sections[s];
        out << '*' << section.name << '\n';
        for (size_t seat = 0; seat < section.players.size(); ++seat) {
            out << section.players[seat];
            for (const auto& pairing : pairings[s][seat]) {
                if (pairing.opponent == 0) {
                    out << ' ' << 0 << ' ' << (seat + 1);
                } else {
                    out << ' ' << pairing.score << ' ' << pairing.opponent;
                }
            }
            out << '\n';
        }
    }
    out << kEndOfFile << '\n';
    contents = out.str();
    return true;
}

}  // namespace nrating::core::io
