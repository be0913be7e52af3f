#include "nrating/core/io/RatingListFormats.h"

#include "nrating/core/util/Text.h"

#include <initializer_list>
#include <optional>
#include <utility>

namespace nrating::core::io {

using model::ErrorKind;
using model::Fail;

namespace {

constexpr size_t kDatNameColumn = 9;
constexpr size_t kDatNameWidth = 20;
constexpr size_t kDatGamesColumn = 29;
constexpr size_t kDatGamesWidth = 5;
constexpr size_t kDatRatingColumn = 34;
constexpr size_t kDatRatingWidth = 5;
constexpr size_t kDatDateColumn = 40;
constexpr size_t kDatDateWidth = 8;

std::string Field(const std::string& row, size_t column, size_t width) {
    if (column >= row.size()) {
        return {};
    }
    return util::Trim(std::string_view(row).substr(column, width));
}

int FindColumn(const std::vector<std::string>& header, std::initializer_list<const char*> names) {
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string column = util::ToLower(header[i]);
        for (const char* name : names) {
            if (column == name) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

std::string CsvCell(const std::vector<std::string>& row, int column) {
    if (column < 0 || column >= static_cast<int>(row.size())) {
        return {};
    }
    return row[static_cast<size_t>(column)];
}

}  // namespace

bool ReadDatRatingList(std::istream& input,
                       const std::string& path,
                       std::vector<model::Player>& roster,
                       model::Error* error) {
    std::vector<model::Player> players;
    std::string row;
    int line_no = 0;
    while (std::getline(input, row)) {
        ++line_no;
        if (line_no == 1 || util::Trim(row).empty()) {
            continue;
        }

        model::Player player;
        player.name = Field(row, kDatNameColumn, kDatNameWidth);
        if (player.name.empty()) {
            return Fail(error, ErrorKind::kFormat, "Missing player name", path, line_no);
        }

        const std::string games = Field(row, kDatGamesColumn, kDatGamesWidth);
        if (!games.empty()) {
            const auto parsed = util::ParseInt(games);
            if (!parsed) {
                return Fail(error, ErrorKind::kFormat, "Games field is not a number: '" + games + "'", path,
                            line_no);
            }
            player.lifetime_games = *parsed;
        }

        const std::string rating = Field(row, kDatRatingColumn, kDatRatingWidth);
        if (!rating.empty()) {
            const auto parsed = util::ParseInt(rating);
            if (!parsed) {
                return Fail(error, ErrorKind::kFormat, "Rating field is not a number: '" + rating + "'", path,
                            line_no);
            }
            player.prior_rating = *parsed;
        }

        player.last_played = Field(row, kDatDateColumn, kDatDateWidth);
        players.push_back(std::move(player));
    }

    if (input.bad()) {
        return Fail(error, ErrorKind::kFormat, "Read error", path, line_no);
    }
    roster = std::move(players);
    return true;
}

bool ReadCsvRatingList(std::istream& input,
                       const std::string& path,
                       std::vector<model::Player>& roster,
                       model::Error* error) {
    std::string line;
    if (!std::getline(input, line)) {
        return Fail(error, ErrorKind::kFormat, "Empty rating list", path, 1);
    }
    const auto header = util::SplitCsvLine(line);
    const int name_col = FindColumn(header, {"name"});
    const int rating_col = FindColumn(header, {"rating"});
    const int games_col = FindColumn(header, {"games played", "games"});
    const int date_col = FindColumn(header, {"last played", "lastplayed"});
    if (name_col < 0 || rating_col < 0) {
        return Fail(error, ErrorKind::kFormat, "Header must name Name and Rating columns", path, 1);
    }

    std::vector<model::Player> players;
    int line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (util::Trim(line).empty()) {
            continue;
        }
        const auto row = util::SplitCsvLine(line);

        model::Player player;
        player.name = CsvCell(row, name_col);
        if (player.name.empty()) {
            return Fail(error, ErrorKind::kFormat, "Missing player name", path, line_no);
        }

        const std::string rating = CsvCell(row, rating_col);
        if (!rating.empty()) {
            const auto parsed = util::ParseInt(rating);
            if (!parsed) {
                return Fail(error, ErrorKind::kFormat, "Rating is not an integer: '" + rating + "'", path,
                            line_no);
            }
            player.prior_rating = *parsed;
        }

        const std::string games = CsvCell(row, games_col);
        if (!games.empty()) {
            const auto parsed = util::ParseInt(games);
            if (!parsed) {
                return Fail(error, ErrorKind::kFormat, "Games played is not an integer: '" + games + "'", path,
                            line_no);
            }
            player.lifetime_games = *parsed;
        }

        player.last_played = CsvCell(row, date_col);
        players.push_back(std::move(player));
    }

    if (input.bad()) {
        return Fail(error, ErrorKind::kFormat, "Read error", path, line_no);
    }
    roster = std::move(players);
    return true;
}

bool ReadNameList(std::istream& input,
                  const std::string& path,
                  std::vector<std::string>& names,
                  model::Error* error) {
    std::vector<std::string> read;
    std::string line;
    int line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        std::string name = util::Trim(line);
        if (!name.empty()) {
            read.push_back(std::move(name));
        }
    }
    if (input.bad()) {
        return Fail(error, ErrorKind::kFormat, "Read error", path, line_no);
    }
    names = std::move(read);
    return true;
}

}  // namespace nrating::core::io
