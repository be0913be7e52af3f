#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <istream>
#include <string>
#include <vector>

namespace nrating::core::io {

struct ResultReadOptions {
    // Required by formats that do not carry them; ignored by .tou.
    std::string tournament_name;
    std::string tournament_date;
    // Pseudo-players that stand for a bye. Matched case-insensitively.
    std::vector<std::string> bye_names;
};

// AUPAIR .tou: "*Mdd.mm.yyyy Name" header, "*X" section lines, one line
// per player with <score> <opponent#> pairs, "*** END OF FILE ***".
bool ReadTouResults(std::istream& input,
                    const std::string& path,
                    const ResultReadOptions& options,
                    model::TournamentRecord& record,
                    model::Error* error);

// Header row, then: Submitted On, Round, Winner, Score, Opponent, Score.
bool ReadCsvResults(std::istream& input,
                    const std::string& path,
                    const ResultReadOptions& options,
                    model::TournamentRecord& record,
                    model::Error* error);

// Writes `record` as .tou. Wins score 2, draws 1, losses 0; a round
// without a game is written as a bye against the player's own seat.
// Fails when the date is not yyyy-mm-dd, a player has two games in one
// round, a game crosses sections, or a name would not read back.
bool RenderTouResults(const model::TournamentRecord& record, std::string& contents, model::Error* error);

}  // namespace nrating::core::io
