#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace nrating::core::exporter {

struct RatingListEntry {
    std::string name;
    std::optional<int> rating;
    int lifetime_games = 0;
    std::string last_played;
};

// Per section: record, score, old/new rating, delta, performance and the
// round-by-round results, followed by the list of new entrants.
std::string RenderRatingReport(const model::TournamentRecord& record, const model::RatingChangeMap& changes);

// One row per tournament participant:
// name,old_rating,new_rating,delta,games,score,expected,performance,provisional
std::string RenderRatingsCsv(const model::TournamentRecord& record, const model::RatingChangeMap& changes);

// The prior list with this event applied, ranked by rating. Bye
// pseudo-players are left out.
std::vector<RatingListEntry> BuildUpdatedRatingList(const model::PlayerMap& players,
                                                    const model::RatingChangeMap& changes,
                                                    const model::TournamentRecord& record,
                                                    const std::vector<std::string>& bye_names);

// Keeps entries whose last-played date falls less than `inactive_days`
// before `tournament_date` and whose name is not in `removed`. Entries
// without a readable date are dropped. Fails when the tournament date is
// not a calendar date.
bool BuildActiveRatingList(const std::vector<RatingListEntry>& entries,
                           const std::string& tournament_date,
                           int inactive_days,
                           const std::vector<std::string>& removed,
                           std::vector<RatingListEntry>& active,
                           model::Error* error);

std::string RenderRatingListDat(const std::vector<RatingListEntry>& entries);
std::string RenderRatingListCsv(const std::vector<RatingListEntry>& entries);

// Picks the rendering by the extension of `path`.
bool RenderRatingList(const std::string& path,
                      const std::vector<RatingListEntry>& entries,
                      std::string& contents,
                      model::Error* error);

}  // namespace nrating::core::exporter
