#pragma once

#include "nrating/core/api/RatingConfig.h"
#include "nrating/core/io/FormatRegistry.h"
#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <functional>
#include <string>
#include <vector>

namespace nrating::core::api {

struct RatingRequest {
    std::string ratings_path;
    std::string results_path;
    // Override whatever the results file carries; required for formats
    // that carry neither.
    std::string tournament_name;
    std::string tournament_date;
};

struct RatingRun {
    model::TournamentRecord record;
    model::PlayerMap players;
    model::RatingChangeMap changes;
    std::vector<std::string> new_entrants;
    std::vector<std::string> written_files;
};

class RatingService {
public:
    using LogCallback = std::function<void(const std::string&)>;

    RatingService(RatingConfig config, LogCallback log);

    // Reads, validates and rates without touching the output files.
    bool Compute(const RatingRequest& request, RatingRun& run, model::Error* error) const;
    // Renders every configured output and commits them all or none.
    bool WriteOutputs(RatingRun& run, model::Error* error) const;
    bool Run(const RatingRequest& request, RatingRun& run, model::Error* error) const;
    // Reads request.results_path (any registered format) and writes it to
    // `tou_path` as .tou. The rating list is not needed.
    bool ConvertResults(const RatingRequest& request, const std::string& tou_path, model::Error* error) const;

private:
    void Log(const std::string& line) const;
    bool LoadTournament(const RatingRequest& request, model::TournamentRecord& record, model::Error* error) const;
    bool RenderActiveList(const RatingRun& run, std::string& contents, model::Error* error) const;

    RatingConfig config_;
    LogCallback log_;
    const io::FormatRegistry& formats_;
};

// True for yyyy-mm-dd with a plausible month and day.
bool IsIsoDate(const std::string& value);

}  // namespace nrating::core::api
