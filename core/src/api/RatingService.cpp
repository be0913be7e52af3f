#include "nrating/core/api/RatingService.h"

#include "nrating/core/export/ExportWriter.h"
#include "nrating/core/io/RatingListFormats.h"
#include "nrating/core/io/ResultFormats.h"
#include "nrating/core/model/Validator.h"
#include "nrating/core/rating/RatingEngine.h"
#include "nrating/core/util/AtomicFileWriter.h"
#include "nrating/core/util/Text.h"

#include <cctype>
#include <fstream>
#include <utility>

namespace nrating::core::api {

using model::ErrorKind;
using model::Fail;

bool IsIsoDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    const int month = std::stoi(value.substr(5, 2));
    const int day = std::stoi(value.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

RatingService::RatingService(RatingConfig config, LogCallback log)
    : config_(std::move(config)), log_(std::move(log)), formats_(io::FormatRegistry::Default()) {}

void RatingService::Log(const std::string& line) const {
    if (log_) {
        log_(line);
    }
}

bool RatingService::LoadTournament(const RatingRequest& request,
                                   model::TournamentRecord& record,
                                   model::Error* error) const {
    if (request.results_path.empty()) {
        return Fail(error, ErrorKind::kConfig, "No results file given");
    }
    if (!request.tournament_date.empty() && !IsIsoDate(request.tournament_date)) {
        return Fail(error, ErrorKind::kConfig,
                    "Tournament date must be yyyy-mm-dd: '" + request.tournament_date + "'");
    }

    io::ResultReadOptions options;
    options.tournament_name = request.tournament_name;
    options.tournament_date = request.tournament_date;
    options.bye_names = config_.byes;
    if (!formats_.LoadResults(request.results_path, options, record, error)) {
        return false;
    }
    if (!request.tournament_name.empty()) {
        record.name = request.tournament_name;
    }
    if (!request.tournament_date.empty()) {
        record.date = request.tournament_date;
    }
    if (record.name.empty()) {
        return Fail(error, ErrorKind::kConfig, "Tournament name is missing", request.results_path);
    }
    if (record.date.empty()) {
        return Fail(error, ErrorKind::kConfig, "Tournament date is missing", request.results_path);
    }
    return true;
}

bool RatingService::Compute(const RatingRequest& request, RatingRun& run, model::Error* error) const {
    if (!config_.Validate(error)) {
        return false;
    }
    if (request.ratings_path.empty()) {
        return Fail(error, ErrorKind::kConfig, "No rating list given");
    }

    std::vector<model::Player> roster;
    if (!formats_.LoadRatingList(request.ratings_path, roster, error)) {
        return false;
    }
    model::PlayerMap players;
    if (!model::BuildPlayerMap(roster, players, error)) {
        if (error) {
            error->path = request.ratings_path;
        }
        return false;
    }
    Log("[rating] Loaded " + std::to_string(players.size()) + " players from " + request.ratings_path);

    model::TournamentRecord record;
    if (!LoadTournament(request, record, error)) {
        return false;
    }
    Log("[rating] " + record.name + " (" + record.date + "): " + std::to_string(record.games.size()) +
        " games in " + std::to_string(record.sections.size()) + " section(s)");

    std::vector<std::string> entrants;
    const auto add_entrant = [&](const std::string& name) {
        if (players.count(name) > 0) {
            return;
        }
        model::Player player;
        player.name = name;
        players.emplace(name, std::move(player));
        entrants.push_back(name);
        Log("[rating] New entrant: " + name);
    };
    for (const auto& section : record.sections) {
        for (const auto& name : section.players) {
            add_entrant(name);
        }
    }
    for (const auto& game : record.games) {
        add_entrant(game.player_a);
        add_entrant(game.player_b);
    }

    const rating::RatingEngine engine(config_.rating);
    model::RatingChangeMap changes;
    if (!engine.ComputeNewRatings(players, record.games, changes, error)) {
        if (error && error->path.empty()) {
            error->path = request.results_path;
        }
        return false;
    }

    run.record = std::move(record);
    run.players = std::move(players);
    run.changes = std::move(changes);
    run.new_entrants = std::move(entrants);
    run.written_files.clear();
    return true;
}

bool RatingService::RenderActiveList(const RatingRun& run, std::string& contents, model::Error* error) const {
    std::vector<std::string> removed;
    const std::string& removed_path = config_.output.removed_players;
    if (!removed_path.empty()) {
        std::ifstream input(removed_path);
        if (!input) {
            return Fail(error, ErrorKind::kConfig, "Cannot open removed players file", removed_path);
        }
        if (!io::ReadNameList(input, removed_path, removed, error)) {
            return false;
        }
    }

    const auto entries = exporter::BuildUpdatedRatingList(run.players, run.changes, run.record, config_.byes);
    std::vector<exporter::RatingListEntry> active;
    if (!exporter::BuildActiveRatingList(entries, run.record.date, config_.output.inactive_days, removed, active,
                                         error)) {
        return false;
    }
    if (!exporter::RenderRatingList(config_.output.active_rating_list, active, contents, error)) {
        return false;
    }
    Log("[rating] Active list: " + std::to_string(active.size()) + " of " + std::to_string(entries.size()) +
        " players");
    return true;
}

bool RatingService::WriteOutputs(RatingRun& run, model::Error* error) const {
    std::vector<util::PendingFile> files;
    files.push_back({config_.output.report, exporter::RenderRatingReport(run.record, run.changes)});
    files.push_back({config_.output.csv, exporter::RenderRatingsCsv(run.record, run.changes)});
    if (!config_.output.rating_list.empty()) {
        const auto entries =
            exporter::BuildUpdatedRatingList(run.players, run.changes, run.record, config_.byes);
        std::string contents;
        if (!exporter::RenderRatingList(config_.output.rating_list, entries, contents, error)) {
            return false;
        }
        files.push_back({config_.output.rating_list, std::move(contents)});
    }
    if (!config_.output.active_rating_list.empty()) {
        std::string contents;
        if (!RenderActiveList(run, contents, error)) {
            return false;
        }
        files.push_back({config_.output.active_rating_list, std::move(contents)});
    }

    std::string write_error;
    if (!util::AtomicFileWriter::CommitAll(files, &write_error)) {
        return Fail(error, ErrorKind::kIo, write_error);
    }
    run.written_files.clear();
    for (const auto& file : files) {
        run.written_files.push_back(file.path);
        Log("[rating] Wrote " + file.path);
    }
    return true;
}

bool RatingService::Run(const RatingRequest& request, RatingRun& run, model::Error* error) const {
    return Compute(request, run, error) && WriteOutputs(run, error);
}

bool RatingService::ConvertResults(const RatingRequest& request,
                                   const std::string& tou_path,
                                   model::Error* error) const {
    if (!config_.Validate(error)) {
        return false;
    }
    if (util::FileExtension(tou_path) != ".tou") {
        return Fail(error, ErrorKind::kConfig, "Converted results must be written to a .tou file: " + tou_path);
    }
    model::TournamentRecord record;
    if (!LoadTournament(request, record, error)) {
        return false;
    }
    std::string contents;
    if (!io::RenderTouResults(record, contents, error)) {
        if (error && error->path.empty()) {
            error->path = request.results_path;
        }
        return false;
    }

    const std::vector<util::PendingFile> files = {{tou_path, std::move(contents)}};
    std::string write_error;
    if (!util::AtomicFileWriter::CommitAll(files, &write_error)) {
        return Fail(error, ErrorKind::kIo, write_error);
    }
    Log("[rating] Wrote " + tou_path + " (" + std::to_string(record.games.size()) + " games)");
    return true;
}

}  // namespace nrating::core::api
