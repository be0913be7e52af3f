#include "nrating/core/api/RatingConfig.h"
#include "nrating/core/api/RatingService.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

using nrating::core::api::RatingConfig;
using nrating::core::api::RatingRequest;
using nrating::core::api::RatingRun;
using nrating::core::api::RatingService;

constexpr const char* kReportFileName = "ratings-report.txt";
constexpr const char* kCsvFileName = "ratings.csv";

void PrintUsage() {
    std::cerr << "Usage: nratingcli --ratings <list.dat|list.csv> --results <event.tou|event.csv>" << '\n'
              << "                  [--name <tournament>] [--date <yyyy-mm-dd>] [--config <config.json>]" << '\n'
              << "                  [--out-dir <dir>] [--rating-list <file.dat|file.csv>]" << '\n'
              << "                  [--print-config] [--save-config <config.json>]" << '\n'
              << "       nratingcli --results <event.csv> --to-tou <event.tou> [--name <tournament>] [--date <yyyy-mm-dd>]"
              << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    RatingRequest request;
    std::string config_path;
    std::string out_dir;
    std::string rating_list;
    std::string save_config_path;
    std::string tou_path;
    bool print_config = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next_value = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "[nratingcli] " << arg << " requires a value." << '\n';
                return false;
            }
            target = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--ratings") {
            ok = next_value(request.ratings_path);
        } else if (arg == "--results") {
            ok = next_value(request.results_path);
        } else if (arg == "--name") {
            ok = next_value(request.tournament_name);
        } else if (arg == "--date") {
            ok = next_value(request.tournament_date);
        } else if (arg == "--config") {
            ok = next_value(config_path);
        } else if (arg == "--out-dir") {
            ok = next_value(out_dir);
        } else if (arg == "--rating-list") {
            ok = next_value(rating_list);
        } else if (arg == "--save-config") {
            ok = next_value(save_config_path);
        } else if (arg == "--to-tou") {
            ok = next_value(tou_path);
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "[nratingcli] Unknown argument: " << arg << '\n';
            ok = false;
        }
        if (!ok) {
            PrintUsage();
            return 1;
        }
    }

    RatingConfig config;
    nrating::core::model::Error error;
    if (!config_path.empty()) {
        std::cout << "[nratingcli] Rating config: " << config_path << '\n';
        if (!RatingConfig::LoadFromFile(config_path, config, &error)) {
            std::cerr << "[nratingcli] " << error.ToString() << '\n';
            return 1;
        }
    }
    if (!out_dir.empty()) {
        const std::filesystem::path dir(out_dir);
        config.output.report = (dir / kReportFileName).string();
        config.output.csv = (dir / kCsvFileName).string();
    }
    if (!rating_list.empty()) {
        config.output.rating_list = rating_list;
    }
    if (!config.Validate(&error)) {
        std::cerr << "[nratingcli] " << error.ToString() << '\n';
        return 1;
    }

    if (print_config) {
        std::cout << RatingConfig::ToJsonString(config) << '\n';
    }
    if (!save_config_path.empty()) {
        if (!RatingConfig::SaveToFile(save_config_path, config, &error)) {
            std::cerr << "[nratingcli] " << error.ToString() << '\n';
            return 1;
        }
        std::cout << "[nratingcli] Saved config to " << save_config_path << '\n';
    }
    if (request.ratings_path.empty() && request.results_path.empty() && (print_config || !save_config_path.empty())) {
        return 0;
    }

    RatingService service(config, [](const std::string& line) { std::cout << line << '\n'; });
    if (!tou_path.empty()) {
        if (!service.ConvertResults(request, tou_path, &error)) {
            std::cerr << "[nratingcli] " << error.ToString() << '\n';
            return 1;
        }
        if (request.ratings_path.empty()) {
            return 0;
        }
    }
    RatingRun run;
    if (!service.Run(request, run, &error)) {
        std::cerr << "[nratingcli] " << error.ToString() << '\n';
        std::cerr << "[nratingcli] No output files were written." << '\n';
        return 1;
    }

    int rated = 0;
    for (const auto& entry : run.changes) {
        rated += entry.second.games_played > 0 ? 1 : 0;
    }
    std::cout << "[nratingcli] Rated " << rated << " players (" << run.new_entrants.size()
              << " new entrants) for " << run.record.name << '\n';
    return 0;
}
