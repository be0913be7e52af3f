#include "nrating/core/api/RatingConfig.h"

#include "nrating/core/util/AtomicFileWriter.h"
#include "nrating/core/util/Text.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <utility>

namespace nrating::core::api {

using model::ErrorKind;
using model::Fail;

namespace {

nlohmann::json ToJson(const RatingConfig& config) {
    nlohmann::json root;
    root["rating"] = {
        {"default_rating", config.rating.default_rating},
        {"provisional_games", config.rating.provisional_games},
        {"k_standard", config.rating.k_standard},
        {"k_provisional", config.rating.k_provisional},
        {"rating_floor", config.rating.rating_floor},
        {"rounding", rating::RoundingRuleName(config.rating.rounding)},
        {"performance_cap", config.rating.performance_cap},
        {"worker_threads", config.rating.worker_threads},
    };
    root["output"] = {
        {"report", config.output.report},
        {"csv", config.output.csv},
        {"rating_list", config.output.rating_list},
        {"active_rating_list", config.output.active_rating_list},
        {"inactive_days", config.output.inactive_days},
        {"removed_players", config.output.removed_players},
    };
    root["byes"] = config.byes;
    return root;
}

bool ParseRoot(const nlohmann::json& root, RatingConfig& config, model::Error* error) {
    if (!root.is_object()) {
        return Fail(error, ErrorKind::kConfig, "Configuration root must be a JSON object");
    }

    if (root.contains("rating")) {
        const auto& node = root.at("rating");
        auto& settings = config.rating;
        settings.default_rating = node.value("default_rating", settings.default_rating);
        settings.provisional_games = node.value("provisional_games", settings.provisional_games);
        settings.k_standard = node.value("k_standard", settings.k_standard);
        settings.k_provisional = node.value("k_provisional", settings.k_provisional);
        settings.rating_floor = node.value("rating_floor", settings.rating_floor);
        settings.performance_cap = node.value("performance_cap", settings.performance_cap);
        settings.worker_threads = node.value("worker_threads", settings.worker_threads);
        if (node.contains("rounding")) {
            const auto rule = node.at("rounding").get<std::string>();
            if (!rating::ParseRoundingRule(rule, settings.rounding)) {
                return Fail(error, ErrorKind::kConfig,
                            "Unknown rounding rule '" + rule + "' (expected half_even or half_up)");
            }
        }
    }

    if (root.contains("output")) {
        const auto& output = root.at("output");
        config.output.report = output.value("report", config.output.report);
        config.output.csv = output.value("csv", config.output.csv);
        config.output.rating_list = output.value("rating_list", config.output.rating_list);
        config.output.active_rating_list = output.value("active_rating_list", config.output.active_rating_list);
        config.output.inactive_days = output.value("inactive_days", config.output.inactive_days);
        config.output.removed_players = output.value("removed_players", config.output.removed_players);
    }

    if (root.contains("byes")) {
        config.byes.clear();
        for (const auto& name : root.at("byes")) {
            config.byes.push_back(name.get<std::string>());
        }
    }

    return config.Validate(error);
}

}  // namespace

bool RatingConfig::Validate(model::Error* error) const {
    if (rating.k_standard <= 0.0 || rating.k_provisional <= 0.0) {
        return Fail(error, ErrorKind::kConfig, "K factors must be positive");
    }
    if (rating.provisional_games < 0) {
        return Fail(error, ErrorKind::kConfig, "provisional_games must not be negative");
    }
    if (rating.default_rating < 0) {
        return Fail(error, ErrorKind::kConfig, "default_rating must not be negative");
    }
    if (rating.rating_floor < 0) {
        return Fail(error, ErrorKind::kConfig, "rating_floor must not be negative");
    }
    if (rating.performance_cap <= 0.0) {
        return Fail(error, ErrorKind::kConfig, "performance_cap must be positive");
    }
    if (rating.worker_threads < 1) {
        return Fail(error, ErrorKind::kConfig, "worker_threads must be at least 1");
    }
    if (output.report.empty() || output.csv.empty()) {
        return Fail(error, ErrorKind::kConfig, "Report and CSV output paths must be set");
    }
    for (const auto* list : {&output.rating_list, &output.active_rating_list}) {
        if (list->empty()) {
            continue;
        }
        const std::string extension = util::FileExtension(*list);
        if (extension != ".dat" && extension != ".csv") {
            return Fail(error, ErrorKind::kConfig, "Rating list output must end in .dat or .csv: " + *list);
        }
    }
    if (output.inactive_days < 0) {
        return Fail(error, ErrorKind::kConfig, "inactive_days must not be negative");
    }

    std::set<std::string> seen;
    for (const auto* path : {&output.report, &output.csv, &output.rating_list, &output.active_rating_list}) {
        if (path->empty()) {
            continue;
        }
        const std::string normalized = std::filesystem::path(*path).lexically_normal().string();
        if (!seen.insert(normalized).second) {
            return Fail(error, ErrorKind::kConfig, "Output path is used for more than one output: " + *path);
        }
    }
    return true;
}

bool RatingConfig::LoadFromJsonString(const std::string& text, RatingConfig& config, model::Error* error) {
    RatingConfig loaded;
    try {
        const auto root = nlohmann::json::parse(text);
        if (!ParseRoot(root, loaded, error)) {
            return false;
        }
    } catch (const nlohmann::json::exception& ex) {
        return Fail(error, ErrorKind::kConfig, std::string("Failed to parse JSON: ") + ex.what());
    }
    config = std::move(loaded);
    return true;
}

bool RatingConfig::LoadFromFile(const std::string& path, RatingConfig& config, model::Error* error) {
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::kConfig, "Failed to open config", path);
    }
    std::ostringstream text;
    text << input.rdbuf();
    if (!LoadFromJsonString(text.str(), config, error)) {
        if (error) {
            error->path = path;
        }
        return false;
    }
    return true;
}

bool RatingConfig::SaveToFile(const std::string& path, const RatingConfig& config, model::Error* error) {
    std::string write_error;
    if (!util::AtomicFileWriter::CommitAll({{path, ToJson(config).dump(2)}}, &write_error)) {
        return Fail(error, ErrorKind::kIo, write_error, path);
    }
    return true;
}

std::string RatingConfig::ToJsonString(const RatingConfig& config) {
    return ToJson(config).dump(2);
}

}  // namespace nrating::core::api
