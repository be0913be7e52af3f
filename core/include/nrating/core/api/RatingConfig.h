#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/rating/RatingSettings.h"

#include <string>
#include <vector>

namespace nrating::core::api {

struct OutputConfig {
    std::string report = "out/ratings-report.txt";
    std::string csv = "out/ratings.csv";
    // Updated rating list (.dat or .csv); empty disables it.
    std::string rating_list;
    // Same list restricted to players seen within `inactive_days` of the
    // tournament and not named in the `removed_players` file.
    std::string active_rating_list;
    int inactive_days = 731;
    std::string removed_players;
};

struct RatingConfig {
    rating::RatingSettings rating;
    OutputConfig output;
    std::vector<std::string> byes = {
        "Bye",     "Yy bye",  "A Bye",   "B Bye",    "ZZ Bye",    "Zz Bye", "Zy bye",
        "Bye One", "Bye Two", "Bye Three", "Bye Four", "Y Bye", "Z Bye",
    };

    bool Validate(model::Error* error) const;

    static bool LoadFromFile(const std::string& path, RatingConfig& config, model::Error* error);
    static bool LoadFromJsonString(const std::string& text, RatingConfig& config, model::Error* error);
    static bool SaveToFile(const std::string& path, const RatingConfig& config, model::Error* error);
    static std::string ToJsonString(const RatingConfig& config);
};

}  // namespace nrating::core::api
