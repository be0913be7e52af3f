#pragma once

#include "nrating/core/io/ResultFormats.h"
#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <functional>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace nrating::core::io {

using RatingListReader = std::function<bool(std::istream&, const std::string&, std::vector<model::Player>&,
                                            model::Error*)>;
using ResultReader = std::function<bool(std::istream&, const std::string&, const ResultReadOptions&,
                                        model::TournamentRecord&, model::Error*)>;

// Extension-keyed table of readers (".dat", ".csv", ".tou", ...).
class FormatRegistry {
public:
    static const FormatRegistry& Default();

    void RegisterRatingList(const std::string& extension, RatingListReader reader);
    void RegisterResults(const std::string& extension, ResultReader reader);

    const RatingListReader* FindRatingListReader(const std::string& path) const;
    const ResultReader* FindResultReader(const std::string& path) const;

    std::vector<std::string> rating_list_extensions() const;
    std::vector<std::string> result_extensions() const;

    bool LoadRatingList(const std::string& path, std::vector<model::Player>& roster, model::Error* error) const;
    bool LoadResults(const std::string& path,
                     const ResultReadOptions& options,
                     model::TournamentRecord& record,
                     model::Error* error) const;

private:
    std::map<std::string, RatingListReader> rating_lists_;
    std::map<std::string, ResultReader> results_;
};

}  // namespace nrating::core::io
