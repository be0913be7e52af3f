#include "nrating/core/io/FormatRegistry.h"

#include "nrating/core/io/RatingListFormats.h"
#include "nrating/core/util/Text.h"

#include <fstream>
#include <utility>

namespace nrating::core::io {

using model::ErrorKind;
using model::Fail;

namespace {

std::string JoinExtensions(const std::vector<std::string>& extensions) {
    std::string joined;
    for (const auto& extension : extensions) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += extension;
    }
    return joined;
}

template <typename Map>
std::vector<std::string> KeysOf(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& entry : map) {
        keys.push_back(entry.first);
    }
    return keys;
}

FormatRegistry BuildDefault() {
    FormatRegistry registry;
    registry.RegisterRatingList(".dat", ReadDatRatingList);
    registry.RegisterRatingList(".csv", ReadCsvRatingList);
    registry.RegisterResults(".tou", ReadTouResults);
    registry.RegisterResults(".csv", ReadCsvResults);
    return registry;
}

}  // namespace

const FormatRegistry& FormatRegistry::Default() {
    static const FormatRegistry registry = BuildDefault();
    return registry;
}

void FormatRegistry::RegisterRatingList(const std::string& extension, RatingListReader reader) {
    rating_lists_[util::ToLower(extension)] = std::move(reader);
}

void FormatRegistry::RegisterResults(const std::string& extension, ResultReader reader) {
    results_[util::ToLower(extension)] = std::move(reader);
}

const RatingListReader* FormatRegistry::FindRatingListReader(const std::string& path) const {
    const auto it = rating_lists_.find(util::FileExtension(path));
    return it == rating_lists_.end() ? nullptr : &it->second;
}

const ResultReader* FormatRegistry::FindResultReader(const std::string& path) const {
    const auto it = results_.find(util::FileExtension(path));
    return it == results_.end() ? nullptr : &it->second;
}

std::vector<std::string> FormatRegistry::rating_list_extensions() const {
    return KeysOf(rating_lists_);
}

std::vector<std::string> FormatRegistry::result_extensions() const {
    return KeysOf(results_);
}

bool FormatRegistry::LoadRatingList(const std::string& path,
                                    std::vector<model::Player>& roster,
                                    model::Error* error) const {
    const auto* reader = FindRatingListReader(path);
    if (!reader) {
        return Fail(error, ErrorKind::kFormat,
                    "Unrecognized rating list extension (expected " + JoinExtensions(rating_list_extensions()) +
                        ")",
                    path);
    }
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::kFormat, "Failed to open rating list", path);
    }
    return (*reader)(input, path, roster, error);
}

bool FormatRegistry::LoadResults(const std::string& path,
                                 const ResultReadOptions& options,
                                 model::TournamentRecord& record,
                                 model::Error* error) const {
    const auto* reader = FindResultReader(path);
    if (!reader) {
        return Fail(error, ErrorKind::kFormat,
                    "Unrecognized results extension (expected " + JoinExtensions(result_extensions()) + ")",
                    path);
    }
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::kFormat, "Failed to open results file", path);
    }
    return (*reader)(input, path, options, record, error);
}

}  // namespace nrating::core::io
