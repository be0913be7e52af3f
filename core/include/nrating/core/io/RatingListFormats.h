#pragma once

#include "nrating/core/model/Error.h"
#include "nrating/core/model/RatingTypes.h"

#include <istream>
#include <string>
#include <vector>

namespace nrating::core::io {

// Fixed-width list: heading line, then
//   cols 0-8 nick, 9-28 name, 29-33 games, 34-38 rating, 40-47 yyyymmdd.
// A blank rating field marks an unrated player.
bool ReadDatRatingList(std::istream& input,
                       const std::string& path,
                       std::vector<model::Player>& roster,
                       model::Error* error);

// Header row with Name, Rating, Games played (or Games) and optional
// Last played columns, in any order.
bool ReadCsvRatingList(std::istream& input,
                       const std::string& path,
                       std::vector<model::Player>& roster,
                       model::Error* error);

// One name per line; surrounding blanks are trimmed and empty lines skipped.
bool ReadNameList(std::istream& input,
                  const std::string& path,
                  std::vector<std::string>& names,
                  model::Error* error);

}  // namespace nrating::core::io
