#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nrating::core::util {

std::string Trim(std::string_view value);
std::string ToLower(std::string_view value);
std::vector<std::string> SplitTokens(const std::string& value);

// Lower-cased extension including the dot, e.g. ".tou". Empty when none.
std::string FileExtension(const std::string& path);

// Strict base-10 integer; leading/trailing blanks are allowed, nothing else.
std::optional<int> ParseInt(std::string_view value);

// RFC 4180 style: commas inside double quotes, "" for a literal quote.
std::vector<std::string> SplitCsvLine(const std::string& line);
std::string CsvField(const std::string& value);

// Days since 1970-01-01 for "yyyymmdd" or "yyyy-mm-dd"; empty for anything
// else or for an impossible calendar date.
std::optional<long> DayNumber(const std::string& date);

bool ContainsIgnoreCase(const std::vector<std::string>& names, const std::string& name);

}  // namespace nrating::core::util
