#include "nrating/core/export/ExportWriter.h"

#include "nrating/core/stats/StandingsTable.h"
#include "nrating/core/util/Text.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace nrating::core::exporter {

namespace {

constexpr int kNameWidth = 22;

stats::StandingsTable BuildSectionTable(const model::Section& section, const model::TournamentRecord& record) {
    stats::StandingsTable table(section.players);
    table.RecordGames(record.games);
    return table;
}

std::string FormatPoints(double points) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << points;
    return out.str();
}

std::string FormatRecord(const stats::PlayerStats& stats) {
    const double half = 0.5 * static_cast<double>(stats.draws);
    return FormatPoints(static_cast<double>(stats.wins) + half) + "-" +
           FormatPoints(static_cast<double>(stats.losses) + half);
}

std::string FormatDelta(const model::RatingChange& change) {
    if (!change.old_rating) {
        return "new";
    }
    const int delta = change.delta();
    return (delta > 0 ? "+" : "") + std::to_string(delta);
}

char ResultLetter(double points) {
    if (points >= 1.0) {
        return 'W';
    }
    if (points > 0.0) {
        return 'D';
    }
    return 'L';
}

std::string FormatRounds(const stats::PlayerStats& stats, const model::Section& section) {
    std::ostringstream out;
    bool first = true;
    for (const auto& entry : stats.rounds) {
        const auto seat = std::find(section.players.begin(), section.players.end(), entry.opponent);
        if (!first) {
            out << ' ';
        }
        first = false;
        out << ResultLetter(entry.points);
        if (seat != section.players.end()) {
            out << (seat - section.players.begin() + 1);
        } else {
            out << '?';
        }
    }
    return out.str();
}

std::string DatDate(const std::string& date) {
    std::string compact;
    for (const char c : date) {
        if (c != '-') {
            compact.push_back(c);
        }
    }
    return compact;
}

// Participants in section order, each section in standings order.
std::vector<std::string> RankedParticipants(const model::TournamentRecord& record) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& section : record.sections) {
        const auto table = BuildSectionTable(section, record);
        for (const auto& row : table.Ranked()) {
            if (seen.insert(row.name).second) {
                names.push_back(row.name);
            }
        }
    }
    return names;
}

}  // namespace

std::string RenderRatingReport(const model::TournamentRecord& record, const model::RatingChangeMap& changes) {
    std::ostringstream report;
    report << record.name << '\n' << record.date << '\n';

    std::vector<const model::RatingChange*> entrants;
    for (const auto& section : record.sections) {
        report << '\n' << "Section " << section.name << '\n';
        report << std::left << std::setw(kNameWidth) << "NAME"
               << std::setw(10) << "RECORD"
               << std::right << std::setw(6) << "SCORE"
               << std::setw(9) << "OLD RAT"
               << std::setw(9) << "NEW RAT"
               << std::setw(7) << "DELTA"
               << std::setw(7) << "PERF"
               << "  ROUNDS" << '\n';

        const auto table = BuildSectionTable(section, record);
        for (const auto& row : table.Ranked()) {
            const auto it = changes.find(row.name);
            if (it == changes.end()) {
                continue;
            }
            const auto& change = it->second;
            report << std::left << std::setw(kNameWidth) << row.name
                   << std::setw(10) << FormatRecord(row)
                   << std::right << std::setw(6) << FormatPoints(row.points)
                   << std::setw(9) << (change.old_rating ? std::to_string(*change.old_rating) : "-")
                   << std::setw(9) << change.new_rating
                   << std::setw(7) << FormatDelta(change)
                   << std::setw(7) << std::lround(change.performance_rating)
                   << "  " << FormatRounds(row, section) << '\n';
            if (!change.old_rating &&
                std::find(entrants.begin(), entrants.end(), &change) == entrants.end()) {
                entrants.push_back(&change);
            }
        }
    }

    if (!entrants.empty()) {
        report << '\n' << "New entrants" << '\n';
        for (const auto* change : entrants) {
            report << std::left << std::setw(kNameWidth) << change->name
                   << "rated at performance " << change->new_rating
                   << " over " << change->games_played << " games" << '\n';
        }
    }
    return report.str();
}

std::string RenderRatingsCsv(const model::TournamentRecord& record, const model::RatingChangeMap& changes) {
    std::ostringstream output;
    output << "name,old_rating,new_rating,delta,games,score,expected,performance,provisional\n";
    for (const auto& name : RankedParticipants(record)) {
        const auto it = changes.find(name);
        if (it == changes.end()) {
            continue;
        }
        const auto& change = it->second;
        output << util::CsvField(change.name) << ','
               << (change.old_rating ? std::to_string(*change.old_rating) : "") << ','
               << change.new_rating << ','
               << (change.old_rating ? std::to_string(change.delta()) : "") << ','
               << change.games_played << ','
               << FormatPoints(change.actual_score) << ','
               << std::fixed << std::setprecision(3) << change.expected_score << ','
               << std::lround(change.performance_rating) << ','
               << (change.provisional ? "yes" : "no")
               << "\n";
    }
    return output.str();
}

std::vector<RatingListEntry> BuildUpdatedRatingList(const model::PlayerMap& players,
                                                    const model::RatingChangeMap& changes,
                                                    const model::TournamentRecord& record,
                                                    const std::vector<std::string>& bye_names) {
    std::vector<RatingListEntry> entries;
    entries.reserve(players.size());
    for (const auto& [name, player] : players) {
        if (util::ContainsIgnoreCase(bye_names, name)) {
            continue;
        }
        RatingListEntry entry;
        entry.name = name;
        entry.rating = player.prior_rating;
        entry.lifetime_games = player.lifetime_games;
        entry.last_played = player.last_played;
        const auto it = changes.find(name);
        if (it != changes.end() && it->second.games_played > 0) {
            entry.rating = it->second.new_rating;
            entry.lifetime_games = it->second.lifetime_games;
            entry.last_played = record.date;
        }
        entries.push_back(std::move(entry));
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.rating.has_value() != b.rating.has_value()) {
            return a.rating.has_value();
        }
        if (a.rating != b.rating) {
            return *a.rating > *b.rating;
        }
        return a.name < b.name;
    });
    return entries;
}

bool BuildActiveRatingList(const std::vector<RatingListEntry>& entries,
                           const std::string& tournament_date,
                           int inactive_days,
                           const std::vector<std::string>& removed,
                           std::vector<RatingListEntry>& active,
                           model::Error* error) {
    const auto today = util::DayNumber(tournament_date);
    if (!today) {
        return model::Fail(error, model::ErrorKind::kFormat,
                           "Tournament date '" + tournament_date +
                               "' is not a calendar date; cannot select active players");
    }
    const std::unordered_set<std::string> removed_names(removed.begin(), removed.end());
    std::vector<RatingListEntry> kept;
    for (const auto& entry : entries) {
        if (removed_names.count(entry.name) > 0) {
            continue;
        }
        const auto last = util::DayNumber(entry.last_played);
        if (!last || *today - *last >= inactive_days) {
            continue;
        }
        kept.push_back(entry);
    }
    active = std::move(kept);
    return true;
}

std::string RenderRatingListDat(const std::vector<RatingListEntry>& entries) {
    std::ostringstream output;
    output << std::left << std::setw(9) << "NICK" << std::setw(20) << "Name"
           << std::setw(5) << "Games" << std::setw(5) << " Rat" << ' ' << "Lastplayed" << '\n';
    for (const auto& entry : entries) {
        output << std::left << std::setw(9) << "" << std::setw(20) << entry.name
               << std::right << std::setw(5) << entry.lifetime_games
               << std::setw(5) << (entry.rating ? std::to_string(*entry.rating) : "")
               << ' ' << std::left << DatDate(entry.last_played) << '\n';
    }
    return output.str();
}

std::string RenderRatingListCsv(const std::vector<RatingListEntry>& entries) {
    std::ostringstream output;
    output << "Name,Rating,Games played,Last played\n";
    for (const auto& entry : entries) {
        output << util::CsvField(entry.name) << ','
               << (entry.rating ? std::to_string(*entry.rating) : "") << ','
               << entry.lifetime_games << ','
               << util::CsvField(entry.last_played) << "\n";
    }
    return output.str();
}

bool RenderRatingList(const std::string& path,
                      const std::vector<RatingListEntry>& entries,
                      std::string& contents,
                      model::Error* error) {
    const std::string extension = util::FileExtension(path);
    if (extension == ".dat") {
        contents = RenderRatingListDat(entries);
        return true;
    }
    if (extension == ".csv") {
        contents = RenderRatingListCsv(entries);
        return true;
    }
    return model::Fail(error, model::ErrorKind::kFormat, "Unrecognized rating list extension (expected .csv, .dat)",
                       path);
}

}  // namespace nrating::core::exporter
