#include "pairkit/core/export/ExportWriter.h"

#include "pairkit/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <sstream>

namespace pairkit::core::exporter {

namespace {

std::string RankLabel(const stats::RankedStanding& row) {
    return std::to_string(row.rank) + (row.shared_rank ? "=" : "");
}

// Quotes a CSV field when it carries a separator or a quote.
std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const char ch : value) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

std::string FormatValue(const std::optional<double>& value) {
    if (!value) {
        return {};
    }
    std::ostringstream out;
    out << *value;
    return out.str();
}

std::string HtmlEscape(const std::string& value) {
    std::string escaped;
    for (const char ch : value) {
        switch (ch) {
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '&':
                escaped += "&amp;";
                break;
            default:
                escaped += ch;
        }
    }
    return escaped;
}

nlohmann::json StandingToJson(const stats::RankedStanding& row) {
    nlohmann::json node = {
        {"rank", row.rank},
        {"shared_rank", row.shared_rank},
        {"id", row.stats.player_id},
        {"name", row.stats.name},
        {"rating", row.stats.rating},
        {"pts", row.stats.points()},
        {"g", row.stats.games},
        {"w", row.stats.wins},
        {"d", row.stats.draws},
        {"l", row.stats.losses},
        {"byes", row.stats.byes},
    };
    node["tiebreaks"] = nlohmann::json::object();
    for (const auto& tiebreak : row.tiebreaks) {
        const char* name = api::TiebreakCriterionName(tiebreak.criterion);
        if (tiebreak.value) {
            node["tiebreaks"][name] = *tiebreak.value;
        } else {
            node["tiebreaks"][name] = nullptr;
        }
    }
    return node;
}

}  // namespace

std::string FormatStandingsCsv(const std::vector<stats::RankedStanding>& standings) {
    std::ostringstream output;
    output << "rank,id,name,rating,pts,g,w,d,l,byes";
    if (!standings.empty()) {
        for (const auto& tiebreak : standings.front().tiebreaks) {
            output << ',' << api::TiebreakCriterionName(tiebreak.criterion);
        }
    }
    output << "\n";
    for (const auto& row : standings) {
        output << RankLabel(row) << ',' << CsvField(row.stats.player_id) << ',' << CsvField(row.stats.name) << ','
               << row.stats.rating << ',' << row.stats.points() << ',' << row.stats.games << ',' << row.stats.wins
               << ',' << row.stats.draws << ',' << row.stats.losses << ',' << row.stats.byes;
        for (const auto& tiebreak : row.tiebreaks) {
            output << ',' << FormatValue(tiebreak.value);
        }
        output << "\n";
    }
    return output.str();
}

std::string FormatTeamStandingsCsv(const std::vector<stats::TeamStanding>& standings) {
    std::ostringstream output;
    output << "rank,id,name,mp,gp,top,m,w,d,l,byes\n";
    for (const auto& row : standings) {
        output << row.rank << (row.shared_rank ? "=" : "") << ',' << CsvField(row.team_id) << ','
               << CsvField(row.name) << ',' << row.match_points << ',' << tournament::ToPoints(row.game_points) << ','
               << tournament::ToPoints(row.top_scores) << ',' << row.matches << ',' << row.wins << ',' << row.draws
               << ',' << row.losses << ',' << row.byes << "\n";
    }
    return output.str();
}

std::string FormatPairingsCsv(const tournament::Round& round) {
    std::ostringstream output;
    output << "round,section,board,id,white,black,result,bye_type,group\n";
    for (const auto& pairing : round.pairings) {
        output << round.number << ',' << CsvField(pairing.section) << ',' << pairing.board << ','
               << CsvField(pairing.id) << ',' << CsvField(pairing.white_id) << ',' << CsvField(pairing.black_id)
               << ',' << (pairing.is_bye ? "" : tournament::GameResultToString(pairing.result)) << ','
               << (pairing.is_bye ? tournament::ByeTypeToString(pairing.bye_type) : "") << ','
               << CsvField(pairing.group) << "\n";
    }
    return output.str();
}

std::string FormatStandingsJson(const std::string& event_name,
                                const std::map<std::string, std::vector<stats::RankedStanding>>& sections) {
    nlohmann::json root;
    root["event"] = event_name;
    root["sections"] = nlohmann::json::object();
    for (const auto& section : sections) {
        auto rows = nlohmann::json::array();
        for (const auto& row : section.second) {
            rows.push_back(StandingToJson(row));
        }
        root["sections"][section.first] = std::move(rows);
    }
    return root.dump(2);
}

std::string FormatPairingOutcomeJson(const api::PairingOutcome& outcome) {
    nlohmann::json root;
    root["round"] = outcome.round_number;
    root["search_iterations"] = outcome.search_iterations;
    root["exhausted"] = outcome.exhausted;
    root["pairings"] = nlohmann::json::array();
    for (const auto& pairing : outcome.pairings) {
        nlohmann::json node = {
            {"id", pairing.id},
            {"section", pairing.section},
            {"board", pairing.board},
            {"white", pairing.white_id},
        };
        if (pairing.is_bye) {
            node["bye_type"] = tournament::ByeTypeToString(pairing.bye_type);
        } else {
            node["black"] = pairing.black_id;
        }
        root["pairings"].push_back(std::move(node));
    }
    root["deviations"] = nlohmann::json::array();
    for (const auto& deviation : outcome.deviations) {
        root["deviations"].push_back({
            {"kind", tournament::DeviationKindName(deviation.kind)},
            {"section", deviation.section},
            {"players", deviation.player_ids},
            {"detail", deviation.detail},
        });
    }
    root["acceleration"] = nlohmann::json::array();
    for (const auto& report : outcome.acceleration) {
        root["acceleration"].push_back({
            {"section", report.section},
            {"status", tournament::AccelerationStatusName(report.status)},
            {"type", api::AccelerationTypeName(report.type)},
            {"section_size", report.section_size},
            {"threshold", report.threshold},
            {"break_point", report.break_point},
        });
    }
    return root.dump(2);
}

bool WriteStandingsCsv(const std::string& path, const std::vector<stats::RankedStanding>& standings) {
    return util::AtomicFileWriter::Write(path, FormatStandingsCsv(standings));
}

bool WriteStandingsHtml(const std::string& path,
                        const std::string& event_name,
                        const std::string& section,
                        const std::vector<stats::RankedStanding>& standings) {
    std::ostringstream html;
    html << "<!doctype html>\n<html><head><meta charset=\"utf-8\">"
         << "<title>Standings</title>"
         << "<style>table{border-collapse:collapse;font-family:Arial,sans-serif}"
         << "th,td{border:1px solid #ccc;padding:4px 8px;text-align:left}</style>"
         << "</head><body>\n";
    html << "<h2>" << HtmlEscape(event_name) << "</h2>\n";
    if (!section.empty()) {
        html << "<h3>" << HtmlEscape(section) << "</h3>\n";
    }
    html << "<table>\n<thead><tr>"
         << "<th>Rank</th><th>Name</th><th>Rating</th><th>Pts</th><th>G</th><th>W</th><th>D</th><th>L</th>";
    if (!standings.empty()) {
        for (const auto& tiebreak : standings.front().tiebreaks) {
            html << "<th>" << api::TiebreakCriterionName(tiebreak.criterion) << "</th>";
        }
    }
    html << "</tr></thead>\n<tbody>\n";
    for (const auto& row : standings) {
        html << "<tr><td>" << RankLabel(row) << "</td><td>" << HtmlEscape(row.stats.name) << "</td><td>"
             << row.stats.rating << "</td><td>" << row.stats.points() << "</td><td>" << row.stats.games
             << "</td><td>" << row.stats.wins << "</td><td>" << row.stats.draws << "</td><td>" << row.stats.losses
             << "</td>";
        for (const auto& tiebreak : row.tiebreaks) {
            html << "<td>" << FormatValue(tiebreak.value) << "</td>";
        }
        html << "</tr>\n";
    }
    html << "</tbody></table>\n</body></html>\n";
    return util::AtomicFileWriter::Write(path, html.str());
}

bool WriteStandingsJson(const std::string& path,
                        const std::string& event_name,
                        const std::map<std::string, std::vector<stats::RankedStanding>>& sections) {
    return util::AtomicFileWriter::Write(path, FormatStandingsJson(event_name, sections));
}

bool WritePairingsCsv(const std::string& path, const tournament::Round& round) {
    return util::AtomicFileWriter::Write(path, FormatPairingsCsv(round));
}

}  // namespace pairkit::core::exporter
