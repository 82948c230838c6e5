#pragma once

#include "pairkit/core/api/PairingEngine.h"
#include "pairkit/core/stats/SectionAggregator.h"
#include "pairkit/core/stats/TiebreakCalculator.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <map>
#include <string>
#include <vector>

namespace pairkit::core::exporter {

std::string FormatStandingsCsv(const std::vector<stats::RankedStanding>& standings);
std::string FormatTeamStandingsCsv(const std::vector<stats::TeamStanding>& standings);
std::string FormatPairingsCsv(const tournament::Round& round);
std::string FormatStandingsJson(const std::string& event_name,
                                const std::map<std::string, std::vector<stats::RankedStanding>>& sections);
std::string FormatPairingOutcomeJson(const api::PairingOutcome& outcome);

bool WriteStandingsCsv(const std::string& path, const std::vector<stats::RankedStanding>& standings);
bool WriteStandingsHtml(const std::string& path,
                        const std::string& event_name,
                        const std::string& section,
                        const std::vector<stats::RankedStanding>& standings);
bool WriteStandingsJson(const std::string& path,
                        const std::string& event_name,
                        const std::map<std::string, std::vector<stats::RankedStanding>>& sections);
bool WritePairingsCsv(const std::string& path, const tournament::Round& round);

}  // namespace pairkit::core::exporter
