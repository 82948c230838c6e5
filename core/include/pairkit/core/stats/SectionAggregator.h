#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/history/TeamHistory.h"
#include "pairkit/core/stats/TiebreakCalculator.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <map>
#include <string>
#include <vector>

namespace pairkit::core::stats {

struct TeamStanding {
    int rank = 0;
    bool shared_rank = false;
    std::string team_id;
    std::string name;
    int matches = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;
    int match_points = 0;
    tournament::HalfPoints game_points = 0;
    // Sum of the best member scores, as many as TeamConfig::top_scores.
    tournament::HalfPoints top_scores = 0;
};

class SectionAggregator {
public:
    SectionAggregator(const api::EngineConfig& config,
                      const tournament::TournamentState& state,
                      const tournament::PlayerRegistry& registry,
                      const history::ScoreHistory& history);

    std::vector<RankedStanding> SectionStandings(const std::string& section) const;

    // Every section, each ranked on its own worker.
    std::map<std::string, std::vector<RankedStanding>> AllSections() const;

    bool TeamStandings(const std::string& section, std::vector<TeamStanding>& out, std::string* error) const;

    // Added scores that enter tiebreaks, empty unless configured.
    std::map<std::string, tournament::HalfPoints> TiebreakAddedScores(const std::string& section) const;

private:
    const api::EngineConfig& config_;
    const tournament::TournamentState& state_;
    const tournament::PlayerRegistry& registry_;
    const history::ScoreHistory& history_;
};

}  // namespace pairkit::core::stats
