#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/stats/StandingsTable.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pairkit::core::stats {

struct TiebreakValue {
    api::TiebreakCriterion criterion = api::TiebreakCriterion::kBuchholz;
    // Empty when the criterion did not apply, e.g. direct encounter among
    // players who did not all meet.
    std::optional<double> value;
};

struct RankedStanding {
    int rank = 0;
    bool shared_rank = false;
    PlayerStats stats;
    std::vector<TiebreakValue> tiebreaks;

    const std::string& player_id() const { return stats.player_id; }
    double score() const { return stats.points(); }
};

// Ranks one section: score first, then each configured criterion in turn,
// applied only inside groups still tied on everything before it.
class TiebreakCalculator {
public:
    // added_scores, when given, raises opponents' scores for Buchholz-style sums.
    TiebreakCalculator(api::TiebreakConfig config,
                       const tournament::PlayerRegistry& registry,
                       const history::ScoreHistory& history,
                       const std::map<std::string, tournament::HalfPoints>* added_scores = nullptr);

    std::vector<RankedStanding> Rank(const std::vector<const tournament::Player*>& players) const;

    double Value(api::TiebreakCriterion criterion, const history::PlayerHistory& player) const;

    double Buchholz(const history::PlayerHistory& player) const;
    double ModifiedBuchholz(const history::PlayerHistory& player) const;
    double MedianBuchholz(const history::PlayerHistory& player) const;
    double SonnebornBerger(const history::PlayerHistory& player) const;
    double Cumulative(const history::PlayerHistory& player) const;
    double Koya(const history::PlayerHistory& player) const;
    double AverageOpponentRating(const history::PlayerHistory& player) const;
    double PerformanceRating(const history::PlayerHistory& player) const;

    // Points each player scored against the rest of the group; empty unless every pair met.
    static std::optional<std::vector<double>> DirectEncounter(const std::vector<const history::PlayerHistory*>& group);

private:
    // One Buchholz term per replayed round.
    std::vector<tournament::HalfPoints> Contributions(const history::PlayerHistory& player) const;
    tournament::HalfPoints OpponentScore(const std::string& opponent_id) const;
    int RatingOf(const std::string& player_id) const;

    api::TiebreakConfig config_;
    const tournament::PlayerRegistry& registry_;
    const history::ScoreHistory& history_;
    const std::map<std::string, tournament::HalfPoints>* added_scores_;
};

}  // namespace pairkit::core::stats
