#pragma once

#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace pairkit::core::api {

enum class PairingMethod {
    kFideDutch,
    kRoundRobin,
    kQuad,
    kSingleElimination,
    kTeamSwiss,
};

enum class PairingType {
    kStandard,
    kAccelerated,
};

enum class AccelerationType {
    kStandard,
    kSixths,
    kAddedScore,
    kAllRounds,
};

enum class TiebreakCriterion {
    kBuchholz,
    kModifiedBuchholz,
    kMedianBuchholz,
    kSonnebornBerger,
    kCumulative,
    kKoya,
    kDirectEncounter,
    kAverageOpponentRating,
    kPerformanceRating,
    kGamesWon,
    kGamesWithBlack,
};

// How an unplayed round (bye, forfeit, absence) enters Buchholz-style sums.
enum class UnplayedRoundPolicy {
    kZero,
    kOwnScore,
    kAssumedScore,
};

enum class TeamScoreMethod {
    kMatchPoints,
    kGamePoints,
    kTopScores,
};

struct AccelerationConfig {
    AccelerationType type = AccelerationType::kStandard;
    int rounds = 2;
    // 0 selects 2^(tournament rounds + 1).
    int threshold = 0;
    // 0 selects half the section, rounded up to an even number.
    int break_point = 0;
    std::vector<double> added_scores{1.0, 0.0};
    bool added_score_in_tiebreaks = false;
};

struct ByeConfig {
    double pairing_allocated = 1.0;
    double half_point = 0.5;
    double full_point = 1.0;
    double zero_point = 0.0;
    double forfeit_win = 1.0;
};

struct ColorConfig {
    int alternation_limit = 2;
    int equalization_limit = 2;
    tournament::Color initial_color = tournament::Color::kWhite;
};

struct SearchConfig {
    long long iteration_budget = 200000;
    int time_budget_ms = 2000;
    int bye_candidates = 4;
    bool fail_on_exhausted = false;
};

struct TiebreakConfig {
    std::vector<TiebreakCriterion> criteria{TiebreakCriterion::kModifiedBuchholz,
                                            TiebreakCriterion::kBuchholz,
                                            TiebreakCriterion::kSonnebornBerger,
                                            TiebreakCriterion::kCumulative};
    int modified_cut_lowest = 1;
    int median_cut = 1;
    UnplayedRoundPolicy unplayed_policy = UnplayedRoundPolicy::kOwnScore;
    double assumed_score = 0.0;
    bool cumulative_discount_unplayed = false;
    int performance_cap = 800;
};

struct TeamConfig {
    TeamScoreMethod score_method = TeamScoreMethod::kMatchPoints;
    int boards_per_match = 4;
    int match_win_points = 2;
    int match_draw_points = 1;
    int top_scores = 4;
};

struct EngineConfig {
    PairingMethod method = PairingMethod::kFideDutch;
    PairingType type = PairingType::kStandard;
    int rounds = 5;
    bool double_round_robin = false;
    AccelerationConfig acceleration;
    ByeConfig byes;
    ColorConfig colors;
    SearchConfig search;
    TiebreakConfig tiebreaks;
    TeamConfig teams;

    bool accelerated() const { return type == PairingType::kAccelerated; }

    // Rejects configurations that no pairing or standings call could honour.
    bool Validate(std::string* error) const;

    static bool LoadFromFile(const std::string& path, EngineConfig& config, std::string* error);
    static bool LoadFromJson(const std::string& payload, EngineConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const EngineConfig& config, std::string* error);
    static std::string ToJsonString(const EngineConfig& config);
};

const char* PairingMethodName(PairingMethod method);
bool ParsePairingMethod(const std::string& text, PairingMethod& out);
const char* AccelerationTypeName(AccelerationType type);
bool ParseAccelerationType(const std::string& text, AccelerationType& out);
const char* TiebreakCriterionName(TiebreakCriterion criterion);
bool ParseTiebreakCriterion(const std::string& text, TiebreakCriterion& out);

}  // namespace pairkit::core::api
