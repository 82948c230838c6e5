#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/stats/SectionAggregator.h"
#include "pairkit/core/stats/TiebreakCalculator.h"
#include "pairkit/core/tournament/Acceleration.h"
#include "pairkit/core/tournament/PairingErrors.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairkit::core::api {

struct ResultEntry {
    std::string pairing_id;
    tournament::GameResult result = tournament::GameResult::kPending;
};

struct PairingOutcome {
    int round_number = 0;
    std::vector<tournament::Pairing> pairings;
    std::vector<tournament::Deviation> deviations;
    std::vector<tournament::AccelerationReport> acceleration;
    long long search_iterations = 0;
    // Some section needed a relaxed search; the deviations say how.
    bool exhausted = false;
};

struct CorrectionOutcome {
    // Set when a pending later round was paired again from the corrected history.
    bool repaired = false;
    PairingOutcome repairing;
};

// Entry point for callers. Every operation works on a caller-owned
// TournamentState and leaves it untouched on failure. Operations on the same
// tournament id are serialized; standings queries share the lock.
class PairingEngine {
public:
    using LogSink = std::function<void(const std::string&)>;

    PairingEngine() = default;

    bool GeneratePairings(tournament::TournamentState& state,
                          int round_number,
                          const EngineConfig& config,
                          PairingOutcome& outcome,
                          tournament::PairingError* error);

    // A round that already has all its results is refused unless correction is set.
    bool RecordResults(tournament::TournamentState& state,
                       int round_number,
                       const std::vector<ResultEntry>& results,
                       bool correction,
                       tournament::PairingError* error);

    bool ComputeStandings(const tournament::TournamentState& state,
                          const std::string& section,
                          const EngineConfig& config,
                          std::vector<stats::RankedStanding>& out,
                          tournament::PairingError* error);

    bool ComputeAllStandings(const tournament::TournamentState& state,
                             const EngineConfig& config,
                             std::map<std::string, std::vector<stats::RankedStanding>>& out,
                             tournament::PairingError* error);

    bool ComputeTeamStandings(const tournament::TournamentState& state,
                              const std::string& section,
                              const EngineConfig& config,
                              std::vector<stats::TeamStanding>& out,
                              tournament::PairingError* error);

    // Replays history with the new result and pairs a pending later round again.
    bool CorrectResult(tournament::TournamentState& state,
                       int round_number,
                       const std::string& pairing_id,
                       tournament::GameResult result,
                       const EngineConfig& config,
                       CorrectionOutcome& outcome,
                       tournament::PairingError* error);

    void setLogSink(LogSink sink);
    std::string getLastLogLines(int n) const;

    static std::string PairingIdFor(int round_number, const std::string& section, int board);

private:
    std::shared_ptr<std::shared_mutex> LockFor(const std::string& tournament_id);
    bool GenerateLocked(tournament::TournamentState& state,
                        int round_number,
                        const EngineConfig& config,
                        PairingOutcome& outcome,
                        tournament::PairingError* error);
    void AppendLogLine(const std::string& line);

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_{};
    size_t max_log_lines_ = 2000;
    LogSink sink_;
};

}  // namespace pairkit::core::api
