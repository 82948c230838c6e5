#include "pairkit/core/api/PairingEngine.h"

#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/tournament/EliminationScheduler.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/QuadScheduler.h"
#include "pairkit/core/tournament/RoundRobinScheduler.h"
#include "pairkit/core/tournament/SwissScheduler.h"
#include "pairkit/core/tournament/TeamSwissScheduler.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace pairkit::core::api {

using tournament::ErrorKind;
using tournament::Fail;
using tournament::PairingError;

namespace {

std::unique_ptr<tournament::IPairingScheduler> MakeScheduler(PairingMethod method) {
    switch (method) {
        case PairingMethod::kRoundRobin:
            return std::make_unique<tournament::RoundRobinScheduler>();
        case PairingMethod::kQuad:
            return std::make_unique<tournament::QuadScheduler>();
        case PairingMethod::kSingleElimination:
            return std::make_unique<tournament::EliminationScheduler>();
        case PairingMethod::kTeamSwiss:
            return std::make_unique<tournament::TeamSwissScheduler>();
        case PairingMethod::kFideDutch:
            break;
    }
    return std::make_unique<tournament::SwissScheduler>();
}

bool Prepare(const tournament::TournamentState& state,
             const EngineConfig& config,
             tournament::PlayerRegistry& registry,
             PairingError* error) {
    std::string message;
    if (!config.Validate(&message)) {
        return Fail(error, ErrorKind::kInvalidConfiguration, message);
    }
    if (!tournament::PlayerRegistry::Build(state, registry, &message)) {
        return Fail(error, ErrorKind::kDataIntegrity, message);
    }
    return true;
}

bool Replay(const tournament::TournamentState& state,
            const tournament::PlayerRegistry& registry,
            const EngineConfig& config,
            int through_round,
            history::ScoreHistory& history,
            PairingError* error) {
    std::string message;
    if (!history::ScoreHistory::Build(state,
                                      registry,
                                      history::ScoringRules::FromConfig(config.byes),
                                      through_round,
                                      history,
                                      &message)) {
        return Fail(error, ErrorKind::kDataIntegrity, message);
    }
    return true;
}

bool HasSection(const tournament::PlayerRegistry& registry, const std::string& section, PairingError* error) {
    const auto sections = registry.Sections();
    if (std::find(sections.begin(), sections.end(), section) == sections.end()) {
        return Fail(error, ErrorKind::kValidation, "Unknown section '" + section + "'");
    }
    return true;
}

bool HasResults(const tournament::Round& round) {
    return std::any_of(round.pairings.begin(), round.pairings.end(), [](const tournament::Pairing& pairing) {
        return !pairing.is_bye && pairing.result != tournament::GameResult::kPending;
    });
}

void RefreshStatus(tournament::Round& round) {
    round.status = round.AllResultsIn() ? tournament::RoundStatus::kComplete : tournament::RoundStatus::kPending;
}

}  // namespace

std::string PairingEngine::PairingIdFor(int round_number, const std::string& section, int board) {
    std::ostringstream out;
    out << "R" << round_number << "-";
    if (!section.empty()) {
        out << section << "-";
    }
    out << board;
    return out.str();
}

std::shared_ptr<std::shared_mutex> PairingEngine::LockFor(const std::string& tournament_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = locks_[tournament_id];
    if (!entry) {
        entry = std::make_shared<std::shared_mutex>();
    }
    return entry;
}

bool PairingEngine::GeneratePairings(tournament::TournamentState& state,
                                     int round_number,
                                     const EngineConfig& config,
                                     PairingOutcome& outcome,
                                     PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::unique_lock<std::shared_mutex> lock(*mutex);
    return GenerateLocked(state, round_number, config, outcome, error);
}

bool PairingEngine::GenerateLocked(tournament::TournamentState& state,
                                   int round_number,
                                   const EngineConfig& config,
                                   PairingOutcome& outcome,
                                   PairingError* error) {
    outcome = PairingOutcome();
    outcome.round_number = round_number;

    // Pairing numbers are handed out when round 1 is paired and kept from then on.
    tournament::TournamentState numbered;
    const tournament::TournamentState* source = &state;
    if (round_number == 1) {
        numbered = state;
        tournament::PlayerRegistry::AssignPairingNumbers(numbered.players);
        source = &numbered;
    }

    tournament::PlayerRegistry registry;
    if (!Prepare(*source, config, registry, error)) {
        AppendLogLine("[pairkit] Pairing refused: " + (error ? error->message : std::string()));
        return false;
    }
    if (round_number < 1) {
        return Fail(error, ErrorKind::kValidation, "Round numbers start at 1");
    }
    const bool swiss_length =
        config.method == PairingMethod::kFideDutch || config.method == PairingMethod::kTeamSwiss;
    if (swiss_length && round_number > config.rounds) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Round " + std::to_string(round_number) + " is past the configured " +
                        std::to_string(config.rounds) + " rounds");
    }

    const int existing = static_cast<int>(state.rounds.size());
    if (round_number > existing + 1) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Round " + std::to_string(round_number) + " cannot be paired before round " +
                        std::to_string(existing + 1));
    }
    if (round_number <= existing) {
        if (round_number != existing) {
            return Fail(error, ErrorKind::kValidation, "Only the latest round can be paired again");
        }
        if (HasResults(state.rounds.back())) {
            return Fail(error,
                        ErrorKind::kValidation,
                        "Round " + std::to_string(round_number) + " already has results");
        }
    }
    for (int number = 1; number < round_number; ++number) {
        if (state.rounds[static_cast<size_t>(number - 1)].status != tournament::RoundStatus::kComplete) {
            return Fail(error,
                        ErrorKind::kValidation,
                        "Round " + std::to_string(number) + " is not complete");
        }
    }

    history::ScoreHistory history;
    if (!Replay(*source, registry, config, round_number - 1, history, error)) {
        AppendLogLine("[pairkit] History replay failed: " + (error ? error->message : std::string()));
        return false;
    }

    const auto scheduler = MakeScheduler(config.method);
    tournament::Round next;
    next.number = round_number;
    for (const auto& section : registry.Sections()) {
        tournament::PairingContext context;
        context.round_number = round_number;
        context.section = section;
        context.state = source;
        context.registry = &registry;
        context.history = &history;
        context.config = &config;

        tournament::RoundPlan plan;
        if (!scheduler->BuildRound(context, plan, error)) {
            std::ostringstream line;
            line << "[pairkit] Round " << round_number << " section '" << section << "' not paired";
            if (error) {
                line << ": " << tournament::ErrorKindName(error->kind) << ": " << error->message;
            }
            AppendLogLine(line.str());
            return false;
        }
        if (plan.has_acceleration) {
            AppendLogLine("[pairkit] " + plan.acceleration.Describe());
            outcome.acceleration.push_back(std::move(plan.acceleration));
        }
        for (auto& deviation : plan.deviations) {
            AppendLogLine("[pairkit] Deviation: " + tournament::DescribeDeviation(deviation));
            outcome.deviations.push_back(std::move(deviation));
        }
        outcome.search_iterations += plan.search_iterations;
        outcome.exhausted = outcome.exhausted || plan.search_exhausted;
        for (auto& pairing : plan.pairings) {
            pairing.section = section;
            pairing.id = PairingIdFor(round_number, section, pairing.board);
            next.pairings.push_back(std::move(pairing));
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& pairing : next.pairings) {
        for (const auto* player_id : {&pairing.white_id, &pairing.black_id}) {
            if (player_id->empty()) {
                continue;
            }
            if (!seen.insert(*player_id).second) {
                return Fail(error,
                            ErrorKind::kDataIntegrity,
                            "Player " + *player_id + " was paired twice in round " + std::to_string(round_number));
            }
        }
    }

    outcome.pairings = next.pairings;
    if (source == &numbered) {
        state.players = std::move(numbered.players);
    }
    if (round_number <= existing) {
        state.rounds[static_cast<size_t>(round_number - 1)] = std::move(next);
    } else {
        state.rounds.push_back(std::move(next));
    }

    std::ostringstream summary;
    summary << "[pairkit] Round " << round_number << " paired: " << outcome.pairings.size() << " pairings, "
            << outcome.deviations.size() << " deviations";
    AppendLogLine(summary.str());
    return true;
}

bool PairingEngine::RecordResults(tournament::TournamentState& state,
                                  int round_number,
                                  const std::vector<ResultEntry>& results,
                                  bool correction,
                                  PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::unique_lock<std::shared_mutex> lock(*mutex);

    tournament::Round* round = state.FindRound(round_number);
    if (!round) {
        return Fail(error, ErrorKind::kValidation, "Round " + std::to_string(round_number) + " does not exist");
    }
    if (round->status == tournament::RoundStatus::kComplete && !correction) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Round " + std::to_string(round_number) + " is finalized; pass the correction flag to change it");
    }
    // A later round paired from the old results must be paired again, which needs the configuration.
    const int existing = static_cast<int>(state.rounds.size());
    if (correction && round_number < existing && !HasResults(state.rounds.back())) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Round " + std::to_string(existing) + " was paired from the results of round " +
                        std::to_string(round_number) + "; use CorrectResult to change them");
    }

    tournament::Round updated = *round;
    std::unordered_set<std::string> touched;
    for (const auto& entry : results) {
        if (!touched.insert(entry.pairing_id).second) {
            return Fail(error, ErrorKind::kValidation, "Pairing " + entry.pairing_id + " is listed twice");
        }
        tournament::Pairing* pairing = updated.FindPairing(entry.pairing_id);
        if (!pairing) {
            return Fail(error,
                        ErrorKind::kValidation,
                        "Pairing " + entry.pairing_id + " was not generated for round " + std::to_string(round_number));
        }
        if (pairing->is_bye) {
            return Fail(error, ErrorKind::kValidation, "Pairing " + entry.pairing_id + " is a bye");
        }
        if (entry.result == tournament::GameResult::kPending) {
            return Fail(error, ErrorKind::kValidation, "No result given for pairing " + entry.pairing_id);
        }
        pairing->result = entry.result;
    }
    RefreshStatus(updated);
    *round = std::move(updated);

    std::ostringstream line;
    line << "[pairkit] Round " << round_number << ": recorded " << results.size() << " result(s)"
         << (round->status == tournament::RoundStatus::kComplete ? ", round complete" : "");
    AppendLogLine(line.str());
    return true;
}

bool PairingEngine::ComputeStandings(const tournament::TournamentState& state,
                                     const std::string& section,
                                     const EngineConfig& config,
                                     std::vector<stats::RankedStanding>& out,
                                     PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::shared_lock<std::shared_mutex> lock(*mutex);

    tournament::PlayerRegistry registry;
    history::ScoreHistory history;
    if (!Prepare(state, config, registry, error) || !HasSection(registry, section, error) ||
        !Replay(state, registry, config, -1, history, error)) {
        return false;
    }
    const stats::SectionAggregator aggregator(config, state, registry, history);
    out = aggregator.SectionStandings(section);
    return true;
}

bool PairingEngine::ComputeAllStandings(const tournament::TournamentState& state,
                                        const EngineConfig& config,
                                        std::map<std::string, std::vector<stats::RankedStanding>>& out,
                                        PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::shared_lock<std::shared_mutex> lock(*mutex);

    tournament::PlayerRegistry registry;
    history::ScoreHistory history;
    if (!Prepare(state, config, registry, error) || !Replay(state, registry, config, -1, history, error)) {
        return false;
    }
    const stats::SectionAggregator aggregator(config, state, registry, history);
    out = aggregator.AllSections();
    return true;
}

bool PairingEngine::ComputeTeamStandings(const tournament::TournamentState& state,
                                         const std::string& section,
                                         const EngineConfig& config,
                                         std::vector<stats::TeamStanding>& out,
                                         PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::shared_lock<std::shared_mutex> lock(*mutex);

    tournament::PlayerRegistry registry;
    history::ScoreHistory history;
    if (!Prepare(state, config, registry, error) || !HasSection(registry, section, error) ||
        !Replay(state, registry, config, -1, history, error)) {
        return false;
    }
    const stats::SectionAggregator aggregator(config, state, registry, history);
    std::string message;
    if (!aggregator.TeamStandings(section, out, &message)) {
        return Fail(error, ErrorKind::kDataIntegrity, message);
    }
    return true;
}

bool PairingEngine::CorrectResult(tournament::TournamentState& state,
                                  int round_number,
                                  const std::string& pairing_id,
                                  tournament::GameResult result,
                                  const EngineConfig& config,
                                  CorrectionOutcome& outcome,
                                  PairingError* error) {
    const auto mutex = LockFor(state.id);
    std::unique_lock<std::shared_mutex> lock(*mutex);
    outcome = CorrectionOutcome();

    std::string message;
    if (!config.Validate(&message)) {
        return Fail(error, ErrorKind::kInvalidConfiguration, message);
    }
    if (result == tournament::GameResult::kPending) {
        return Fail(error, ErrorKind::kValidation, "A correction needs a result");
    }

    tournament::TournamentState working = state;
    tournament::Round* round = working.FindRound(round_number);
    if (!round) {
        return Fail(error, ErrorKind::kValidation, "Round " + std::to_string(round_number) + " does not exist");
    }
    tournament::Pairing* pairing = round->FindPairing(pairing_id);
    if (!pairing) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Pairing " + pairing_id + " was not generated for round " + std::to_string(round_number));
    }
    if (pairing->is_bye) {
        return Fail(error, ErrorKind::kValidation, "Pairing " + pairing_id + " is a bye");
    }
    const auto previous = pairing->result;
    pairing->result = result;
    RefreshStatus(*round);

    tournament::PlayerRegistry registry;
    history::ScoreHistory history;
    if (!Prepare(working, config, registry, error) || !Replay(working, registry, config, -1, history, error)) {
        return false;
    }

    const int last = static_cast<int>(working.rounds.size());
    if (last > round_number && !HasResults(working.rounds.back()) &&
        working.rounds[static_cast<size_t>(round_number - 1)].status == tournament::RoundStatus::kComplete) {
        if (!GenerateLocked(working, last, config, outcome.repairing, error)) {
            return false;
        }
        outcome.repaired = true;
    }

    state = std::move(working);
    std::ostringstream line;
    line << "[pairkit] Round " << round_number << " pairing " << pairing_id << " corrected from "
         << tournament::GameResultToString(previous) << " to " << tournament::GameResultToString(result);
    if (outcome.repaired) {
        line << "; round " << last << " paired again";
    }
    AppendLogLine(line.str());
    return true;
}

void PairingEngine::setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    sink_ = std::move(sink);
}

std::string PairingEngine::getLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

void PairingEngine::AppendLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
    if (sink_) {
        sink_(line);
    }
}

}  // namespace pairkit::core::api
