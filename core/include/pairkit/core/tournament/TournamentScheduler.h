#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/tournament/Acceleration.h"
#include "pairkit/core/tournament/PairingErrors.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace pairkit::core::tournament {

// Everything a scheduler may read to pair one section for one round.
// history covers rounds 1..round_number-1 only.
struct PairingContext {
    int round_number = 0;
    std::string section;
    const TournamentState* state = nullptr;
    const PlayerRegistry* registry = nullptr;
    const history::ScoreHistory* history = nullptr;
    const api::EngineConfig* config = nullptr;
};

// Pairings come back in board order with boards numbered from 1; ids are
// assigned by the caller.
struct RoundPlan {
    std::vector<Pairing> pairings;
    std::vector<Deviation> deviations;
    bool has_acceleration = false;
    AccelerationReport acceleration;
    long long search_iterations = 0;
    bool search_exhausted = false;
};

class IPairingScheduler {
public:
    virtual ~IPairingScheduler() = default;
    virtual bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) = 0;
};

Pairing MakeGame(const std::string& white_id, const std::string& black_id, const std::string& group = {});
Pairing MakeBye(const std::string& player_id, ByeType type, const std::string& group = {});
void NumberBoards(std::vector<Pairing>& pairings, int first_board = 1);

}  // namespace pairkit::core::tournament
