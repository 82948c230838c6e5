#pragma once

#include "pairkit/core/tournament/DutchPairer.h"
#include "pairkit/core/tournament/TournamentScheduler.h"

#include <string>
#include <utility>
#include <vector>

namespace pairkit::core::tournament {

struct SwissPairing {
    // Indices into the ranked contenders, in board order, white first.
    std::vector<std::pair<int, int>> games;
    int bye_index = -1;
    DutchResult search;
    std::vector<Deviation> deviations;
};

// Pairs contenders given in ranking order: picks the pairing-allocated bye
// for an odd field, runs the Dutch search, orders boards and assigns colors.
// bye_eligible marks contenders that have not yet had an unplayed point.
bool PairContenders(const std::vector<Contender>& ranked,
                    const std::vector<bool>& bye_eligible,
                    const std::string& section,
                    const api::EngineConfig& config,
                    SwissPairing& out,
                    PairingError* error);

ColorState ColorStateOf(const history::PlayerHistory& history);

class SwissScheduler final : public IPairingScheduler {
public:
    bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) override;
};

}  // namespace pairkit::core::tournament
