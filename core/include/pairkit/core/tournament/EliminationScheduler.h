#pragma once

#include "pairkit/core/tournament/TournamentScheduler.h"

#include <string>
#include <vector>

namespace pairkit::core::tournament {

class EliminationScheduler final : public IPairingScheduler {
public:
    // Seed numbers (1-based) in bracket order, e.g. 1,8,4,5,2,7,3,6 for eight slots.
    static std::vector<int> BracketOrder(int slots);

    // Players still in the bracket before round_number, in bracket order.
    // Empty strings mark slots nobody advanced from.
    static bool Survivors(const PairingContext& context,
                          int round_number,
                          std::vector<std::string>& survivors,
                          PairingError* error);

    bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) override;
};

}  // namespace pairkit::core::tournament
