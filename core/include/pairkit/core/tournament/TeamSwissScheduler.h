#pragma once

#include "pairkit/core/history/TeamHistory.h"
#include "pairkit/core/tournament/TournamentScheduler.h"

#include <string>
#include <vector>

namespace pairkit::core::tournament {

// Pairs teams with the Dutch search, then fills boards in lineup order.
// The team holding white on board 1 has white on every odd board.
class TeamSwissScheduler final : public IPairingScheduler {
public:
    // Members available in round_number, in board order, capped at boards_per_match.
    static std::vector<const Player*> Lineup(const Team& team,
                                             const PlayerRegistry& registry,
                                             int round_number,
                                             int boards_per_match);

    // Average rating of the top boards; orders teams with equal scores.
    static int TeamRating(const Team& team, const PlayerRegistry& registry, int boards_per_match);

    static HalfPoints PairingScore(const history::TeamHistory& history, const api::TeamConfig& config);

    bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) override;
};

}  // namespace pairkit::core::tournament
