#pragma once

#include "pairkit/core/tournament/TournamentScheduler.h"

#include <string>
#include <vector>

namespace pairkit::core::tournament {

// Indices refer to the seeded player list the schedule was built for.
struct ScheduledGame {
    int white = -1;
    int black = -1;
};

struct ScheduledRound {
    std::vector<ScheduledGame> games;
    int bye = -1;
};

class RoundRobinScheduler final : public IPairingScheduler {
public:
    // Circle method; the second cycle of a double round robin reverses colors.
    static std::vector<ScheduledRound> BuildSchedule(int player_count, bool double_round_robin);

    // Round past the end of the schedule starts it again with colors reversed.
    static ScheduledRound CycledRound(const std::vector<ScheduledRound>& schedule, int round_number);

    // Turns a scheduled round into pairings. Withdrawn players are left out
    // and their opponents get a pairing-allocated bye; players who asked for
    // a bye get a half-point bye.
    static void ExpandRound(const ScheduledRound& round,
                            const std::vector<const Player*>& players,
                            int round_number,
                            const std::string& group,
                            std::vector<Pairing>& games,
                            std::vector<Pairing>& byes);

    bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) override;
};

}  // namespace pairkit::core::tournament
