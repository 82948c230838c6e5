#pragma once

#include "pairkit/core/tournament/TournamentScheduler.h"

#include <string>
#include <vector>

namespace pairkit::core::tournament {

struct Quad {
    std::string name;
    std::vector<const Player*> players;
};

// Groups of four by rating, each playing its own round robin.
class QuadScheduler final : public IPairingScheduler {
public:
    static constexpr int kQuadSize = 4;
    static constexpr int kQuadRounds = 3;

    // The last quad holds the remainder when the section is not a multiple of four.
    static std::vector<Quad> BuildQuads(const std::vector<const Player*>& seeded);

    bool BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) override;
};

}  // namespace pairkit::core::tournament
