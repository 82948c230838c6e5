#include "pairkit/core/tournament/QuadScheduler.h"

#include "pairkit/core/tournament/RoundRobinScheduler.h"

#include <algorithm>
#include <cstddef>

namespace pairkit::core::tournament {

std::vector<Quad> QuadScheduler::BuildQuads(const std::vector<const Player*>& seeded) {
    std::vector<Quad> quads;
    for (size_t start = 0; start < seeded.size(); start += kQuadSize) {
        Quad quad;
        quad.name = "Quad " + std::to_string(quads.size() + 1);
        const size_t end = std::min(seeded.size(), start + kQuadSize);
        quad.players.assign(seeded.begin() + static_cast<std::ptrdiff_t>(start),
                            seeded.begin() + static_cast<std::ptrdiff_t>(end));
        quads.push_back(std::move(quad));
    }
    return quads;
}

bool QuadScheduler::BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) {
    if (context.round_number > kQuadRounds) {
        return Fail(error,
                    ErrorKind::kValidation,
                    "Quad section '" + context.section + "' has no round " + std::to_string(context.round_number));
    }
    // Quads are cut once from the round-1 pairing numbers and never regrouped.
    const auto quads = BuildQuads(context.registry->Seated(context.section));

    std::vector<Pairing> byes;
    for (const auto& quad : quads) {
        const auto schedule = RoundRobinScheduler::BuildSchedule(static_cast<int>(quad.players.size()), false);
        RoundRobinScheduler::ExpandRound(RoundRobinScheduler::CycledRound(schedule, context.round_number),
                                         quad.players,
                                         context.round_number,
                                         quad.name,
                                         plan.pairings,
                                         byes);
    }
    plan.pairings.insert(plan.pairings.end(), byes.begin(), byes.end());
    NumberBoards(plan.pairings);
    return true;
}

}  // namespace pairkit::core::tournament
