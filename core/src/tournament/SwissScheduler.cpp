#include "pairkit/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace pairkit::core::tournament {

namespace {

const char* StageName(SearchStage stage) {
    switch (stage) {
        case SearchStage::kStrict:
            return "strict";
        case SearchStage::kColorsRelaxed:
            return "colors relaxed";
        case SearchStage::kRepeatsAllowed:
            return "repeat pairings allowed";
    }
    return "strict";
}

Deviation MakeDeviation(DeviationKind kind,
                        const std::string& section,
                        std::vector<std::string> player_ids,
                        std::string detail) {
    Deviation deviation;
    deviation.kind = kind;
    deviation.section = section;
    deviation.player_ids = std::move(player_ids);
    deviation.detail = std::move(detail);
    return deviation;
}

std::vector<Contender> Without(const std::vector<Contender>& ranked, int skip, std::vector<int>& index_map) {
    std::vector<Contender> rest;
    index_map.clear();
    rest.reserve(ranked.size());
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (static_cast<int>(i) == skip) {
            continue;
        }
        rest.push_back(ranked[i]);
        index_map.push_back(static_cast<int>(i));
    }
    return rest;
}

void CheckColorLimits(const Contender& contender,
                      Color color,
                      const ColorRules& rules,
                      const std::string& section,
                      std::vector<Deviation>& deviations) {
    const ColorState next = contender.colors.After(color);
    if (ViolatesEqualization(next, rules)) {
        std::ostringstream detail;
        detail << "color difference reaches " << next.difference();
        deviations.push_back(
            MakeDeviation(DeviationKind::kColorEqualization, section, {contender.id}, detail.str()));
    }
    if (ViolatesAlternation(next, rules)) {
        std::ostringstream detail;
        detail << next.streak << " consecutive " << ColorToString(color) << " games";
        deviations.push_back(
            MakeDeviation(DeviationKind::kColorAlternation, section, {contender.id}, detail.str()));
    }
}

}  // namespace

ColorState ColorStateOf(const history::PlayerHistory& history) {
    ColorState state;
    state.whites = history.whites;
    state.blacks = history.blacks;
    state.last = history.last_color;
    state.streak = history.color_streak;
    return state;
}

bool PairContenders(const std::vector<Contender>& ranked,
                    const std::vector<bool>& bye_eligible,
                    const std::string& section,
                    const api::EngineConfig& config,
                    SwissPairing& out,
                    PairingError* error) {
    out = SwissPairing();
    const ColorRules rules{config.colors.alternation_limit, config.colors.equalization_limit};
    const SearchBudget budget{config.search.iteration_budget, config.search.time_budget_ms};
    const DutchPairer pairer(rules, budget);
    SearchAllowance allowance(budget);

    std::vector<int> index_map(ranked.size());
    std::iota(index_map.begin(), index_map.end(), 0);

    if (ranked.size() % 2 == 1) {
        // Lowest-ranked eligible contenders first; the first whose removal
        // leaves a strictly pairable field takes the bye.
        std::vector<int> candidates;
        const size_t wanted = static_cast<size_t>(std::max(1, config.search.bye_candidates));
        for (int i = static_cast<int>(ranked.size()) - 1; i >= 0 && candidates.size() < wanted; --i) {
            if (bye_eligible[static_cast<size_t>(i)]) {
                candidates.push_back(i);
            }
        }
        const bool repeat_bye = candidates.empty();
        if (repeat_bye) {
            // Everyone had a bye: the fewest pairing-allocated byes go first.
            int fewest = ranked.front().byes_received;
            for (const auto& contender : ranked) {
                fewest = std::min(fewest, contender.byes_received);
            }
            for (int i = static_cast<int>(ranked.size()) - 1; i >= 0 && candidates.size() < wanted; --i) {
                if (ranked[static_cast<size_t>(i)].byes_received == fewest) {
                    candidates.push_back(i);
                }
            }
        }

        bool have_result = false;
        long long iterations = 0;
        for (const int candidate : candidates) {
            std::vector<int> candidate_map;
            const auto rest = Without(ranked, candidate, candidate_map);
            DutchResult result = pairer.Pair(rest, allowance);
            iterations += result.iterations;
            const bool better = !have_result || (!result.exhausted() && out.search.exhausted());
            if (better) {
                out.search = std::move(result);
                out.bye_index = candidate;
                index_map = std::move(candidate_map);
                have_result = true;
            }
            if (!out.search.exhausted()) {
                break;
            }
        }
        out.search.iterations = iterations;
        out.search.budget_exhausted = out.search.budget_exhausted || allowance.exhausted();
        if (repeat_bye) {
            out.deviations.push_back(MakeDeviation(DeviationKind::kRepeatBye,
                                                   section,
                                                   {ranked[static_cast<size_t>(out.bye_index)].id},
                                                   "every contender already received an unplayed point"));
        }
    } else {
        out.search = pairer.Pair(ranked, allowance);
    }

    std::vector<std::pair<int, int>> pairs;
    pairs.reserve(out.search.pairs.size());
    for (const auto& pair : out.search.pairs) {
        pairs.emplace_back(index_map[static_cast<size_t>(pair.higher)], index_map[static_cast<size_t>(pair.lower)]);
    }
    std::vector<int> leftover;
    for (const int index : out.search.unpaired) {
        leftover.push_back(index_map[static_cast<size_t>(index)]);
    }

    if (!leftover.empty()) {
        if (leftover.size() > 1 || out.bye_index >= 0) {
            std::ostringstream message;
            message << "Section '" << section << "' left " << leftover.size()
                    << " contender(s) unpaired after the bye was assigned";
            return Fail(error, ErrorKind::kDataIntegrity, message.str());
        }
        out.bye_index = leftover.front();
        if (!bye_eligible[static_cast<size_t>(out.bye_index)]) {
            out.deviations.push_back(MakeDeviation(DeviationKind::kRepeatBye,
                                                   section,
                                                   {ranked[static_cast<size_t>(out.bye_index)].id},
                                                   "carried over past every score group"));
        }
    }

    if (out.search.exhausted()) {
        std::ostringstream detail;
        detail << "no rule-conforming pairing within " << out.search.iterations << " iterations";
        if (out.search.budget_exhausted) {
            detail << " (budget exhausted)";
        }
        detail << "; fell back to " << StageName(out.search.stage);
        if (config.search.fail_on_exhausted) {
            return Fail(error, ErrorKind::kExhaustedSearch, "Section '" + section + "': " + detail.str());
        }
        out.deviations.push_back(MakeDeviation(DeviationKind::kSearchExhausted, section, {}, detail.str()));
    }

    // Boards: highest score in the pair first, then the best-ranked player.
    std::sort(pairs.begin(), pairs.end(), [&](const auto& a, const auto& b) {
        const HalfPoints a_score = std::max(ranked[static_cast<size_t>(a.first)].score,
                                            ranked[static_cast<size_t>(a.second)].score);
        const HalfPoints b_score = std::max(ranked[static_cast<size_t>(b.first)].score,
                                            ranked[static_cast<size_t>(b.second)].score);
        if (a_score != b_score) {
            return a_score > b_score;
        }
        return std::min(a.first, a.second) < std::min(b.first, b.second);
    });

    for (size_t board = 0; board < pairs.size(); ++board) {
        const int higher = std::min(pairs[board].first, pairs[board].second);
        const int lower = std::max(pairs[board].first, pairs[board].second);
        const auto& high = ranked[static_cast<size_t>(higher)];
        const auto& low = ranked[static_cast<size_t>(lower)];
        const Color board_default =
            board % 2 == 0 ? config.colors.initial_color : Opposite(config.colors.initial_color);
        const ColorAssignment colors = AssignColors(high.colors, low.colors, rules, board_default);
        const int white = colors.higher_gets_white ? higher : lower;
        const int black = colors.higher_gets_white ? lower : higher;
        out.games.emplace_back(white, black);

        if (DutchPairer::Met(high, low)) {
            out.deviations.push_back(
                MakeDeviation(DeviationKind::kRepeatPairing, section, {high.id, low.id}, "opponents met before"));
        }
        if (colors.absolute_conflict) {
            out.deviations.push_back(MakeDeviation(DeviationKind::kAbsoluteColorConflict,
                                                   section,
                                                   {high.id, low.id},
                                                   "both players are due the same color"));
            continue;
        }
        CheckColorLimits(ranked[static_cast<size_t>(white)], Color::kWhite, rules, section, out.deviations);
        CheckColorLimits(ranked[static_cast<size_t>(black)], Color::kBlack, rules, section, out.deviations);
    }
    return true;
}

bool SwissScheduler::BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) {
    const auto& config = *context.config;
    const auto& history = *context.history;
    const auto seeded = context.registry->Seeded(context.section, true);

    plan.has_acceleration = true;
    plan.acceleration = Acceleration::Evaluate(context.section, seeded, context.round_number, config);

    std::vector<const Player*> pool;
    std::vector<Pairing> requested;
    for (const Player* player : seeded) {
        if (player->RequestedByeIn(context.round_number)) {
            requested.push_back(MakeBye(player->id, ByeType::kHalfPoint));
        } else {
            pool.push_back(player);
        }
    }

    struct Ranked {
        const Player* player = nullptr;
        HalfPoints pairing_score = 0;
    };
    std::vector<Ranked> order;
    order.reserve(pool.size());
    for (const Player* player : pool) {
        const HalfPoints pairing_score = history.At(player->id).score + plan.acceleration.VirtualFor(player->id) +
                                         plan.acceleration.AddedFor(player->id);
        order.push_back({player, pairing_score});
    }
    std::stable_sort(order.begin(), order.end(), [](const Ranked& a, const Ranked& b) {
        if (a.pairing_score != b.pairing_score) {
            return a.pairing_score > b.pairing_score;
        }
        return PlayerRegistry::SeedBefore(*a.player, *b.player);
    });

    std::vector<Contender> ranked;
    std::vector<bool> bye_eligible;
    ranked.reserve(order.size());
    for (const auto& entry : order) {
        const auto& player_history = history.At(entry.player->id);
        Contender contender;
        contender.id = entry.player->id;
        contender.score = entry.pairing_score;
        contender.rating = entry.player->rating;
        contender.colors = ColorStateOf(player_history);
        contender.opponents = player_history.opponents;
        contender.byes_received = player_history.pairing_allocated_byes;
        ranked.push_back(std::move(contender));
        bye_eligible.push_back(!player_history.ReceivedUnplayedPoint());
    }

    SwissPairing swiss;
    if (!PairContenders(ranked, bye_eligible, context.section, config, swiss, error)) {
        return false;
    }

    for (const auto& game : swiss.games) {
        plan.pairings.push_back(MakeGame(ranked[static_cast<size_t>(game.first)].id,
                                         ranked[static_cast<size_t>(game.second)].id));
    }
    if (swiss.bye_index >= 0) {
        plan.pairings.push_back(MakeBye(ranked[static_cast<size_t>(swiss.bye_index)].id, ByeType::kPairingAllocated));
    }
    plan.pairings.insert(plan.pairings.end(), requested.begin(), requested.end());
    NumberBoards(plan.pairings);

    plan.deviations = std::move(swiss.deviations);
    plan.search_iterations = swiss.search.iterations;
    plan.search_exhausted = swiss.search.exhausted();
    return true;
}

}  // namespace pairkit::core::tournament
