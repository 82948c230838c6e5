#include "pairkit/core/tournament/TeamSwissScheduler.h"

#include "pairkit/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <functional>

namespace pairkit::core::tournament {

namespace {

struct RankedTeam {
    const Team* team = nullptr;
    HalfPoints score = 0;
    int rating = 0;
};

void AddRequestedByes(const Team& team, const PlayerRegistry& registry, int round_number, const std::string& group,
                      std::vector<Pairing>& byes) {
    for (const auto& member_id : team.member_ids) {
        const Player* member = registry.Find(member_id);
        if (member && !member->withdrawn && member->RequestedByeIn(round_number)) {
            byes.push_back(MakeBye(member->id, ByeType::kHalfPoint, group));
        }
    }
}

}  // namespace

std::vector<const Player*> TeamSwissScheduler::Lineup(const Team& team,
                                                      const PlayerRegistry& registry,
                                                      int round_number,
                                                      int boards_per_match) {
    std::vector<const Player*> lineup;
    for (const auto& member_id : team.member_ids) {
        if (static_cast<int>(lineup.size()) >= boards_per_match) {
            break;
        }
        const Player* member = registry.Find(member_id);
        if (!member || member->withdrawn || member->RequestedByeIn(round_number)) {
            continue;
        }
        lineup.push_back(member);
    }
    return lineup;
}

int TeamSwissScheduler::TeamRating(const Team& team, const PlayerRegistry& registry, int boards_per_match) {
    std::vector<int> ratings;
    for (const auto& member_id : team.member_ids) {
        const Player* member = registry.Find(member_id);
        if (member) {
            ratings.push_back(member->rating);
        }
    }
    std::sort(ratings.begin(), ratings.end(), std::greater<int>());
    if (static_cast<int>(ratings.size()) > boards_per_match) {
        ratings.resize(static_cast<size_t>(boards_per_match));
    }
    if (ratings.empty()) {
        return 0;
    }
    long long total = 0;
    for (const int rating : ratings) {
        total += rating;
    }
    return static_cast<int>(total / static_cast<long long>(ratings.size()));
}

HalfPoints TeamSwissScheduler::PairingScore(const history::TeamHistory& history, const api::TeamConfig& config) {
    if (config.score_method == api::TeamScoreMethod::kMatchPoints) {
        return history.match_points;
    }
    return history.game_points;
}

bool TeamSwissScheduler::BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) {
    const auto& config = *context.config;
    history::TeamHistories teams;
    std::string history_error;
    if (!history::TeamHistories::Build(
            *context.state, *context.registry, *context.history, config.teams, teams, &history_error)) {
        return Fail(error, ErrorKind::kDataIntegrity, history_error);
    }

    std::vector<Pairing> byes;
    std::vector<RankedTeam> order;
    for (const Team* team : context.registry->TeamsIn(context.section)) {
        if (Lineup(*team, *context.registry, context.round_number, config.teams.boards_per_match).empty()) {
            AddRequestedByes(*team, *context.registry, context.round_number, team->id, byes);
            continue;
        }
        order.push_back({team,
                         PairingScore(teams.At(team->id), config.teams),
                         TeamRating(*team, *context.registry, config.teams.boards_per_match)});
    }
    std::stable_sort(order.begin(), order.end(), [](const RankedTeam& a, const RankedTeam& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.rating != b.rating) {
            return a.rating > b.rating;
        }
        return a.team->id < b.team->id;
    });

    std::vector<Contender> ranked;
    std::vector<bool> bye_eligible;
    for (const auto& entry : order) {
        const auto& history = teams.At(entry.team->id);
        Contender contender;
        contender.id = entry.team->id;
        contender.score = entry.score;
        contender.rating = entry.rating;
        contender.colors = history.colors;
        contender.opponents = history.opponents;
        contender.byes_received = history.byes;
        ranked.push_back(std::move(contender));
        bye_eligible.push_back(history.byes == 0);
    }

    SwissPairing swiss;
    if (!PairContenders(ranked, bye_eligible, context.section, config, swiss, error)) {
        return false;
    }

    for (const auto& game : swiss.games) {
        const Team& white_team = *order[static_cast<size_t>(game.first)].team;
        const Team& black_team = *order[static_cast<size_t>(game.second)].team;
        const std::string group = white_team.id + " - " + black_team.id;
        const auto white_lineup =
            Lineup(white_team, *context.registry, context.round_number, config.teams.boards_per_match);
        const auto black_lineup =
            Lineup(black_team, *context.registry, context.round_number, config.teams.boards_per_match);
        const size_t boards = std::max(white_lineup.size(), black_lineup.size());
        for (size_t board = 0; board < boards; ++board) {
            const Player* first = board < white_lineup.size() ? white_lineup[board] : nullptr;
            const Player* second = board < black_lineup.size() ? black_lineup[board] : nullptr;
            if (!first || !second) {
                // Nobody sits opposite: the present player wins the board by default.
                byes.push_back(MakeBye(first ? first->id : second->id, ByeType::kFullPoint, group));
                continue;
            }
            plan.pairings.push_back(board % 2 == 0 ? MakeGame(first->id, second->id, group)
                                                   : MakeGame(second->id, first->id, group));
        }
        AddRequestedByes(white_team, *context.registry, context.round_number, group, byes);
        AddRequestedByes(black_team, *context.registry, context.round_number, group, byes);
    }

    if (swiss.bye_index >= 0) {
        const Team& team = *order[static_cast<size_t>(swiss.bye_index)].team;
        const std::string group = team.id + " bye";
        for (const Player* member :
             Lineup(team, *context.registry, context.round_number, config.teams.boards_per_match)) {
            byes.push_back(MakeBye(member->id, ByeType::kPairingAllocated, group));
        }
        AddRequestedByes(team, *context.registry, context.round_number, group, byes);
    }

    plan.pairings.insert(plan.pairings.end(), byes.begin(), byes.end());
    NumberBoards(plan.pairings);
    plan.deviations = std::move(swiss.deviations);
    plan.search_iterations = swiss.search.iterations;
    plan.search_exhausted = swiss.search.exhausted();
    return true;
}

}  // namespace pairkit::core::tournament
