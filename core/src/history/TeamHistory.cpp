#include "pairkit/core/history/TeamHistory.h"

#include <map>
#include <stdexcept>

namespace pairkit::core::history {

using tournament::Color;
using tournament::HalfPoints;

namespace {

struct MatchTally {
    std::string opponent_id;
    int first_board = 0;
    Color first_board_color = Color::kNone;
    HalfPoints game_points = 0;
    bool finished = true;
    // Set by pairing-allocated byes only, which mark a team bye.
    bool has_bye = false;
};

const std::string& TeamOf(const tournament::PlayerRegistry& registry, const std::string& player_id) {
    static const std::string kNoTeam;
    const auto* player = registry.Find(player_id);
    return player ? player->team_id : kNoTeam;
}

HalfPoints PointsIn(const ScoreHistory& players, const std::string& player_id, int round_number) {
    const auto* history = players.Find(player_id);
    if (!history || round_number < 1 || round_number > static_cast<int>(history->rounds.size())) {
        return 0;
    }
    return history->rounds[static_cast<size_t>(round_number - 1)].points;
}

}  // namespace

bool TeamHistories::Build(const tournament::TournamentState& state,
                          const tournament::PlayerRegistry& registry,
                          const ScoreHistory& players,
                          const api::TeamConfig& config,
                          TeamHistories& out,
                          std::string* error) {
    TeamHistories result;
    for (const auto& team : registry.teams()) {
        TeamHistory history;
        history.team_id = team.id;
        result.teams_.emplace(team.id, std::move(history));
    }

    const int last_round = players.rounds_replayed();
    for (int number = 1; number <= last_round; ++number) {
        const auto& round = state.rounds[static_cast<size_t>(number - 1)];
        std::map<std::string, MatchTally> tallies;
        for (const auto& pairing : round.pairings) {
            const std::string& white_team = TeamOf(registry, pairing.white_id);
            if (pairing.is_bye) {
                if (!white_team.empty()) {
                    auto& tally = tallies[white_team];
                    if (pairing.bye_type == tournament::ByeType::kPairingAllocated) {
                        tally.has_bye = true;
                    }
                    tally.game_points += PointsIn(players, pairing.white_id, number);
                }
                continue;
            }
            const std::string& black_team = TeamOf(registry, pairing.black_id);
            if (white_team.empty() || black_team.empty()) {
                continue;
            }
            if (white_team == black_team) {
                if (error) {
                    *error = "Pairing " + pairing.id + " pairs two members of team " + white_team;
                }
                return false;
            }
            for (const auto* side : {&white_team, &black_team}) {
                const bool is_white = side == &white_team;
                const std::string& opponent = is_white ? black_team : white_team;
                auto& tally = tallies[*side];
                if (!tally.opponent_id.empty() && tally.opponent_id != opponent) {
                    if (error) {
                        *error = "Team " + *side + " meets more than one team in round " + std::to_string(number);
                    }
                    return false;
                }
                tally.opponent_id = opponent;
                if (tally.first_board == 0 || pairing.board < tally.first_board) {
                    tally.first_board = pairing.board;
                    tally.first_board_color = is_white ? Color::kWhite : Color::kBlack;
                }
                const std::string& member = is_white ? pairing.white_id : pairing.black_id;
                tally.game_points += PointsIn(players, member, number);
                if (pairing.result == tournament::GameResult::kPending) {
                    tally.finished = false;
                }
            }
        }

        for (auto& item : result.teams_) {
            auto& history = item.second;
            TeamRoundEntry entry;
            entry.round = number;
            const auto it = tallies.find(item.first);
            if (it != tallies.end()) {
                const auto& tally = it->second;
                entry.opponent_id = tally.opponent_id;
                entry.color = tally.first_board_color;
                entry.game_points = tally.game_points;
                const auto rival = tallies.find(tally.opponent_id);
                if (rival != tallies.end()) {
                    entry.opponent_game_points = rival->second.game_points;
                }
                entry.bye = tally.opponent_id.empty() && tally.has_bye;
                entry.finished = tally.finished;
                if (entry.bye) {
                    entry.match_points = config.match_win_points;
                    history.byes += 1;
                } else if (!entry.opponent_id.empty() && entry.finished) {
                    if (entry.game_points > entry.opponent_game_points) {
                        entry.match_points = config.match_win_points;
                    } else if (entry.game_points == entry.opponent_game_points) {
                        entry.match_points = config.match_draw_points;
                    }
                }
            }
            history.match_points += entry.match_points;
            history.game_points += entry.game_points;
            if (!entry.opponent_id.empty()) {
                history.opponents.push_back(entry.opponent_id);
                history.colors = history.colors.After(entry.color);
            }
            history.rounds.push_back(std::move(entry));
        }
    }

    out = std::move(result);
    return true;
}

const TeamHistory* TeamHistories::Find(const std::string& team_id) const {
    const auto it = teams_.find(team_id);
    return it == teams_.end() ? nullptr : &it->second;
}

const TeamHistory& TeamHistories::At(const std::string& team_id) const {
    const auto it = teams_.find(team_id);
    if (it == teams_.end()) {
        throw std::out_of_range("No history for team " + team_id);
    }
    return it->second;
}

}  // namespace pairkit::core::history
