#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/tournament/ColorAllocator.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace pairkit::core::history {

struct TeamRoundEntry {
    int round = 0;
    std::string opponent_id;
    // Color of the team's first board.
    tournament::Color color = tournament::Color::kNone;
    tournament::HalfPoints game_points = 0;
    tournament::HalfPoints opponent_game_points = 0;
    int match_points = 0;
    bool bye = false;
    bool finished = false;
};

struct TeamHistory {
    std::string team_id;
    int match_points = 0;
    tournament::HalfPoints game_points = 0;
    int byes = 0;
    std::vector<TeamRoundEntry> rounds;
    std::vector<std::string> opponents;
    tournament::ColorState colors;
};

// Team matches are recovered from the individual pairings: every game
// between members of two teams belongs to that pair's match.
class TeamHistories {
public:
    static bool Build(const tournament::TournamentState& state,
                      const tournament::PlayerRegistry& registry,
                      const ScoreHistory& players,
                      const api::TeamConfig& config,
                      TeamHistories& out,
                      std::string* error);

    const TeamHistory* Find(const std::string& team_id) const;
    const TeamHistory& At(const std::string& team_id) const;
    const std::unordered_map<std::string, TeamHistory>& teams() const { return teams_; }

private:
    std::unordered_map<std::string, TeamHistory> teams_;
};

}  // namespace pairkit::core::history
