#pragma once

#include "pairkit/core/history/ScoreHistory.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace pairkit::core::stats {

struct PlayerStats {
    std::string player_id;
    std::string name;
    int rating = 0;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int forfeit_wins = 0;
    int forfeit_losses = 0;
    int byes = 0;
    int blacks = 0;
    tournament::HalfPoints score = 0;

    double points() const { return tournament::ToPoints(score); }
    double score_percent() const {
        if (games == 0) {
            return 0.0;
        }
        return (points() / static_cast<double>(games)) * 100.0;
    }
};

class StandingsTable {
public:
    explicit StandingsTable(const std::vector<const tournament::Player*>& players);

    static StandingsTable FromHistory(const std::vector<const tournament::Player*>& players,
                                      const history::ScoreHistory& history);

    void Record(const std::string& player_id, const history::RoundEntry& entry);

    const std::vector<PlayerStats>& standings() const { return standings_; }
    const PlayerStats* Find(const std::string& player_id) const;
    // Played games, each counted once.
    int games_played() const { return games_played_ / 2; }

private:
    std::vector<PlayerStats> standings_;
    int games_played_ = 0;
};

}  // namespace pairkit::core::stats
