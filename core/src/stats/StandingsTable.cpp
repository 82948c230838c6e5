#include "pairkit/core/stats/StandingsTable.h"

namespace pairkit::core::stats {

using history::EntryKind;

StandingsTable::StandingsTable(const std::vector<const tournament::Player*>& players) {
    standings_.reserve(players.size());
    for (const auto* player : players) {
        PlayerStats stats;
        stats.player_id = player->id;
        stats.name = player->name;
        stats.rating = player->rating;
        standings_.push_back(std::move(stats));
    }
}

StandingsTable StandingsTable::FromHistory(const std::vector<const tournament::Player*>& players,
                                           const history::ScoreHistory& history) {
    StandingsTable table(players);
    for (const auto* player : players) {
        const auto* player_history = history.Find(player->id);
        if (!player_history) {
            continue;
        }
        for (const auto& entry : player_history->rounds) {
            table.Record(player->id, entry);
        }
    }
    return table;
}

void StandingsTable::Record(const std::string& player_id, const history::RoundEntry& entry) {
    PlayerStats* stats = nullptr;
    for (auto& candidate : standings_) {
        if (candidate.player_id == player_id) {
            stats = &candidate;
            break;
        }
    }
    if (!stats) {
        return;
    }

    stats->score += entry.points;
    switch (entry.kind) {
        case EntryKind::kPlayed:
            stats->games += 1;
            games_played_ += 1;
            if (entry.color == tournament::Color::kBlack) {
                stats->blacks += 1;
            }
            if (entry.points == 0) {
                stats->losses += 1;
            } else if (entry.points == 1) {
                stats->draws += 1;
            } else {
                stats->wins += 1;
            }
            break;
        case EntryKind::kForfeitWin:
            stats->forfeit_wins += 1;
            break;
        case EntryKind::kForfeitLoss:
        case EntryKind::kDoubleForfeit:
            stats->forfeit_losses += 1;
            break;
        case EntryKind::kBye:
            stats->byes += 1;
            break;
        case EntryKind::kPending:
        case EntryKind::kAbsent:
            break;
    }
}

const PlayerStats* StandingsTable::Find(const std::string& player_id) const {
    for (const auto& stats : standings_) {
        if (stats.player_id == player_id) {
            return &stats;
        }
    }
    return nullptr;
}

}  // namespace pairkit::core::stats
