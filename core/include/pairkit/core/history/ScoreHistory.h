#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/tournament/PlayerRegistry.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace pairkit::core::history {

enum class EntryKind {
    kPlayed,
    kPending,
    kForfeitWin,
    kForfeitLoss,
    kDoubleForfeit,
    kBye,
    kAbsent,
};

struct RoundEntry {
    int round = 0;
    EntryKind kind = EntryKind::kAbsent;
    std::string opponent_id;
    tournament::Color color = tournament::Color::kNone;
    tournament::HalfPoints points = 0;
    tournament::ByeType bye_type = tournament::ByeType::kNone;

    bool played() const { return kind == EntryKind::kPlayed; }
    bool paired() const { return !opponent_id.empty(); }
    bool unplayed() const { return kind != EntryKind::kPlayed && kind != EntryKind::kPending; }
};

struct ScoringRules {
    tournament::HalfPoints win = 2;
    tournament::HalfPoints draw = 1;
    tournament::HalfPoints forfeit_win = 2;
    tournament::HalfPoints pairing_allocated_bye = 2;
    tournament::HalfPoints half_point_bye = 1;
    tournament::HalfPoints full_point_bye = 2;
    tournament::HalfPoints zero_point_bye = 0;

    static ScoringRules FromConfig(const api::ByeConfig& byes);
    tournament::HalfPoints ByeValue(tournament::ByeType type) const;
};

struct PlayerHistory {
    std::string player_id;
    tournament::HalfPoints score = 0;
    std::vector<RoundEntry> rounds;
    int pairing_allocated_byes = 0;
    int half_point_byes = 0;
    int full_point_byes = 0;
    int zero_point_byes = 0;
    int forfeit_wins = 0;
    int whites = 0;
    int blacks = 0;
    tournament::Color last_color = tournament::Color::kNone;
    int color_streak = 0;
    std::vector<std::string> opponents;

    bool Met(const std::string& opponent_id) const;
    int byes() const { return pairing_allocated_byes + half_point_byes + full_point_byes + zero_point_byes; }
    int color_difference() const { return whites - blacks; }
    // True once the player has scored a point without playing (bye or forfeit win).
    bool ReceivedUnplayedPoint() const;
    tournament::HalfPoints ScoreAfter(int round_number) const;
};

// Derived per-player totals, rebuilt from round 1 on every call.
class ScoreHistory {
public:
    // Replays rounds 1..through_round; through_round < 0 replays every round.
    static bool Build(const tournament::TournamentState& state,
                      const tournament::PlayerRegistry& registry,
                      const ScoringRules& rules,
                      int through_round,
                      ScoreHistory& out,
                      std::string* error);

    const PlayerHistory* Find(const std::string& player_id) const;
    const PlayerHistory& At(const std::string& player_id) const;
    int rounds_replayed() const { return rounds_replayed_; }
    // Leading replayed rounds with every result in.
    int rounds_completed() const { return rounds_completed_; }
    const std::unordered_map<std::string, PlayerHistory>& players() const { return players_; }

private:
    std::unordered_map<std::string, PlayerHistory> players_;
    int rounds_replayed_ = 0;
    int rounds_completed_ = 0;
};

}  // namespace pairkit::core::history
