#include "pairkit/core/history/ScoreHistory.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace pairkit::core::history {

using tournament::ByeType;
using tournament::Color;
using tournament::GameResult;
using tournament::HalfPoints;

namespace {

void RecordColor(PlayerHistory& history, Color color) {
    if (color == Color::kWhite) {
        history.whites += 1;
    } else if (color == Color::kBlack) {
        history.blacks += 1;
    }
    if (history.last_color == color) {
        history.color_streak += 1;
    } else {
        history.last_color = color;
        history.color_streak = 1;
    }
}

void CountBye(PlayerHistory& history, ByeType type) {
    switch (type) {
        case ByeType::kPairingAllocated:
            history.pairing_allocated_byes += 1;
            break;
        case ByeType::kHalfPoint:
            history.half_point_byes += 1;
            break;
        case ByeType::kFullPoint:
            history.full_point_byes += 1;
            break;
        case ByeType::kZeroPoint:
        case ByeType::kNone:
            history.zero_point_byes += 1;
            break;
    }
}

RoundEntry GameEntry(int round_number,
                     const std::string& opponent_id,
                     Color color,
                     GameResult result,
                     const ScoringRules& rules) {
    RoundEntry entry;
    entry.round = round_number;
    entry.opponent_id = opponent_id;
    entry.color = color;
    const bool white = color == Color::kWhite;
    switch (result) {
        case GameResult::kPending:
            entry.kind = EntryKind::kPending;
            break;
        case GameResult::kWhiteWins:
            entry.kind = EntryKind::kPlayed;
            entry.points = white ? rules.win : 0;
            break;
        case GameResult::kBlackWins:
            entry.kind = EntryKind::kPlayed;
            entry.points = white ? 0 : rules.win;
            break;
        case GameResult::kDraw:
            entry.kind = EntryKind::kPlayed;
            entry.points = rules.draw;
            break;
        case GameResult::kWhiteForfeitWin:
            entry.kind = white ? EntryKind::kForfeitWin : EntryKind::kForfeitLoss;
            entry.points = white ? rules.forfeit_win : 0;
            break;
        case GameResult::kBlackForfeitWin:
            entry.kind = white ? EntryKind::kForfeitLoss : EntryKind::kForfeitWin;
            entry.points = white ? 0 : rules.forfeit_win;
            break;
        case GameResult::kDoubleForfeit:
            entry.kind = EntryKind::kDoubleForfeit;
            break;
    }
    return entry;
}

void Apply(PlayerHistory& history, const RoundEntry& entry) {
    history.score += entry.points;
    if (entry.paired()) {
        history.opponents.push_back(entry.opponent_id);
    }
    if (entry.kind == EntryKind::kPlayed) {
        RecordColor(history, entry.color);
    } else if (entry.kind == EntryKind::kForfeitWin) {
        history.forfeit_wins += 1;
    } else if (entry.kind == EntryKind::kBye) {
        CountBye(history, entry.bye_type);
    }
    history.rounds.push_back(entry);
}

bool IntegrityError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

ScoringRules ScoringRules::FromConfig(const api::ByeConfig& byes) {
    ScoringRules rules;
    rules.forfeit_win = tournament::FromPoints(byes.forfeit_win);
    rules.pairing_allocated_bye = tournament::FromPoints(byes.pairing_allocated);
    rules.half_point_bye = tournament::FromPoints(byes.half_point);
    rules.full_point_bye = tournament::FromPoints(byes.full_point);
    rules.zero_point_bye = tournament::FromPoints(byes.zero_point);
    return rules;
}

HalfPoints ScoringRules::ByeValue(ByeType type) const {
    switch (type) {
        case ByeType::kPairingAllocated:
            return pairing_allocated_bye;
        case ByeType::kHalfPoint:
            return half_point_bye;
        case ByeType::kFullPoint:
            return full_point_bye;
        case ByeType::kZeroPoint:
        case ByeType::kNone:
            break;
    }
    return zero_point_bye;
}

bool PlayerHistory::Met(const std::string& opponent_id) const {
    return std::find(opponents.begin(), opponents.end(), opponent_id) != opponents.end();
}

bool PlayerHistory::ReceivedUnplayedPoint() const {
    return pairing_allocated_byes > 0 || full_point_byes > 0 || forfeit_wins > 0;
}

HalfPoints PlayerHistory::ScoreAfter(int round_number) const {
    HalfPoints total = 0;
    for (const auto& entry : rounds) {
        if (entry.round > round_number) {
            break;
        }
        total += entry.points;
    }
    return total;
}

bool ScoreHistory::Build(const tournament::TournamentState& state,
                         const tournament::PlayerRegistry& registry,
                         const ScoringRules& rules,
                         int through_round,
                         ScoreHistory& out,
                         std::string* error) {
    ScoreHistory result;
    for (const auto& player : registry.players()) {
        PlayerHistory history;
        history.player_id = player.id;
        result.players_.emplace(player.id, std::move(history));
    }

    const int last_round = through_round < 0
                               ? static_cast<int>(state.rounds.size())
                               : std::min(through_round, static_cast<int>(state.rounds.size()));

    for (int index = 0; index < last_round; ++index) {
        const auto& round = state.rounds[static_cast<size_t>(index)];
        const int round_number = index + 1;
        if (round.number != round_number) {
            return IntegrityError(error, "Round stored at position " + std::to_string(round_number) +
                                             " is numbered " + std::to_string(round.number));
        }

        std::unordered_set<std::string> seen;
        auto claim = [&](const std::string& player_id, const tournament::Pairing& pairing) {
            if (!registry.Contains(player_id)) {
                return IntegrityError(error, "Round " + std::to_string(round_number) + " pairing " +
                                                 pairing.id + " references unknown player " + player_id);
            }
            if (!seen.insert(player_id).second) {
                return IntegrityError(error, "Player " + player_id + " appears twice in round " +
                                                 std::to_string(round_number));
            }
            return true;
        };

        for (const auto& pairing : round.pairings) {
            if (pairing.white_id.empty()) {
                return IntegrityError(error, "Pairing " + pairing.id + " in round " +
                                                 std::to_string(round_number) + " has no player");
            }
            if (pairing.is_bye) {
                if (!pairing.black_id.empty()) {
                    return IntegrityError(error, "Bye pairing " + pairing.id + " names an opponent");
                }
                if (pairing.result != GameResult::kPending) {
                    return IntegrityError(error, "Result recorded on bye pairing " + pairing.id);
                }
                if (!claim(pairing.white_id, pairing)) {
                    return false;
                }
                RoundEntry entry;
                entry.round = round_number;
                entry.kind = EntryKind::kBye;
                entry.bye_type = pairing.bye_type == ByeType::kNone ? ByeType::kPairingAllocated
                                                                    : pairing.bye_type;
                entry.points = rules.ByeValue(entry.bye_type);
                Apply(result.players_.at(pairing.white_id), entry);
                continue;
            }
            if (pairing.black_id.empty()) {
                return IntegrityError(error, "Game pairing " + pairing.id + " has no black player");
            }
            if (pairing.white_id == pairing.black_id) {
                return IntegrityError(error, "Pairing " + pairing.id + " pairs a player with themself");
            }
            if (!claim(pairing.white_id, pairing) || !claim(pairing.black_id, pairing)) {
                return false;
            }
            Apply(result.players_.at(pairing.white_id),
                  GameEntry(round_number, pairing.black_id, Color::kWhite, pairing.result, rules));
            Apply(result.players_.at(pairing.black_id),
                  GameEntry(round_number, pairing.white_id, Color::kBlack, pairing.result, rules));
        }

        if (result.rounds_completed_ == index && round.AllResultsIn()) {
            result.rounds_completed_ = round_number;
        }
        for (auto& item : result.players_) {
            if (seen.count(item.first) == 0) {
                RoundEntry entry;
                entry.round = round_number;
                entry.kind = EntryKind::kAbsent;
                Apply(item.second, entry);
            }
        }
    }

    result.rounds_replayed_ = last_round;
    out = std::move(result);
    return true;
}

const PlayerHistory* ScoreHistory::Find(const std::string& player_id) const {
    const auto it = players_.find(player_id);
    if (it == players_.end()) {
        return nullptr;
    }
    return &it->second;
}

const PlayerHistory& ScoreHistory::At(const std::string& player_id) const {
    const auto it = players_.find(player_id);
    if (it == players_.end()) {
        throw std::out_of_range("No history for player " + player_id);
    }
    return it->second;
}

}  // namespace pairkit::core::history
