#pragma once

#include <string>
#include <vector>

namespace pairkit::core::tournament {

// Scores are kept in half-point units so score groups compare exactly.
using HalfPoints = int;

inline double ToPoints(HalfPoints value) {
    return static_cast<double>(value) / 2.0;
}

HalfPoints FromPoints(double points);

enum class Color {
    kNone = 0,
    kWhite = 1,
    kBlack = -1,
};

inline Color Opposite(Color color) {
    if (color == Color::kWhite) {
        return Color::kBlack;
    }
    if (color == Color::kBlack) {
        return Color::kWhite;
    }
    return Color::kNone;
}

enum class GameResult {
    kPending,
    kWhiteWins,
    kBlackWins,
    kDraw,
    kWhiteForfeitWin,
    kBlackForfeitWin,
    kDoubleForfeit,
};

enum class ByeType {
    kNone,
    kPairingAllocated,
    kHalfPoint,
    kFullPoint,
    kZeroPoint,
};

enum class RoundStatus {
    kPending,
    kComplete,
};

struct Player {
    std::string id;
    std::string name;
    int rating = 0;
    bool provisional = false;
    std::string section;
    std::string team_id;
    bool withdrawn = false;
    std::vector<int> requested_bye_rounds;
    // Starting number within the section, fixed when round 1 is paired; 0 before that.
    int pairing_number = 0;

    bool rated() const { return rating > 0; }
    bool RequestedByeIn(int round_number) const;
};

struct Team {
    std::string id;
    std::string name;
    std::string section;
    std::vector<std::string> member_ids;
};

// A pairing with an empty black side is a bye; the bye recipient is stored as white.
struct Pairing {
    std::string id;
    int board = 0;
    std::string section;
    std::string white_id;
    std::string black_id;
    GameResult result = GameResult::kPending;
    bool is_bye = false;
    ByeType bye_type = ByeType::kNone;
    std::string group;

    bool HasPlayer(const std::string& player_id) const {
        return white_id == player_id || (!is_bye && black_id == player_id);
    }
    bool finished() const { return is_bye || result != GameResult::kPending; }
};

struct Round {
    int number = 0;
    RoundStatus status = RoundStatus::kPending;
    std::vector<Pairing> pairings;

    bool AllResultsIn() const;
    const Pairing* FindPairing(const std::string& pairing_id) const;
    Pairing* FindPairing(const std::string& pairing_id);
};

struct TournamentState {
    std::string id;
    std::string name;
    std::vector<Player> players;
    std::vector<Team> teams;
    // Indexed by round number - 1.
    std::vector<Round> rounds;

    const Round* FindRound(int number) const;
    Round* FindRound(int number);
    int completed_rounds() const;
};

const char* GameResultToString(GameResult result);
bool ParseGameResult(const std::string& text, GameResult& out);
const char* ByeTypeToString(ByeType type);
bool ParseByeType(const std::string& text, ByeType& out);
const char* ColorToString(Color color);

bool IsForfeit(GameResult result);

}  // namespace pairkit::core::tournament
