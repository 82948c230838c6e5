#include "pairkit/core/tournament/TournamentTypes.h"

#include <algorithm>
#include <cmath>

namespace pairkit::core::tournament {

HalfPoints FromPoints(double points) {
    return static_cast<HalfPoints>(std::lround(points * 2.0));
}

bool Player::RequestedByeIn(int round_number) const {
    return std::find(requested_bye_rounds.begin(), requested_bye_rounds.end(), round_number) !=
           requested_bye_rounds.end();
}

bool Round::AllResultsIn() const {
    return std::all_of(pairings.begin(), pairings.end(), [](const Pairing& pairing) {
        return pairing.finished();
    });
}

const Pairing* Round::FindPairing(const std::string& pairing_id) const {
    for (const auto& pairing : pairings) {
        if (pairing.id == pairing_id) {
            return &pairing;
        }
    }
    return nullptr;
}

Pairing* Round::FindPairing(const std::string& pairing_id) {
    for (auto& pairing : pairings) {
        if (pairing.id == pairing_id) {
            return &pairing;
        }
    }
    return nullptr;
}

const Round* TournamentState::FindRound(int number) const {
    if (number < 1 || number > static_cast<int>(rounds.size())) {
        return nullptr;
    }
    return &rounds[static_cast<size_t>(number - 1)];
}

Round* TournamentState::FindRound(int number) {
    if (number < 1 || number > static_cast<int>(rounds.size())) {
        return nullptr;
    }
    return &rounds[static_cast<size_t>(number - 1)];
}

int TournamentState::completed_rounds() const {
    int count = 0;
    for (const auto& round : rounds) {
        if (round.status != RoundStatus::kComplete) {
            break;
        }
        ++count;
    }
    return count;
}

const char* GameResultToString(GameResult result) {
    switch (result) {
        case GameResult::kWhiteWins:
            return "1-0";
        case GameResult::kBlackWins:
            return "0-1";
        case GameResult::kDraw:
            return "1/2-1/2";
        case GameResult::kWhiteForfeitWin:
            return "1-0F";
        case GameResult::kBlackForfeitWin:
            return "0-1F";
        case GameResult::kDoubleForfeit:
            return "0-0F";
        case GameResult::kPending:
            break;
    }
    return "";
}

bool ParseGameResult(const std::string& text, GameResult& out) {
    if (text.empty() || text == "*") {
        out = GameResult::kPending;
    } else if (text == "1-0") {
        out = GameResult::kWhiteWins;
    } else if (text == "0-1") {
        out = GameResult::kBlackWins;
    } else if (text == "1/2-1/2" || text == "=") {
        out = GameResult::kDraw;
    } else if (text == "1-0F" || text == "+:-") {
        out = GameResult::kWhiteForfeitWin;
    } else if (text == "0-1F" || text == "-:+") {
        out = GameResult::kBlackForfeitWin;
    } else if (text == "0-0F" || text == "-:-") {
        out = GameResult::kDoubleForfeit;
    } else {
        return false;
    }
    return true;
}

const char* ByeTypeToString(ByeType type) {
    switch (type) {
        case ByeType::kPairingAllocated:
            return "pairing_allocated";
        case ByeType::kHalfPoint:
            return "half_point";
        case ByeType::kFullPoint:
            return "full_point";
        case ByeType::kZeroPoint:
            return "zero_point";
        case ByeType::kNone:
            break;
    }
    return "";
}

bool ParseByeType(const std::string& text, ByeType& out) {
    if (text.empty()) {
        out = ByeType::kNone;
    } else if (text == "pairing_allocated" || text == "unpaired") {
        out = ByeType::kPairingAllocated;
    } else if (text == "half_point" || text == "half_point_bye" || text == "bye") {
        out = ByeType::kHalfPoint;
    } else if (text == "full_point") {
        out = ByeType::kFullPoint;
    } else if (text == "zero_point") {
        out = ByeType::kZeroPoint;
    } else {
        return false;
    }
    return true;
}

const char* ColorToString(Color color) {
    switch (color) {
        case Color::kWhite:
            return "white";
        case Color::kBlack:
            return "black";
        case Color::kNone:
            break;
    }
    return "none";
}

bool IsForfeit(GameResult result) {
    return result == GameResult::kWhiteForfeitWin || result == GameResult::kBlackForfeitWin ||
           result == GameResult::kDoubleForfeit;
}

}  // namespace pairkit::core::tournament
