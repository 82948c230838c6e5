#include "pairkit/core/tournament/EliminationScheduler.h"

#include "pairkit/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace pairkit::core::tournament {

namespace {

int SlotsFor(int players) {
    int slots = 1;
    while (slots < players) {
        slots *= 2;
    }
    return slots;
}

const Pairing* FindPlayerPairing(const Round& round, const std::string& player_id) {
    for (const auto& pairing : round.pairings) {
        if (pairing.HasPlayer(player_id)) {
            return &pairing;
        }
    }
    return nullptr;
}

// Winner of a finished bracket game; empty when nobody advances.
std::string Advancing(const Pairing& pairing, const std::unordered_map<std::string, int>& seeds) {
    switch (pairing.result) {
        case GameResult::kWhiteWins:
        case GameResult::kWhiteForfeitWin:
            return pairing.white_id;
        case GameResult::kBlackWins:
        case GameResult::kBlackForfeitWin:
            return pairing.black_id;
        case GameResult::kDraw:
            return seeds.at(pairing.white_id) < seeds.at(pairing.black_id) ? pairing.white_id : pairing.black_id;
        case GameResult::kDoubleForfeit:
        case GameResult::kPending:
            break;
    }
    return {};
}

}  // namespace

std::vector<int> EliminationScheduler::BracketOrder(int slots) {
    std::vector<int> order{1};
    while (static_cast<int>(order.size()) < slots) {
        const int size = static_cast<int>(order.size()) * 2;
        std::vector<int> next;
        next.reserve(static_cast<size_t>(size));
        for (const int seed : order) {
            next.push_back(seed);
            next.push_back(size + 1 - seed);
        }
        order = std::move(next);
    }
    return order;
}

bool EliminationScheduler::Survivors(const PairingContext& context,
                                     int round_number,
                                     std::vector<std::string>& survivors,
                                     PairingError* error) {
    // The bracket is drawn from the pairing numbers, never from current ratings.
    const auto seeded = context.registry->Seated(context.section);
    std::unordered_map<std::string, int> seeds;
    for (size_t i = 0; i < seeded.size(); ++i) {
        seeds[seeded[i]->id] = static_cast<int>(i);
    }

    survivors.clear();
    for (const int seed : BracketOrder(SlotsFor(static_cast<int>(seeded.size())))) {
        survivors.push_back(seed <= static_cast<int>(seeded.size()) ? seeded[static_cast<size_t>(seed - 1)]->id
                                                                    : std::string());
    }

    for (int number = 1; number < round_number && survivors.size() > 1; ++number) {
        const Round* round = context.state->FindRound(number);
        if (!round) {
            return Fail(error, ErrorKind::kDataIntegrity, "Bracket round " + std::to_string(number) + " is missing");
        }
        std::vector<std::string> next;
        next.reserve(survivors.size() / 2);
        for (size_t slot = 0; slot + 1 < survivors.size(); slot += 2) {
            const std::string& a = survivors[slot];
            const std::string& b = survivors[slot + 1];
            if (a.empty() || b.empty()) {
                next.push_back(a.empty() ? b : a);
                continue;
            }
            const Pairing* pairing = FindPlayerPairing(*round, a);
            if (pairing && pairing->is_bye) {
                next.push_back(a);
                continue;
            }
            if (!pairing) {
                // a withdrew; b goes through only if b was given the bye.
                const Pairing* other = FindPlayerPairing(*round, b);
                next.push_back(other && other->is_bye ? b : std::string());
                continue;
            }
            if (!pairing->HasPlayer(b)) {
                std::ostringstream message;
                message << "Round " << number << " pairs " << a << " outside the bracket (expected opponent " << b
                        << ")";
                return Fail(error, ErrorKind::kDataIntegrity, message.str());
            }
            if (pairing->result == GameResult::kPending) {
                return Fail(error,
                            ErrorKind::kValidation,
                            "Bracket game " + pairing->id + " in round " + std::to_string(number) + " has no result");
            }
            next.push_back(Advancing(*pairing, seeds));
        }
        survivors = std::move(next);
    }
    return true;
}

bool EliminationScheduler::BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) {
    std::vector<std::string> survivors;
    if (!Survivors(context, context.round_number, survivors, error)) {
        return false;
    }
    const auto remaining = std::count_if(survivors.begin(), survivors.end(), [](const std::string& id) {
        return !id.empty();
    });
    if (remaining <= 1) {
        const auto it = std::find_if(survivors.begin(), survivors.end(), [](const std::string& id) {
            return !id.empty();
        });
        const std::string champion = it == survivors.end() ? std::string("nobody") : *it;
        return Fail(error,
                    ErrorKind::kValidation,
                    "Bracket of section '" + context.section + "' is decided; winner " + champion);
    }

    const ColorRules rules{context.config->colors.alternation_limit, context.config->colors.equalization_limit};
    std::vector<Pairing> byes;
    for (size_t slot = 0; slot + 1 < survivors.size(); slot += 2) {
        const std::string& first = survivors[slot];
        const std::string& second = survivors[slot + 1];
        if (first.empty() && second.empty()) {
            continue;
        }
        const Player* first_player = first.empty() ? nullptr : context.registry->Find(first);
        const Player* second_player = second.empty() ? nullptr : context.registry->Find(second);
        const bool first_plays = first_player && !first_player->withdrawn;
        const bool second_plays = second_player && !second_player->withdrawn;
        if (!first_plays || !second_plays) {
            if (first_plays || second_plays) {
                byes.push_back(MakeBye(first_plays ? first : second, ByeType::kPairingAllocated));
            }
            continue;
        }
        // The earlier bracket slot takes the default color when history does not decide.
        const ColorAssignment colors = AssignColors(ColorStateOf(context.history->At(first)),
                                                    ColorStateOf(context.history->At(second)),
                                                    rules,
                                                    context.config->colors.initial_color);
        plan.pairings.push_back(colors.higher_gets_white ? MakeGame(first, second) : MakeGame(second, first));
    }
    plan.pairings.insert(plan.pairings.end(), byes.begin(), byes.end());
    NumberBoards(plan.pairings);
    return true;
}

}  // namespace pairkit::core::tournament
