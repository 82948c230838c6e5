#include "pairkit/core/tournament/RoundRobinScheduler.h"

#include <sstream>
#include <utility>

namespace pairkit::core::tournament {

namespace {

std::vector<int> BuildSeatList(int player_count) {
    std::vector<int> seats;
    seats.reserve(static_cast<size_t>(player_count + 1));
    for (int i = 0; i < player_count; ++i) {
        seats.push_back(i);
    }
    if (player_count % 2 == 1) {
        seats.push_back(-1);
    }
    return seats;
}

void RotateSeats(std::vector<int>& seats) {
    if (seats.size() <= 2) {
        return;
    }
    const int fixed = seats.front();
    const int last = seats.back();
    for (size_t i = seats.size() - 1; i > 1; --i) {
        seats[i] = seats[i - 1];
    }
    seats[1] = last;
    seats[0] = fixed;
}

ScheduledRound Reversed(const ScheduledRound& round) {
    ScheduledRound reversed = round;
    for (auto& game : reversed.games) {
        std::swap(game.white, game.black);
    }
    return reversed;
}

enum class Availability {
    kPlaying,
    kRequestedBye,
    kWithdrawn,
};

Availability AvailabilityOf(const Player& player, int round_number) {
    if (player.withdrawn) {
        return Availability::kWithdrawn;
    }
    if (player.RequestedByeIn(round_number)) {
        return Availability::kRequestedBye;
    }
    return Availability::kPlaying;
}

void AddIdleBye(const Player& player, Availability availability, const std::string& group, std::vector<Pairing>& byes) {
    if (availability == Availability::kPlaying) {
        byes.push_back(MakeBye(player.id, ByeType::kPairingAllocated, group));
    } else if (availability == Availability::kRequestedBye) {
        byes.push_back(MakeBye(player.id, ByeType::kHalfPoint, group));
    }
}

}  // namespace

std::vector<ScheduledRound> RoundRobinScheduler::BuildSchedule(int player_count, bool double_round_robin) {
    std::vector<ScheduledRound> schedule;
    if (player_count < 1) {
        return schedule;
    }

    auto seats = BuildSeatList(player_count);
    const int seat_count = static_cast<int>(seats.size());
    const int rounds = seat_count - 1;

    for (int round = 0; round < rounds; ++round) {
        ScheduledRound scheduled;
        for (int i = 0; i < seat_count / 2; ++i) {
            const int s1 = seats[static_cast<size_t>(i)];
            const int s2 = seats[static_cast<size_t>(seat_count - 1 - i)];
            if (s1 == -1 || s2 == -1) {
                scheduled.bye = s1 == -1 ? s2 : s1;
                continue;
            }

            // The fixed seat alternates every round; the moving tables alternate by position.
            const bool swap_colors = i == 0 ? round % 2 == 0 : i % 2 == 1;
            scheduled.games.push_back({swap_colors ? s2 : s1, swap_colors ? s1 : s2});
        }
        schedule.push_back(std::move(scheduled));
        RotateSeats(seats);
    }

    if (double_round_robin) {
        for (int round = 0; round < rounds; ++round) {
            schedule.push_back(Reversed(schedule[static_cast<size_t>(round)]));
        }
    }
    return schedule;
}

ScheduledRound RoundRobinScheduler::CycledRound(const std::vector<ScheduledRound>& schedule, int round_number) {
    if (schedule.empty() || round_number < 1) {
        return {};
    }
    const int length = static_cast<int>(schedule.size());
    const int cycle = (round_number - 1) / length;
    const auto& round = schedule[static_cast<size_t>((round_number - 1) % length)];
    return cycle % 2 == 1 ? Reversed(round) : round;
}

void RoundRobinScheduler::ExpandRound(const ScheduledRound& round,
                                      const std::vector<const Player*>& players,
                                      int round_number,
                                      const std::string& group,
                                      std::vector<Pairing>& games,
                                      std::vector<Pairing>& byes) {
    for (const auto& game : round.games) {
        const Player& white = *players[static_cast<size_t>(game.white)];
        const Player& black = *players[static_cast<size_t>(game.black)];
        const Availability white_state = AvailabilityOf(white, round_number);
        const Availability black_state = AvailabilityOf(black, round_number);
        if (white_state == Availability::kPlaying && black_state == Availability::kPlaying) {
            games.push_back(MakeGame(white.id, black.id, group));
            continue;
        }
        AddIdleBye(white, white_state, group, byes);
        AddIdleBye(black, black_state, group, byes);
    }
    if (round.bye >= 0) {
        const Player& player = *players[static_cast<size_t>(round.bye)];
        AddIdleBye(player, AvailabilityOf(player, round_number), group, byes);
    }
}

bool RoundRobinScheduler::BuildRound(const PairingContext& context, RoundPlan& plan, PairingError* error) {
    // Seats follow the pairing numbers, so withdrawn players keep theirs.
    const auto players = context.registry->Seated(context.section);
    const auto schedule = BuildSchedule(static_cast<int>(players.size()), context.config->double_round_robin);
    if (context.round_number > static_cast<int>(schedule.size())) {
        std::ostringstream message;
        message << "Round " << context.round_number << " is past the end of the " << schedule.size()
                << "-round schedule of section '" << context.section << "'";
        return Fail(error, ErrorKind::kValidation, message.str());
    }

    std::vector<Pairing> byes;
    ExpandRound(schedule[static_cast<size_t>(context.round_number - 1)],
                players,
                context.round_number,
                {},
                plan.pairings,
                byes);
    plan.pairings.insert(plan.pairings.end(), byes.begin(), byes.end());
    NumberBoards(plan.pairings);
    return true;
}

}  // namespace pairkit::core::tournament
