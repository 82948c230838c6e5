#include "pairkit/core/tournament/TournamentScheduler.h"

namespace pairkit::core::tournament {

Pairing MakeGame(const std::string& white_id, const std::string& black_id, const std::string& group) {
    Pairing pairing;
    pairing.white_id = white_id;
    pairing.black_id = black_id;
    pairing.group = group;
    return pairing;
}

Pairing MakeBye(const std::string& player_id, ByeType type, const std::string& group) {
    Pairing pairing;
    pairing.white_id = player_id;
    pairing.is_bye = true;
    pairing.bye_type = type;
    pairing.group = group;
    return pairing;
}

void NumberBoards(std::vector<Pairing>& pairings, int first_board) {
    int board = first_board;
    for (auto& pairing : pairings) {
        pairing.board = board++;
    }
}

}  // namespace pairkit::core::tournament
