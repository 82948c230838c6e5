#pragma once

#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace pairkit::core::tournament {

class PlayerRegistry {
public:
    PlayerRegistry() = default;

    // Fails on duplicate or empty ids, on pairing numbers used twice in a
    // section, and on team members that are not registered or belong elsewhere.
    static bool Build(const TournamentState& state, PlayerRegistry& out, std::string* error);

    const Player* Find(const std::string& player_id) const;
    bool Contains(const std::string& player_id) const { return Find(player_id) != nullptr; }
    const Team* FindTeam(const std::string& team_id) const;

    const std::vector<Player>& players() const { return players_; }
    const std::vector<Team>& teams() const { return teams_; }

    // Sections in order of first registration.
    std::vector<std::string> Sections() const;

    // Rating descending, then id: the initial ranking used for seeding.
    std::vector<const Player*> Seeded(const std::string& section, bool active_only) const;
    // Pairing number order for formats whose seating is fixed at round 1.
    // Players entered after that have no number and are left out. Sections
    // that were never numbered fall back to Seeded().
    std::vector<const Player*> Seated(const std::string& section) const;
    std::vector<const Team*> TeamsIn(const std::string& section) const;

    static bool SeedBefore(const Player& a, const Player& b);
    // Numbers every section 1..n in seeding order.
    static void AssignPairingNumbers(std::vector<Player>& players);

private:
    std::vector<Player> players_;
    std::vector<Team> teams_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, size_t> team_index_;
};

}  // namespace pairkit::core::tournament
