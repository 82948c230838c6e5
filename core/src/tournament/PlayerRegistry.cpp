#include "pairkit/core/tournament/PlayerRegistry.h"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace pairkit::core::tournament {

bool PlayerRegistry::Build(const TournamentState& state, PlayerRegistry& out, std::string* error) {
    PlayerRegistry registry;
    registry.players_ = state.players;
    registry.teams_ = state.teams;
    for (size_t i = 0; i < registry.players_.size(); ++i) {
        const auto& player = registry.players_[i];
        if (player.id.empty()) {
            if (error) {
                *error = "Player at index " + std::to_string(i) + " has no id";
            }
            return false;
        }
        if (!registry.index_.emplace(player.id, i).second) {
            if (error) {
                *error = "Duplicate player id: " + player.id;
            }
            return false;
        }
    }
    std::set<std::pair<std::string, int>> numbers;
    for (const auto& player : registry.players_) {
        if (player.pairing_number > 0 && !numbers.emplace(player.section, player.pairing_number).second) {
            if (error) {
                *error = "Pairing number " + std::to_string(player.pairing_number) + " is used twice in section '" +
                         player.section + "'";
            }
            return false;
        }
    }
    for (size_t i = 0; i < registry.teams_.size(); ++i) {
        const auto& team = registry.teams_[i];
        if (!registry.team_index_.emplace(team.id, i).second) {
            if (error) {
                *error = "Duplicate team id: " + team.id;
            }
            return false;
        }
        for (const auto& member : team.member_ids) {
            const auto it = registry.index_.find(member);
            if (it == registry.index_.end()) {
                if (error) {
                    *error = "Team " + team.id + " lists unknown player " + member;
                }
                return false;
            }
            // The member list is authoritative; an unset team id is filled from it.
            auto& player = registry.players_[it->second];
            if (player.team_id.empty()) {
                player.team_id = team.id;
            } else if (player.team_id != team.id) {
                if (error) {
                    *error = "Team " + team.id + " lists player " + member + " who belongs to team " +
                             player.team_id;
                }
                return false;
            }
        }
    }
    out = std::move(registry);
    return true;
}

const Player* PlayerRegistry::Find(const std::string& player_id) const {
    const auto it = index_.find(player_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &players_[it->second];
}

const Team* PlayerRegistry::FindTeam(const std::string& team_id) const {
    const auto it = team_index_.find(team_id);
    if (it == team_index_.end()) {
        return nullptr;
    }
    return &teams_[it->second];
}

std::vector<std::string> PlayerRegistry::Sections() const {
    std::vector<std::string> sections;
    for (const auto& player : players_) {
        if (std::find(sections.begin(), sections.end(), player.section) == sections.end()) {
            sections.push_back(player.section);
        }
    }
    for (const auto& team : teams_) {
        if (std::find(sections.begin(), sections.end(), team.section) == sections.end()) {
            sections.push_back(team.section);
        }
    }
    return sections;
}

std::vector<const Player*> PlayerRegistry::Seeded(const std::string& section, bool active_only) const {
    std::vector<const Player*> seeded;
    for (const auto& player : players_) {
        if (player.section != section) {
            continue;
        }
        if (active_only && player.withdrawn) {
            continue;
        }
        seeded.push_back(&player);
    }
    std::sort(seeded.begin(), seeded.end(), [](const Player* a, const Player* b) {
        return SeedBefore(*a, *b);
    });
    return seeded;
}

std::vector<const Player*> PlayerRegistry::Seated(const std::string& section) const {
    std::vector<const Player*> seated;
    bool numbered = false;
    for (const auto& player : players_) {
        if (player.section == section && player.pairing_number > 0) {
            seated.push_back(&player);
            numbered = true;
        }
    }
    if (!numbered) {
        return Seeded(section, false);
    }
    std::sort(seated.begin(), seated.end(), [](const Player* a, const Player* b) {
        return a->pairing_number < b->pairing_number;
    });
    return seated;
}

std::vector<const Team*> PlayerRegistry::TeamsIn(const std::string& section) const {
    std::vector<const Team*> teams;
    for (const auto& team : teams_) {
        if (team.section == section) {
            teams.push_back(&team);
        }
    }
    return teams;
}

bool PlayerRegistry::SeedBefore(const Player& a, const Player& b) {
    if (a.rating != b.rating) {
        return a.rating > b.rating;
    }
    return a.id < b.id;
}

void PlayerRegistry::AssignPairingNumbers(std::vector<Player>& players) {
    std::map<std::string, std::vector<Player*>> sections;
    for (auto& player : players) {
        sections[player.section].push_back(&player);
    }
    for (auto& section : sections) {
        auto& members = section.second;
        std::sort(members.begin(), members.end(), [](const Player* a, const Player* b) {
            return SeedBefore(*a, *b);
        });
        for (size_t i = 0; i < members.size(); ++i) {
            members[i]->pairing_number = static_cast<int>(i) + 1;
        }
    }
}

}  // namespace pairkit::core::tournament
