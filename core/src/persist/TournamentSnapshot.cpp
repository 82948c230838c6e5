#include "pairkit/core/persist/TournamentSnapshot.h"

#include "pairkit/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace pairkit::core::persist {

using tournament::ByeType;
using tournament::GameResult;

namespace {

bool ReadFile(const std::string& path, const std::string& what, std::string& payload, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open " + what + ": " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    payload = buffer.str();
    return true;
}

nlohmann::json PairingToJson(const tournament::Pairing& pairing) {
    nlohmann::json node = {
        {"id", pairing.id},
        {"board", pairing.board},
        {"section", pairing.section},
        {"white", pairing.white_id},
        {"black", pairing.black_id},
        {"result", tournament::GameResultToString(pairing.result)},
        {"bye", pairing.is_bye},
    };
    if (pairing.is_bye) {
        node["bye_type"] = tournament::ByeTypeToString(pairing.bye_type);
    }
    if (!pairing.group.empty()) {
        node["group"] = pairing.group;
    }
    return node;
}

bool PairingFromJson(const nlohmann::json& node, tournament::Pairing& pairing, std::string* error) {
    pairing.id = node.value("id", "");
    pairing.board = node.value("board", 0);
    pairing.section = node.value("section", "");
    pairing.white_id = node.value("white", "");
    pairing.black_id = node.value("black", "");
    pairing.group = node.value("group", "");
    pairing.is_bye = node.value("bye", false);

    const std::string result = node.value("result", "*");
    if (!tournament::ParseGameResult(result, pairing.result)) {
        if (error) {
            *error = "Pairing " + pairing.id + " has unknown result '" + result + "'";
        }
        return false;
    }
    if (pairing.is_bye) {
        const std::string bye_type = node.value("bye_type", "pairing_allocated");
        if (!tournament::ParseByeType(bye_type, pairing.bye_type)) {
            if (error) {
                *error = "Pairing " + pairing.id + " has unknown bye type '" + bye_type + "'";
            }
            return false;
        }
    }
    return true;
}

}  // namespace

std::string SerializeTournament(const tournament::TournamentState& state) {
    nlohmann::json root;
    root["version"] = kSnapshotVersion;
    root["id"] = state.id;
    root["name"] = state.name;

    root["players"] = nlohmann::json::array();
    for (const auto& player : state.players) {
        root["players"].push_back({
            {"id", player.id},
            {"name", player.name},
            {"rating", player.rating},
            {"provisional", player.provisional},
            {"section", player.section},
            {"team_id", player.team_id},
            {"withdrawn", player.withdrawn},
            {"requested_bye_rounds", player.requested_bye_rounds},
            {"pairing_number", player.pairing_number},
        });
    }

    root["teams"] = nlohmann::json::array();
    for (const auto& team : state.teams) {
        root["teams"].push_back({
            {"id", team.id},
            {"name", team.name},
            {"section", team.section},
            {"members", team.member_ids},
        });
    }

    root["rounds"] = nlohmann::json::array();
    for (const auto& round : state.rounds) {
        nlohmann::json node = {
            {"number", round.number},
            {"status", round.status == tournament::RoundStatus::kComplete ? "complete" : "pending"},
        };
        node["pairings"] = nlohmann::json::array();
        for (const auto& pairing : round.pairings) {
            node["pairings"].push_back(PairingToJson(pairing));
        }
        root["rounds"].push_back(std::move(node));
    }
    return root.dump(2);
}

bool ParseTournament(const std::string& payload, tournament::TournamentState& state, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse tournament: ") + ex.what();
        }
        return false;
    }

    tournament::TournamentState loaded;
    try {
        const int version = root.value("version", kSnapshotVersion);
        if (version > kSnapshotVersion) {
            if (error) {
                *error = "Unsupported tournament snapshot version " + std::to_string(version);
            }
            return false;
        }
        loaded.id = root.value("id", "");
        loaded.name = root.value("name", "");

        if (root.contains("players")) {
            for (const auto& node : root.at("players")) {
                tournament::Player player;
                player.id = node.value("id", "");
                player.name = node.value("name", player.id);
                player.rating = node.value("rating", 0);
                player.provisional = node.value("provisional", false);
                player.section = node.value("section", "");
                player.team_id = node.value("team_id", "");
                player.withdrawn = node.value("withdrawn", false);
                player.pairing_number = node.value("pairing_number", 0);
                if (node.contains("requested_bye_rounds")) {
                    player.requested_bye_rounds = node.at("requested_bye_rounds").get<std::vector<int>>();
                }
                loaded.players.push_back(std::move(player));
            }
        }

        if (root.contains("teams")) {
            for (const auto& node : root.at("teams")) {
                tournament::Team team;
                team.id = node.value("id", "");
                team.name = node.value("name", team.id);
                team.section = node.value("section", "");
                if (node.contains("members")) {
                    team.member_ids = node.at("members").get<std::vector<std::string>>();
                }
                loaded.teams.push_back(std::move(team));
            }
        }

        if (root.contains("rounds")) {
            for (const auto& node : root.at("rounds")) {
                tournament::Round round;
                round.number = node.value("number", static_cast<int>(loaded.rounds.size()) + 1);
                round.status = node.value("status", "pending") == "complete" ? tournament::RoundStatus::kComplete
                                                                             : tournament::RoundStatus::kPending;
                if (node.contains("pairings")) {
                    for (const auto& pairing_node : node.at("pairings")) {
                        tournament::Pairing pairing;
                        if (!PairingFromJson(pairing_node, pairing, error)) {
                            return false;
                        }
                        round.pairings.push_back(std::move(pairing));
                    }
                }
                loaded.rounds.push_back(std::move(round));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Malformed tournament: ") + ex.what();
        }
        return false;
    }

    state = std::move(loaded);
    return true;
}

bool SaveTournament(const std::string& path, const tournament::TournamentState& state, std::string* error) {
    return util::AtomicFileWriter::Write(path, SerializeTournament(state), error);
}

bool LoadTournament(const std::string& path, tournament::TournamentState& state, std::string* error) {
    std::string payload;
    if (!ReadFile(path, "tournament", payload, error)) {
        return false;
    }
    return ParseTournament(payload, state, error);
}

bool ParseResults(const std::string& payload, std::vector<api::ResultEntry>& results, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse results: ") + ex.what();
        }
        return false;
    }
    if (!root.is_array()) {
        if (error) {
            *error = "Results must be a JSON array";
        }
        return false;
    }

    std::vector<api::ResultEntry> parsed;
    for (const auto& node : root) {
        if (!node.is_object()) {
            if (error) {
                *error = "Each result must be an object";
            }
            return false;
        }
        api::ResultEntry entry;
        entry.pairing_id = node.value("pairing_id", "");
        const std::string result = node.value("result", "");
        if (!tournament::ParseGameResult(result, entry.result)) {
            if (error) {
                *error = "Unknown result '" + result + "' for pairing " + entry.pairing_id;
            }
            return false;
        }
        parsed.push_back(std::move(entry));
    }
    results = std::move(parsed);
    return true;
}

bool LoadResults(const std::string& path, std::vector<api::ResultEntry>& results, std::string* error) {
    std::string payload;
    if (!ReadFile(path, "results", payload, error)) {
        return false;
    }
    return ParseResults(payload, results, error);
}

}  // namespace pairkit::core::persist
