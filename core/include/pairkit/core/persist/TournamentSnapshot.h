#pragma once

#include "pairkit/core/api/PairingEngine.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace pairkit::core::persist {

constexpr int kSnapshotVersion = 1;

std::string SerializeTournament(const tournament::TournamentState& state);
bool ParseTournament(const std::string& payload, tournament::TournamentState& state, std::string* error);

bool SaveTournament(const std::string& path, const tournament::TournamentState& state, std::string* error);
bool LoadTournament(const std::string& path, tournament::TournamentState& state, std::string* error);

// A results file is an array of {"pairing_id": ..., "result": ...} objects.
bool ParseResults(const std::string& payload, std::vector<api::ResultEntry>& results, std::string* error);
bool LoadResults(const std::string& path, std::vector<api::ResultEntry>& results, std::string* error);

}  // namespace pairkit::core::persist
