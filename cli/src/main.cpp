#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/api/PairingEngine.h"
#include "pairkit/core/export/ExportWriter.h"
#include "pairkit/core/persist/TournamentSnapshot.h"
#include "pairkit/core/tournament/TournamentTypes.h"
#include "pairkit/core/util/AtomicFileWriter.h"

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

using pairkit::core::api::EngineConfig;
using pairkit::core::api::PairingEngine;
using pairkit::core::tournament::PairingError;
using pairkit::core::tournament::TournamentState;

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  pairkitcli pair <tournament.json> <config.json> [--round N] [--out outcome.json]\n"
              << "  pairkitcli record <tournament.json> <round> <results.json> [--correction]\n"
              << "  pairkitcli correct <tournament.json> <config.json> <round> <pairing_id> <result>\n"
              << "  pairkitcli standings <tournament.json> <config.json> [--section S] [--teams]\n"
              << "                       [--csv path] [--html path] [--json path]\n";
}

bool ParseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

// Options of the form --name value, plus bare flags.
struct Options {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;
    std::vector<std::string> flags;

    bool Has(const std::string& flag) const {
        for (const auto& item : flags) {
            if (item == flag) {
                return true;
            }
        }
        return false;
    }
    std::string Value(const std::string& name) const {
        const auto it = values.find(name);
        return it == values.end() ? std::string() : it->second;
    }
};

Options ParseOptions(int argc, char** argv, const std::vector<std::string>& valued) {
    Options options;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            bool takes_value = false;
            for (const auto& name : valued) {
                takes_value = takes_value || name == arg;
            }
            if (takes_value && i + 1 < argc) {
                options.values[arg] = argv[++i];
            } else {
                options.flags.push_back(arg);
            }
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

int Report(const PairingError& error) {
    std::cerr << "[pairkitcli] " << pairkit::core::tournament::ErrorKindName(error.kind) << ": " << error.message
              << '\n';
    return 2;
}

bool LoadInputs(const std::string& tournament_path,
                const std::string& config_path,
                TournamentState& state,
                EngineConfig& config) {
    std::string error;
    if (!pairkit::core::persist::LoadTournament(tournament_path, state, &error)) {
        std::cerr << "[pairkitcli] " << error << '\n';
        return false;
    }
    if (!config_path.empty() && !EngineConfig::LoadFromFile(config_path, config, &error)) {
        std::cerr << "[pairkitcli] " << error << '\n';
        return false;
    }
    return true;
}

bool Save(const std::string& path, const TournamentState& state) {
    std::string error;
    if (!pairkit::core::persist::SaveTournament(path, state, &error)) {
        std::cerr << "[pairkitcli] Failed to save tournament: " << error << '\n';
        return false;
    }
    return true;
}

int RunPair(PairingEngine& engine, const Options& options) {
    if (options.positional.size() < 2) {
        PrintUsage();
        return 1;
    }
    TournamentState state;
    EngineConfig config;
    if (!LoadInputs(options.positional[0], options.positional[1], state, config)) {
        return 1;
    }
    int round_number = static_cast<int>(state.rounds.size()) + 1;
    if (!options.Value("--round").empty() && !ParseInt(options.Value("--round"), round_number)) {
        std::cerr << "[pairkitcli] Invalid round: " << options.Value("--round") << '\n';
        return 1;
    }

    pairkit::core::api::PairingOutcome outcome;
    PairingError error;
    if (!engine.GeneratePairings(state, round_number, config, outcome, &error)) {
        return Report(error);
    }
    if (!Save(options.positional[0], state)) {
        return 1;
    }

    const std::string payload = pairkit::core::exporter::FormatPairingOutcomeJson(outcome);
    const std::string out_path = options.Value("--out");
    if (out_path.empty()) {
        std::cout << payload << '\n';
    } else if (!pairkit::core::util::AtomicFileWriter::Write(out_path, payload)) {
        return 1;
    }
    if (outcome.exhausted) {
        std::cerr << "[pairkitcli] Best-effort pairing with " << outcome.deviations.size()
                  << " deviation(s); review before publishing." << '\n';
    }
    return 0;
}

int RunRecord(PairingEngine& engine, const Options& options) {
    if (options.positional.size() < 3) {
        PrintUsage();
        return 1;
    }
    TournamentState state;
    EngineConfig unused;
    if (!LoadInputs(options.positional[0], {}, state, unused)) {
        return 1;
    }
    int round_number = 0;
    if (!ParseInt(options.positional[1], round_number)) {
        std::cerr << "[pairkitcli] Invalid round: " << options.positional[1] << '\n';
        return 1;
    }
    std::vector<pairkit::core::api::ResultEntry> results;
    std::string load_error;
    if (!pairkit::core::persist::LoadResults(options.positional[2], results, &load_error)) {
        std::cerr << "[pairkitcli] " << load_error << '\n';
        return 1;
    }

    PairingError error;
    if (!engine.RecordResults(state, round_number, results, options.Has("--correction"), &error)) {
        return Report(error);
    }
    return Save(options.positional[0], state) ? 0 : 1;
}

int RunCorrect(PairingEngine& engine, const Options& options) {
    if (options.positional.size() < 5) {
        PrintUsage();
        return 1;
    }
    TournamentState state;
    EngineConfig config;
    if (!LoadInputs(options.positional[0], options.positional[1], state, config)) {
        return 1;
    }
    int round_number = 0;
    if (!ParseInt(options.positional[2], round_number)) {
        std::cerr << "[pairkitcli] Invalid round: " << options.positional[2] << '\n';
        return 1;
    }
    pairkit::core::tournament::GameResult result;
    if (!pairkit::core::tournament::ParseGameResult(options.positional[4], result)) {
        std::cerr << "[pairkitcli] Unknown result: " << options.positional[4] << '\n';
        return 1;
    }

    pairkit::core::api::CorrectionOutcome outcome;
    PairingError error;
    if (!engine.CorrectResult(state, round_number, options.positional[3], result, config, outcome, &error)) {
        return Report(error);
    }
    if (!Save(options.positional[0], state)) {
        return 1;
    }
    if (outcome.repaired) {
        std::cout << pairkit::core::exporter::FormatPairingOutcomeJson(outcome.repairing) << '\n';
    }
    return 0;
}

int RunStandings(PairingEngine& engine, const Options& options) {
    if (options.positional.size() < 2) {
        PrintUsage();
        return 1;
    }
    TournamentState state;
    EngineConfig config;
    if (!LoadInputs(options.positional[0], options.positional[1], state, config)) {
        return 1;
    }
    const std::string event_name = state.name.empty() ? state.id : state.name;
    const std::string section = options.Value("--section");
    PairingError error;

    if (options.Has("--teams")) {
        std::vector<pairkit::core::stats::TeamStanding> teams;
        if (!engine.ComputeTeamStandings(state, section, config, teams, &error)) {
            return Report(error);
        }
        std::cout << pairkit::core::exporter::FormatTeamStandingsCsv(teams);
        return 0;
    }

    std::map<std::string, std::vector<pairkit::core::stats::RankedStanding>> sections;
    if (options.values.count("--section") > 0) {
        std::vector<pairkit::core::stats::RankedStanding> rows;
        if (!engine.ComputeStandings(state, section, config, rows, &error)) {
            return Report(error);
        }
        sections.emplace(section, std::move(rows));
    } else if (!engine.ComputeAllStandings(state, config, sections, &error)) {
        return Report(error);
    }

    bool ok = true;
    for (const auto& item : sections) {
        if (sections.size() > 1) {
            std::cout << "# " << item.first << '\n';
        }
        std::cout << pairkit::core::exporter::FormatStandingsCsv(item.second);
    }
    if (!options.Value("--json").empty()) {
        ok = pairkit::core::exporter::WriteStandingsJson(options.Value("--json"), event_name, sections) && ok;
    }
    if (!options.Value("--csv").empty() && !sections.empty()) {
        ok = pairkit::core::exporter::WriteStandingsCsv(options.Value("--csv"), sections.begin()->second) && ok;
    }
    if (!options.Value("--html").empty() && !sections.empty()) {
        ok = pairkit::core::exporter::WriteStandingsHtml(
                 options.Value("--html"), event_name, sections.begin()->first, sections.begin()->second) &&
             ok;
    }
    return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    PairingEngine engine;
    engine.setLogSink([](const std::string& line) { std::cerr << line << '\n'; });

    const std::string command = argv[1];
    if (command == "pair") {
        return RunPair(engine, ParseOptions(argc, argv, {"--round", "--out"}));
    }
    if (command == "record") {
        return RunRecord(engine, ParseOptions(argc, argv, {}));
    }
    if (command == "correct") {
        return RunCorrect(engine, ParseOptions(argc, argv, {}));
    }
    if (command == "standings") {
        return RunStandings(engine, ParseOptions(argc, argv, {"--section", "--csv", "--html", "--json"}));
    }

    std::cerr << "[pairkitcli] Unknown command: " << command << '\n';
    PrintUsage();
    return 1;
}
