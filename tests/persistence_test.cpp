#include <gtest/gtest.h>

#include "TestHelpers.h"

#include "pairkit/core/export/ExportWriter.h"
#include "pairkit/core/persist/TournamentSnapshot.h"
#include "pairkit/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

using pairkit::core::api::AccelerationType;
using pairkit::core::api::PairingMethod;
using pairkit::core::api::PairingType;
using pairkit::core::api::ResultEntry;
using pairkit::core::api::TiebreakCriterion;
using pairkit::core::api::UnplayedRoundPolicy;
using pairkit::core::stats::RankedStanding;
using pairkit::core::tournament::ByeType;
using pairkit::core::tournament::Color;
using pairkit::core::tournament::GameResult;
using pairkit::core::tournament::RoundStatus;
using pairkit::core::tournament::TournamentState;
using pairkit::core::util::AtomicFileWriter;
using pairkit::test::AddRound;
using pairkit::test::Bye;
using pairkit::test::EngineConfig;
using pairkit::test::Game;
using pairkit::test::MakeField;
using pairkit::test::PairingEngine;

namespace persist = pairkit::core::persist;
namespace exporter = pairkit::core::exporter;

std::filesystem::path TempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("pairkit_test_" + name);
}

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

TEST(SnapshotTest, TournamentSurvivesSerialization) {
    auto state = MakeField(3);
    state.players[1].withdrawn = true;
    state.players[2].requested_bye_rounds = {2, 3};
    state.players[2].section = "Reserve";
    AddRound(state, {Game("R1-1", "p1", "p2", GameResult::kWhiteForfeitWin), Bye("R1-2", "p3", ByeType::kHalfPoint)});

    TournamentState loaded;
    std::string error;
    ASSERT_TRUE(persist::ParseTournament(persist::SerializeTournament(state), loaded, &error)) << error;
    EXPECT_EQ(loaded.id, "event");
    EXPECT_EQ(loaded.name, "Test Open");
    ASSERT_EQ(loaded.players.size(), 3u);
    EXPECT_TRUE(loaded.players[1].withdrawn);
    EXPECT_EQ(loaded.players[2].requested_bye_rounds, (std::vector<int>{2, 3}));
    EXPECT_EQ(loaded.players[2].section, "Reserve");

    ASSERT_EQ(loaded.rounds.size(), 1u);
    EXPECT_EQ(loaded.rounds[0].status, RoundStatus::kComplete);
    const auto& pairings = loaded.rounds[0].pairings;
    ASSERT_EQ(pairings.size(), 2u);
    EXPECT_EQ(pairings[0].result, GameResult::kWhiteForfeitWin);
    EXPECT_EQ(pairings[0].board, 1);
    EXPECT_TRUE(pairings[1].is_bye);
    EXPECT_EQ(pairings[1].bye_type, ByeType::kHalfPoint);
}

TEST(SnapshotTest, PairingNumbersAreKeptAcrossReload) {
    auto state = MakeField(4);
    state.players[0].rating = 1000;
    PairingEngine engine;
    pairkit::core::api::PairingOutcome outcome;
    ASSERT_TRUE(engine.GeneratePairings(state, 1, EngineConfig(), outcome, nullptr));
    EXPECT_EQ(state.players[0].pairing_number, 4);
    EXPECT_EQ(state.players[1].pairing_number, 1);

    TournamentState loaded;
    std::string error;
    ASSERT_TRUE(persist::ParseTournament(persist::SerializeTournament(state), loaded, &error)) << error;
    ASSERT_EQ(loaded.players.size(), state.players.size());
    for (size_t i = 0; i < loaded.players.size(); ++i) {
        EXPECT_EQ(loaded.players[i].pairing_number, state.players[i].pairing_number) << loaded.players[i].id;
    }
}

TEST(SnapshotTest, RejectsBrokenInput) {
    TournamentState state = MakeField(2);
    std::string error;
    EXPECT_FALSE(persist::ParseTournament("{ not json", state, &error));
    EXPECT_NE(error.find("Failed to parse tournament"), std::string::npos);
    EXPECT_EQ(state.players.size(), 2u);

    const std::string future = R"({"version": 99, "players": []})";
    EXPECT_FALSE(persist::ParseTournament(future, state, &error));
    EXPECT_NE(error.find("version 99"), std::string::npos);

    const std::string bad_result = R"({"rounds": [{"number": 1, "pairings": [{"id": "R1-1", "result": "2-0"}]}]})";
    EXPECT_FALSE(persist::ParseTournament(bad_result, state, &error));
    EXPECT_NE(error.find("unknown result '2-0'"), std::string::npos);
}

TEST(SnapshotTest, ResultsFileAcceptsNotationVariants) {
    std::vector<ResultEntry> results;
    std::string error;
    const std::string payload = R"([
        {"pairing_id": "R2-1", "result": "1-0"},
        {"pairing_id": "R2-2", "result": "="},
        {"pairing_id": "R2-3", "result": "-:+"}
    ])";
    ASSERT_TRUE(persist::ParseResults(payload, results, &error)) << error;
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].result, GameResult::kWhiteWins);
    EXPECT_EQ(results[1].result, GameResult::kDraw);
    EXPECT_EQ(results[2].pairing_id, "R2-3");
    EXPECT_EQ(results[2].result, GameResult::kBlackForfeitWin);

    EXPECT_FALSE(persist::ParseResults(R"({"pairing_id": "R2-1"})", results, &error));
    EXPECT_EQ(error, "Results must be a JSON array");
    EXPECT_FALSE(persist::ParseResults(R"([{"pairing_id": "R2-1", "result": "win"}])", results, &error));
    EXPECT_EQ(results.size(), 3u);
}

TEST(SnapshotTest, SaveAndLoadThroughDisk) {
    const auto path = TempPath("snapshot.json");
    const auto state = MakeField(4);
    std::string error;
    ASSERT_TRUE(persist::SaveTournament(path.string(), state, &error)) << error;
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    TournamentState loaded;
    ASSERT_TRUE(persist::LoadTournament(path.string(), loaded, &error)) << error;
    EXPECT_EQ(loaded.players.size(), 4u);
    std::filesystem::remove(path);

    EXPECT_FALSE(persist::LoadTournament(TempPath("missing.json").string(), loaded, &error));
    EXPECT_NE(error.find("Failed to open tournament"), std::string::npos);
}

TEST(EngineConfigTest, LoadsNestedSections) {
    const std::string payload = R"({
        "method": "fide_dutch",
        "pairing_type": "accelerated",
        "rounds": 7,
        "acceleration": {"type": "sixths", "rounds": 3},
        "byes": {"pairing_allocated": 0.5},
        "colors": {"alternation_limit": 3, "initial_color": "black"},
        "search": {"fail_on_exhausted": true},
        "tiebreaks": {"criteria": ["direct_encounter", "sonneborn_berger"], "unplayed_policy": "zero"}
    })";
    EngineConfig config;
    std::string error;
    ASSERT_TRUE(EngineConfig::LoadFromJson(payload, config, &error)) << error;
    EXPECT_EQ(config.method, PairingMethod::kFideDutch);
    EXPECT_EQ(config.type, PairingType::kAccelerated);
    EXPECT_EQ(config.rounds, 7);
    EXPECT_EQ(config.acceleration.type, AccelerationType::kSixths);
    EXPECT_EQ(config.acceleration.rounds, 3);
    EXPECT_DOUBLE_EQ(config.byes.pairing_allocated, 0.5);
    EXPECT_DOUBLE_EQ(config.byes.half_point, 0.5);
    EXPECT_EQ(config.colors.alternation_limit, 3);
    EXPECT_EQ(config.colors.equalization_limit, 2);
    EXPECT_EQ(config.colors.initial_color, Color::kBlack);
    EXPECT_TRUE(config.search.fail_on_exhausted);
    EXPECT_EQ(config.tiebreaks.criteria,
              (std::vector<TiebreakCriterion>{TiebreakCriterion::kDirectEncounter,
                                              TiebreakCriterion::kSonnebornBerger}));
    EXPECT_EQ(config.tiebreaks.unplayed_policy, UnplayedRoundPolicy::kZero);
    EXPECT_TRUE(config.Validate(&error)) << error;

    EngineConfig reloaded;
    ASSERT_TRUE(EngineConfig::LoadFromJson(EngineConfig::ToJsonString(config), reloaded, &error)) << error;
    EXPECT_EQ(reloaded.rounds, 7);
    EXPECT_EQ(reloaded.acceleration.type, AccelerationType::kSixths);
    EXPECT_EQ(reloaded.tiebreaks.criteria, config.tiebreaks.criteria);
}

TEST(EngineConfigTest, RejectsUnknownNames) {
    EngineConfig config;
    std::string error;
    EXPECT_FALSE(EngineConfig::LoadFromJson(R"({"method": "monrad"})", config, &error));
    EXPECT_EQ(error, "Unknown pairing method: monrad");
    EXPECT_FALSE(EngineConfig::LoadFromJson(R"({"tiebreaks": {"criteria": ["coin_flip"]}})", config, &error));
    EXPECT_EQ(error, "Unknown tiebreak criterion: coin_flip");
    EXPECT_FALSE(EngineConfig::LoadFromJson("[1, 2]", config, &error));
    EXPECT_FALSE(EngineConfig::LoadFromJson(R"({"rounds": "five"})", config, &error));
    EXPECT_NE(error.find("Invalid config value"), std::string::npos);
}

TEST(EngineConfigTest, ValidateCatchesInconsistentSettings) {
    EngineConfig config;
    std::string error;
    EXPECT_TRUE(config.Validate(&error));

    config.byes.half_point = 0.3;
    EXPECT_FALSE(config.Validate(&error));

    config = EngineConfig{};
    config.tiebreaks.criteria = {TiebreakCriterion::kKoya, TiebreakCriterion::kKoya};
    EXPECT_FALSE(config.Validate(&error));
    EXPECT_NE(error.find("Tiebreak listed twice"), std::string::npos);

    config = EngineConfig{};
    config.method = PairingMethod::kQuad;
    config.rounds = 3;
    EXPECT_TRUE(config.Validate(&error)) << error;
}

TEST(ExportTest, StandingsCsvMarksSharedRanks) {
    auto state = MakeField(2);
    AddRound(state, {Game("R1-1", "p1", "p2", GameResult::kDraw)});
    EngineConfig config;
    config.tiebreaks.criteria = {TiebreakCriterion::kBuchholz};
    PairingEngine engine;
    std::vector<RankedStanding> standings;
    pairkit::core::tournament::PairingError error;
    ASSERT_TRUE(engine.ComputeStandings(state, "", config, standings, &error)) << error.message;

    const auto csv = exporter::FormatStandingsCsv(standings);
    std::istringstream lines(csv);
    std::string header;
    std::string first;
    std::getline(lines, header);
    std::getline(lines, first);
    EXPECT_EQ(header, "rank,id,name,rating,pts,g,w,d,l,byes,buchholz");
    EXPECT_EQ(first, "1=,p1,Player p1,2400,0.5,1,0,1,0,0,0.5");
}

TEST(ExportTest, PairingsCsvListsByeType) {
    TournamentState state = MakeField(3);
    AddRound(state, {Game("R1-1", "p1", "p2", GameResult::kBlackWins), Bye("R1-2", "p3", ByeType::kPairingAllocated)});
    const auto csv = exporter::FormatPairingsCsv(state.rounds[0]);
    EXPECT_NE(csv.find("1,,1,R1-1,p1,p2,0-1,,\n"), std::string::npos);
    EXPECT_NE(csv.find("1,,2,R1-2,p3,,,pairing_allocated,\n"), std::string::npos);
}

TEST(ExportTest, CsvFieldsWithCommasAreQuoted) {
    auto state = MakeField(2);
    state.players[0].name = "Carlsen, Magnus";
    PairingEngine engine;
    std::vector<RankedStanding> standings;
    ASSERT_TRUE(engine.ComputeStandings(state, "", EngineConfig{}, standings, nullptr));
    EXPECT_NE(exporter::FormatStandingsCsv(standings).find("\"Carlsen, Magnus\""), std::string::npos);
}

TEST(AtomicFileWriterTest, ReplacesExistingFile) {
    const auto dir = TempPath("atomic");
    const auto path = dir / "nested" / "out.txt";
    std::string error;
    ASSERT_TRUE(AtomicFileWriter::Write(path.string(), "first", &error)) << error;
    ASSERT_TRUE(AtomicFileWriter::Write(path.string(), "second", &error)) << error;
    EXPECT_EQ(ReadAll(path), "second");
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
    std::filesystem::remove_all(dir);
}

}  // namespace
