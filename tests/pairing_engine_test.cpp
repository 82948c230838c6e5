#include <gtest/gtest.h>

#include "TestHelpers.h"

#include "pairkit/core/history/ScoreHistory.h"

#include <map>
#include <thread>

namespace {

using pairkit::core::api::CorrectionOutcome;
using pairkit::core::api::PairingOutcome;
using pairkit::core::api::ResultEntry;
using pairkit::core::history::ScoreHistory;
using pairkit::core::history::ScoringRules;
using pairkit::core::stats::RankedStanding;
using pairkit::core::tournament::ErrorKind;
using pairkit::core::tournament::GameResult;
using pairkit::core::tournament::PairingError;
using pairkit::core::tournament::PlayerRegistry;
using pairkit::core::tournament::RoundStatus;
using pairkit::core::tournament::TournamentState;
using pairkit::test::EngineConfig;
using pairkit::test::HigherRatedWins;
using pairkit::test::MakeField;
using pairkit::test::PairingEngine;
using pairkit::test::PlayRound;
using pairkit::test::ResultsFor;

class PairingEngineTest : public ::testing::Test {
protected:
    void PlayRounds(int rounds) {
        const auto result_for = HigherRatedWins(state_);
        for (int round = 1; round <= rounds; ++round) {
            PairingError error;
            ASSERT_TRUE(PlayRound(engine_, state_, round, config_, result_for, &error)) << error.message;
        }
    }

    TournamentState state_ = MakeField(8);
    EngineConfig config_;
    PairingEngine engine_;
};

TEST_F(PairingEngineTest, PairingIdsNameRoundSectionAndBoard) {
    EXPECT_EQ(PairingEngine::PairingIdFor(3, "", 2), "R3-2");
    EXPECT_EQ(PairingEngine::PairingIdFor(1, "Open", 4), "R1-Open-4");
}

TEST_F(PairingEngineTest, RoundsMustBePairedInOrder) {
    PairingOutcome outcome;
    PairingError error;
    EXPECT_FALSE(engine_.GeneratePairings(state_, 2, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);

    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, &error));
    EXPECT_FALSE(engine_.GeneratePairings(state_, 2, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("not complete"), std::string::npos);

    config_.rounds = 1;
    PlayRounds(1);
    EXPECT_FALSE(engine_.GeneratePairings(state_, 2, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("past the configured"), std::string::npos);
}

TEST_F(PairingEngineTest, LatestRoundCanBePairedAgainUntilResultsArrive) {
    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, nullptr));
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, nullptr));
    EXPECT_EQ(state_.rounds.size(), 1u);

    ASSERT_TRUE(engine_.RecordResults(state_, 1, {{"R1-1", GameResult::kDraw}}, false, nullptr));
    PairingError error;
    EXPECT_FALSE(engine_.GeneratePairings(state_, 1, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST_F(PairingEngineTest, InvalidConfigurationIsRefusedFirst) {
    config_.colors.alternation_limit = 0;
    PairingOutcome outcome;
    PairingError error;
    EXPECT_FALSE(engine_.GeneratePairings(state_, 1, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kInvalidConfiguration);
    EXPECT_TRUE(state_.rounds.empty());
}

TEST_F(PairingEngineTest, DuplicatePlayerIdIsAnIntegrityError) {
    state_.players.push_back(state_.players.front());
    PairingOutcome outcome;
    PairingError error;
    EXPECT_FALSE(engine_.GeneratePairings(state_, 1, config_, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kDataIntegrity);
}

TEST_F(PairingEngineTest, RecordResultsIsAllOrNothing) {
    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, nullptr));

    PairingError error;
    const std::vector<ResultEntry> with_unknown{{"R1-1", GameResult::kWhiteWins}, {"R1-9", GameResult::kDraw}};
    EXPECT_FALSE(engine_.RecordResults(state_, 1, with_unknown, false, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_EQ(state_.rounds[0].pairings[0].result, GameResult::kPending);

    const std::vector<ResultEntry> twice{{"R1-1", GameResult::kWhiteWins}, {"R1-1", GameResult::kDraw}};
    EXPECT_FALSE(engine_.RecordResults(state_, 1, twice, false, &error));
    EXPECT_FALSE(engine_.RecordResults(state_, 1, {{"R1-2", GameResult::kPending}}, false, &error));
    EXPECT_FALSE(engine_.RecordResults(state_, 2, {{"R2-1", GameResult::kDraw}}, false, &error));
}

TEST_F(PairingEngineTest, ByesTakeNoResult) {
    state_ = MakeField(7);
    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, nullptr));
    ASSERT_TRUE(outcome.pairings.back().is_bye);

    PairingError error;
    EXPECT_FALSE(engine_.RecordResults(state_, 1, {{outcome.pairings.back().id, GameResult::kWhiteWins}}, false, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST_F(PairingEngineTest, FinalizedRoundNeedsCorrectionFlag) {
    PlayRounds(1);
    EXPECT_EQ(state_.rounds[0].status, RoundStatus::kComplete);

    PairingError error;
    EXPECT_FALSE(engine_.RecordResults(state_, 1, {{"R1-1", GameResult::kDraw}}, false, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    ASSERT_TRUE(engine_.RecordResults(state_, 1, {{"R1-1", GameResult::kDraw}}, true, &error)) << error.message;
    EXPECT_EQ(state_.rounds[0].pairings[0].result, GameResult::kDraw);
}

TEST_F(PairingEngineTest, CorrectionFlagCannotChangeResultsBehindAPairedRound) {
    config_.rounds = 5;
    PlayRounds(3);
    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 4, config_, outcome, nullptr));
    const TournamentState before = state_;
    const GameResult original = state_.FindRound(3)->FindPairing("R3-1")->result;

    PairingError error;
    EXPECT_FALSE(engine_.RecordResults(state_, 3, {{"R3-1", GameResult::kDraw}}, true, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("use CorrectResult"), std::string::npos);
    EXPECT_EQ(state_.FindRound(3)->FindPairing("R3-1")->result, original);
    ASSERT_EQ(state_.rounds.size(), before.rounds.size());
    EXPECT_EQ(state_.FindRound(4)->pairings.size(), before.FindRound(4)->pairings.size());

    // The current round itself can still be corrected once its results are in.
    ASSERT_TRUE(engine_.RecordResults(state_, 4, ResultsFor(*state_.FindRound(4), HigherRatedWins(state_)), false,
                                      &error))
        << error.message;
    EXPECT_TRUE(engine_.RecordResults(state_, 3, {{"R3-1", GameResult::kDraw}}, true, &error)) << error.message;
}

TEST_F(PairingEngineTest, ScoresAddUpToGamesPlayed) {
    PlayRounds(3);
    std::vector<RankedStanding> standings;
    PairingError error;
    ASSERT_TRUE(engine_.ComputeStandings(state_, "", config_, standings, &error)) << error.message;
    ASSERT_EQ(standings.size(), 8u);
    double total = 0.0;
    for (const auto& row : standings) {
        total += row.score();
        EXPECT_EQ(row.stats.games, 3) << row.player_id();
    }
    EXPECT_DOUBLE_EQ(total, 12.0);
    EXPECT_EQ(standings.front().player_id(), "p1");
    EXPECT_EQ(standings.front().score(), 3.0);

    PlayerRegistry registry;
    ScoreHistory history;
    ASSERT_TRUE(PlayerRegistry::Build(state_, registry, nullptr));
    ASSERT_TRUE(ScoreHistory::Build(state_, registry, ScoringRules{}, -1, history, nullptr));
    for (const auto& item : history.players()) {
        EXPECT_EQ(item.second.rounds.size(), 3u);
        EXPECT_EQ(item.second.opponents.size(), 3u);
    }
}

TEST_F(PairingEngineTest, SectionsArePairedAndRankedApart) {
    state_ = MakeField(4, 2400, 100, "A");
    auto reserve = MakeField(4, 1800, 100, "B");
    for (auto& player : reserve.players) {
        player.id = "b" + player.id;
        state_.players.push_back(player);
    }
    PairingOutcome outcome;
    PairingError error;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, &error)) << error.message;
    ASSERT_EQ(outcome.pairings.size(), 4u);
    for (const auto& pairing : outcome.pairings) {
        const bool reserve_white = pairing.white_id.front() == 'b';
        const bool reserve_black = pairing.black_id.front() == 'b';
        EXPECT_EQ(reserve_white, reserve_black);
        EXPECT_EQ(pairing.section, reserve_white ? "B" : "A");
    }
    EXPECT_EQ(outcome.pairings[0].id, "R1-A-1");
    EXPECT_EQ(outcome.pairings[2].id, "R1-B-1");

    std::map<std::string, std::vector<RankedStanding>> sections;
    ASSERT_TRUE(engine_.ComputeAllStandings(state_, config_, sections, &error)) << error.message;
    EXPECT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections.at("B").size(), 4u);

    std::vector<RankedStanding> missing;
    EXPECT_FALSE(engine_.ComputeStandings(state_, "C", config_, missing, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST_F(PairingEngineTest, CorrectionRepairsPendingRoundLikeAFreshRun) {
    config_.rounds = 5;
    PlayRounds(3);
    const TournamentState after_three = state_;

    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 4, config_, outcome, nullptr));

    const auto* board_one = state_.FindRound(3)->FindPairing("R3-1");
    ASSERT_NE(board_one, nullptr);
    const GameResult flipped =
        board_one->result == GameResult::kWhiteWins ? GameResult::kBlackWins : GameResult::kWhiteWins;

    CorrectionOutcome correction;
    PairingError error;
    ASSERT_TRUE(engine_.CorrectResult(state_, 3, "R3-1", flipped, config_, correction, &error)) << error.message;
    EXPECT_TRUE(correction.repaired);
    EXPECT_EQ(state_.FindRound(3)->FindPairing("R3-1")->result, flipped);

    TournamentState fresh = after_three;
    PairingEngine other;
    ASSERT_TRUE(other.RecordResults(fresh, 3, {{"R3-1", flipped}}, true, nullptr));
    PairingOutcome expected;
    ASSERT_TRUE(other.GeneratePairings(fresh, 4, config_, expected, nullptr));

    const auto& repaired = state_.FindRound(4)->pairings;
    ASSERT_EQ(repaired.size(), expected.pairings.size());
    for (size_t i = 0; i < repaired.size(); ++i) {
        EXPECT_EQ(repaired[i].white_id, expected.pairings[i].white_id) << "board " << i + 1;
        EXPECT_EQ(repaired[i].black_id, expected.pairings[i].black_id) << "board " << i + 1;
    }

    // Round five follows from the corrected history in both states.
    const auto result_for = HigherRatedWins(state_);
    ASSERT_TRUE(engine_.RecordResults(state_, 4, ResultsFor(*state_.FindRound(4), result_for), false, nullptr));
    ASSERT_TRUE(other.RecordResults(fresh, 4, ResultsFor(*fresh.FindRound(4), result_for), false, nullptr));
    PairingOutcome fifth;
    PairingOutcome fresh_fifth;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 5, config_, fifth, nullptr));
    ASSERT_TRUE(other.GeneratePairings(fresh, 5, config_, fresh_fifth, nullptr));
    ASSERT_EQ(fifth.pairings.size(), fresh_fifth.pairings.size());
    for (size_t i = 0; i < fifth.pairings.size(); ++i) {
        EXPECT_EQ(fifth.pairings[i].white_id, fresh_fifth.pairings[i].white_id);
        EXPECT_EQ(fifth.pairings[i].black_id, fresh_fifth.pairings[i].black_id);
    }
}

TEST_F(PairingEngineTest, ConcurrentCorrectionAndPairingAgreeWithSerialRun) {
    config_.rounds = 5;
    PlayRounds(3);
    const TournamentState after_three = state_;
    const GameResult original = state_.FindRound(3)->FindPairing("R3-2")->result;
    const GameResult flipped =
        original == GameResult::kWhiteWins ? GameResult::kBlackWins : GameResult::kWhiteWins;

    TournamentState fresh = after_three;
    PairingEngine serial;
    ASSERT_TRUE(serial.RecordResults(fresh, 3, {{"R3-2", flipped}}, true, nullptr));
    PairingOutcome expected;
    ASSERT_TRUE(serial.GeneratePairings(fresh, 4, config_, expected, nullptr));

    for (int attempt = 0; attempt < 8; ++attempt) {
        TournamentState shared = after_three;
        PairingEngine engine;
        PairingOutcome first;
        ASSERT_TRUE(engine.GeneratePairings(shared, 4, config_, first, nullptr));

        bool corrected = false;
        bool paired = false;
        CorrectionOutcome correction;
        PairingOutcome second;
        std::thread corrector([&] {
            corrected = engine.CorrectResult(shared, 3, "R3-2", flipped, config_, correction, nullptr);
        });
        std::thread pairer([&] { paired = engine.GeneratePairings(shared, 4, config_, second, nullptr); });
        corrector.join();
        pairer.join();

        ASSERT_TRUE(corrected);
        ASSERT_TRUE(paired);
        EXPECT_EQ(shared.FindRound(3)->FindPairing("R3-2")->result, flipped);
        const auto& fourth = shared.FindRound(4)->pairings;
        ASSERT_EQ(fourth.size(), expected.pairings.size());
        for (size_t i = 0; i < fourth.size(); ++i) {
            EXPECT_EQ(fourth[i].white_id, expected.pairings[i].white_id) << "attempt " << attempt;
            EXPECT_EQ(fourth[i].black_id, expected.pairings[i].black_id) << "attempt " << attempt;
        }
    }
}

TEST_F(PairingEngineTest, AllSectionStandingsMatchSingleSectionQueries) {
    state_ = MakeField(6, 2400, 100, "A");
    auto reserve = MakeField(5, 1800, 100, "B");
    for (auto& player : reserve.players) {
        player.id = "b" + player.id;
        state_.players.push_back(player);
    }
    auto under = MakeField(4, 1400, 50, "C");
    for (auto& player : under.players) {
        player.id = "c" + player.id;
        state_.players.push_back(player);
    }
    PlayRounds(3);

    std::map<std::string, std::vector<RankedStanding>> all;
    PairingError error;
    ASSERT_TRUE(engine_.ComputeAllStandings(state_, config_, all, &error)) << error.message;
    ASSERT_EQ(all.size(), 3u);
    for (const auto& section : all) {
        std::vector<RankedStanding> single;
        ASSERT_TRUE(engine_.ComputeStandings(state_, section.first, config_, single, &error)) << error.message;
        ASSERT_EQ(single.size(), section.second.size()) << section.first;
        for (size_t i = 0; i < single.size(); ++i) {
            EXPECT_EQ(single[i].player_id(), section.second[i].player_id()) << section.first;
            EXPECT_EQ(single[i].rank, section.second[i].rank) << section.first;
            EXPECT_DOUBLE_EQ(single[i].score(), section.second[i].score()) << section.first;
        }
    }
}

TEST_F(PairingEngineTest, CorrectionLeavesPlayedRoundsAlone) {
    PlayRounds(2);
    const auto second = state_.rounds[1].pairings;

    CorrectionOutcome correction;
    PairingError error;
    ASSERT_TRUE(engine_.CorrectResult(state_, 1, "R1-2", GameResult::kDraw, config_, correction, &error))
        << error.message;
    EXPECT_FALSE(correction.repaired);
    ASSERT_EQ(state_.rounds[1].pairings.size(), second.size());
    EXPECT_EQ(state_.rounds[1].pairings[0].white_id, second[0].white_id);

    std::vector<RankedStanding> standings;
    ASSERT_TRUE(engine_.ComputeStandings(state_, "", config_, standings, &error));
    double total = 0.0;
    for (const auto& row : standings) {
        total += row.score();
    }
    EXPECT_DOUBLE_EQ(total, 8.0);
}

TEST_F(PairingEngineTest, CorrectionOfUnknownPairingChangesNothing) {
    PlayRounds(1);
    const auto before = state_.rounds[0].pairings[0].result;
    CorrectionOutcome correction;
    PairingError error;
    EXPECT_FALSE(engine_.CorrectResult(state_, 1, "R1-99", GameResult::kDraw, config_, correction, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_EQ(state_.rounds[0].pairings[0].result, before);
}

TEST_F(PairingEngineTest, LogKeepsRecentLinesAndFeedsSink) {
    std::vector<std::string> seen;
    engine_.setLogSink([&seen](const std::string& line) { seen.push_back(line); });
    PairingOutcome outcome;
    ASSERT_TRUE(engine_.GeneratePairings(state_, 1, config_, outcome, nullptr));
    ASSERT_FALSE(seen.empty());
    EXPECT_NE(engine_.getLastLogLines(1).find("Round 1 paired"), std::string::npos);
    EXPECT_EQ(engine_.getLastLogLines(1), seen.back());
}

}  // namespace
