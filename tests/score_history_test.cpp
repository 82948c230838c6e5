#include <gtest/gtest.h>

#include "TestHelpers.h"

#include "pairkit/core/history/ScoreHistory.h"

namespace {

using pairkit::core::history::EntryKind;
using pairkit::core::history::ScoreHistory;
using pairkit::core::history::ScoringRules;
using pairkit::core::tournament::ByeType;
using pairkit::core::tournament::Color;
using pairkit::core::tournament::GameResult;
using pairkit::core::tournament::PlayerRegistry;
using pairkit::core::tournament::TournamentState;
using pairkit::test::AddRound;
using pairkit::test::Bye;
using pairkit::test::Game;
using pairkit::test::MakeField;

TournamentState TwoRoundState() {
    TournamentState state = MakeField(4);
    AddRound(state, {Game("r1b1", "p1", "p2", GameResult::kWhiteWins), Game("r1b2", "p3", "p4", GameResult::kDraw)});
    AddRound(state, {Game("r2b1", "p1", "p3", GameResult::kWhiteForfeitWin),
                     Bye("r2b2", "p2", ByeType::kPairingAllocated)});
    return state;
}

bool BuildHistory(const TournamentState& state, int through_round, ScoreHistory& history, std::string* error = nullptr) {
    PlayerRegistry registry;
    if (!PlayerRegistry::Build(state, registry, error)) {
        return false;
    }
    return ScoreHistory::Build(state, registry, ScoringRules{}, through_round, history, error);
}

TEST(ScoreHistoryTest, ReplaysGamesForfeitsAndByes) {
    ScoreHistory history;
    std::string error;
    ASSERT_TRUE(BuildHistory(TwoRoundState(), -1, history, &error)) << error;
    EXPECT_EQ(history.rounds_replayed(), 2);

    const auto& p1 = history.At("p1");
    EXPECT_EQ(p1.score, 4);
    EXPECT_EQ(p1.forfeit_wins, 1);
    EXPECT_TRUE(p1.ReceivedUnplayedPoint());
    EXPECT_EQ(p1.whites, 1);
    EXPECT_EQ(p1.blacks, 0);
    EXPECT_EQ(p1.ScoreAfter(1), 2);
    EXPECT_TRUE(p1.Met("p2"));
    EXPECT_TRUE(p1.Met("p3"));

    const auto& p2 = history.At("p2");
    EXPECT_EQ(p2.score, 2);
    EXPECT_EQ(p2.pairing_allocated_byes, 1);
    EXPECT_EQ(p2.rounds[1].kind, EntryKind::kBye);

    const auto& p3 = history.At("p3");
    EXPECT_EQ(p3.score, 1);
    EXPECT_EQ(p3.rounds[1].kind, EntryKind::kForfeitLoss);
    EXPECT_EQ(p3.last_color, Color::kWhite);

    const auto& p4 = history.At("p4");
    EXPECT_EQ(p4.score, 1);
    EXPECT_EQ(p4.rounds[1].kind, EntryKind::kAbsent);
    EXPECT_FALSE(p4.ReceivedUnplayedPoint());
}

TEST(ScoreHistoryTest, EveryPlayerHasOneEntryPerReplayedRound) {
    ScoreHistory history;
    ASSERT_TRUE(BuildHistory(TwoRoundState(), -1, history));
    for (const auto& item : history.players()) {
        EXPECT_EQ(item.second.rounds.size(), 2u) << item.first;
    }
}

TEST(ScoreHistoryTest, StopsAtRequestedRound) {
    ScoreHistory history;
    ASSERT_TRUE(BuildHistory(TwoRoundState(), 1, history));
    EXPECT_EQ(history.rounds_replayed(), 1);
    EXPECT_EQ(history.At("p1").score, 2);
    EXPECT_EQ(history.At("p2").pairing_allocated_byes, 0);
}

TEST(ScoreHistoryTest, ByeValuesFollowConfiguration) {
    pairkit::core::api::ByeConfig byes;
    byes.pairing_allocated = 0.5;
    const auto rules = ScoringRules::FromConfig(byes);
    EXPECT_EQ(rules.ByeValue(ByeType::kPairingAllocated), 1);
    EXPECT_EQ(rules.ByeValue(ByeType::kHalfPoint), 1);
    EXPECT_EQ(rules.ByeValue(ByeType::kZeroPoint), 0);
}

TEST(ScoreHistoryTest, RejectsUnknownPlayer) {
    TournamentState state = MakeField(2);
    AddRound(state, {Game("r1b1", "p1", "ghost", GameResult::kWhiteWins)});
    ScoreHistory history;
    std::string error;
    EXPECT_FALSE(BuildHistory(state, -1, history, &error));
    EXPECT_NE(error.find("unknown player ghost"), std::string::npos);
}

TEST(ScoreHistoryTest, RejectsPlayerPairedTwiceInRound) {
    TournamentState state = MakeField(3);
    AddRound(state, {Game("r1b1", "p1", "p2", GameResult::kWhiteWins), Game("r1b2", "p3", "p1", GameResult::kDraw)});
    ScoreHistory history;
    std::string error;
    EXPECT_FALSE(BuildHistory(state, -1, history, &error));
    EXPECT_NE(error.find("appears twice"), std::string::npos);
}

TEST(ScoreHistoryTest, RejectsResultOnBye) {
    TournamentState state = MakeField(1);
    auto bye = Bye("r1b1", "p1", ByeType::kFullPoint);
    bye.result = GameResult::kWhiteWins;
    AddRound(state, {bye});
    ScoreHistory history;
    EXPECT_FALSE(BuildHistory(state, -1, history));
}

}  // namespace
