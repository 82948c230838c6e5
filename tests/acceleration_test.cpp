#include <gtest/gtest.h>

#include "TestHelpers.h"

#include "pairkit/core/tournament/Acceleration.h"

namespace {

using pairkit::core::api::AccelerationType;
using pairkit::core::api::PairingMethod;
using pairkit::core::api::PairingOutcome;
using pairkit::core::api::PairingType;
using pairkit::core::tournament::Acceleration;
using pairkit::core::tournament::AccelerationStatus;
using pairkit::core::tournament::PairingError;
using pairkit::core::tournament::Player;
using pairkit::test::EngineConfig;
using pairkit::test::MakeField;
using pairkit::test::PairingEngine;
using pairkit::test::PlayersOf;

std::vector<const Player*> Pointers(const std::vector<Player>& players) {
    std::vector<const Player*> pointers;
    for (const auto& player : players) {
        pointers.push_back(&player);
    }
    return pointers;
}

EngineConfig Accelerated(AccelerationType type) {
    EngineConfig config;
    config.type = PairingType::kAccelerated;
    config.rounds = 3;
    config.acceleration.type = type;
    return config;
}

TEST(AccelerationTest, DefaultThresholdDoublesPerRound) {
    EXPECT_EQ(Acceleration::DefaultThreshold(3), 16);
    EXPECT_EQ(Acceleration::DefaultThreshold(5), 64);
}

TEST(AccelerationTest, StandardBreakPointIsEven) {
    EXPECT_EQ(Acceleration::StandardBreakPoint(12, 0), 6);
    EXPECT_EQ(Acceleration::StandardBreakPoint(10, 0), 6);
    EXPECT_EQ(Acceleration::StandardBreakPoint(9, 0), 6);
    EXPECT_EQ(Acceleration::StandardBreakPoint(20, 8), 8);
}

TEST(AccelerationTest, DisabledForStandardPairing) {
    const auto players = MakeField(40).players;
    const auto report = Acceleration::Evaluate("", Pointers(players), 1, EngineConfig{});
    EXPECT_EQ(report.status, AccelerationStatus::kDisabled);
    EXPECT_TRUE(report.virtual_points.empty());
}

TEST(AccelerationTest, StandardGivesTopHalfAVirtualPoint) {
    const auto players = MakeField(20).players;
    const auto report = Acceleration::Evaluate("", Pointers(players), 1, Accelerated(AccelerationType::kStandard));
    ASSERT_EQ(report.status, AccelerationStatus::kApplied);
    EXPECT_EQ(report.threshold, 16);
    EXPECT_EQ(report.break_point, 10);
    EXPECT_EQ(report.VirtualFor("p1"), 2);
    EXPECT_EQ(report.VirtualFor("p10"), 2);
    EXPECT_EQ(report.VirtualFor("p11"), 0);
}

TEST(AccelerationTest, OutsideWindowAndBelowThreshold) {
    const auto players = MakeField(20).players;
    const auto config = Accelerated(AccelerationType::kStandard);
    EXPECT_EQ(Acceleration::Evaluate("", Pointers(players), 3, config).status, AccelerationStatus::kOutsideWindow);

    const auto small = MakeField(16).players;
    EXPECT_EQ(Acceleration::Evaluate("", Pointers(small), 1, config).status, AccelerationStatus::kBelowThreshold);

    const auto all_rounds = Accelerated(AccelerationType::kAllRounds);
    EXPECT_EQ(Acceleration::Evaluate("", Pointers(players), 3, all_rounds).status, AccelerationStatus::kApplied);
}

TEST(AccelerationTest, SixthsStepsDownByHalfPoints) {
    const auto players = MakeField(24).players;
    const auto report = Acceleration::Evaluate("", Pointers(players), 1, Accelerated(AccelerationType::kSixths));
    ASSERT_TRUE(report.applied());
    EXPECT_EQ(report.break_point, 4);
    EXPECT_EQ(report.VirtualFor("p1"), 5);
    EXPECT_EQ(report.VirtualFor("p5"), 4);
    EXPECT_EQ(report.VirtualFor("p13"), 2);
    EXPECT_EQ(report.VirtualFor("p24"), 0);
}

TEST(AccelerationTest, AddedScoresAreKeptApart) {
    auto config = Accelerated(AccelerationType::kAddedScore);
    config.acceleration.added_scores = {1.0, 0.5, 0.0};
    const auto players = MakeField(18).players;
    const auto report = Acceleration::Evaluate("", Pointers(players), 1, config);
    ASSERT_TRUE(report.applied());
    EXPECT_TRUE(report.virtual_points.empty());
    EXPECT_EQ(report.AddedFor("p1"), 2);
    EXPECT_EQ(report.AddedFor("p7"), 1);
    EXPECT_EQ(report.AddedFor("p13"), 0);
}

TEST(AccelerationTest, AcceleratedFirstRoundPairsWithinHalves) {
    auto state = MakeField(20);
    const auto config = Accelerated(AccelerationType::kStandard);
    PairingEngine engine;
    PairingOutcome outcome;
    PairingError error;
    ASSERT_TRUE(engine.GeneratePairings(state, 1, config, outcome, &error)) << error.message;

    ASSERT_EQ(outcome.acceleration.size(), 1u);
    EXPECT_TRUE(outcome.acceleration.front().applied());
    EXPECT_EQ(PlayersOf(outcome.pairings[0]), (std::set<std::string>{"p1", "p6"}));
    EXPECT_EQ(PlayersOf(outcome.pairings[5]), (std::set<std::string>{"p11", "p16"}));
}

TEST(AccelerationTest, VirtualPointsNeverReachStandings) {
    auto state = MakeField(20);
    const auto config = Accelerated(AccelerationType::kStandard);
    PairingEngine engine;
    PairingOutcome outcome;
    ASSERT_TRUE(engine.GeneratePairings(state, 1, config, outcome, nullptr));

    std::vector<pairkit::core::stats::RankedStanding> standings;
    ASSERT_TRUE(engine.ComputeStandings(state, "", config, standings, nullptr));
    for (const auto& row : standings) {
        EXPECT_EQ(row.stats.score, 0) << row.player_id();
    }
}

TEST(AccelerationTest, OnlySwissPairingCanBeAccelerated) {
    auto config = Accelerated(AccelerationType::kStandard);
    config.method = PairingMethod::kRoundRobin;
    std::string error;
    EXPECT_FALSE(config.Validate(&error));
    EXPECT_NE(error.find("fide_dutch"), std::string::npos);
}

}  // namespace
