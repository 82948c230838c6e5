#include <gtest/gtest.h>

#include "TestHelpers.h"

#include "pairkit/core/tournament/DutchPairer.h"
#include "pairkit/core/tournament/PairingErrors.h"
#include "pairkit/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <map>

namespace {

using pairkit::core::api::PairingOutcome;
using pairkit::core::tournament::ByeType;
using pairkit::core::tournament::ColorRules;
using pairkit::core::tournament::Contender;
using pairkit::core::tournament::DeviationKind;
using pairkit::core::tournament::DutchPairer;
using pairkit::core::tournament::ErrorKind;
using pairkit::core::tournament::PairingError;
using pairkit::core::tournament::SearchBudget;
using pairkit::core::tournament::SearchStage;
using pairkit::core::tournament::SwissPairing;
using pairkit::test::EngineConfig;
using pairkit::test::HigherRatedWins;
using pairkit::test::MakeField;
using pairkit::test::PairingEngine;
using pairkit::test::PlayersOf;
using pairkit::test::PlayRound;

std::vector<Contender> Contenders(const std::vector<int>& scores) {
    std::vector<Contender> contenders;
    for (size_t i = 0; i < scores.size(); ++i) {
        Contender contender;
        contender.id = "c" + std::to_string(i + 1);
        contender.score = scores[i];
        contender.rating = 2000 - static_cast<int>(i) * 10;
        contenders.push_back(contender);
    }
    return contenders;
}

void MarkMet(std::vector<Contender>& contenders, size_t a, size_t b) {
    contenders[a].opponents.push_back(contenders[b].id);
    contenders[b].opponents.push_back(contenders[a].id);
}

bool HasPair(const pairkit::core::tournament::DutchResult& result, int a, int b) {
    for (const auto& pair : result.pairs) {
        if ((pair.higher == a && pair.lower == b) || (pair.higher == b && pair.lower == a)) {
            return true;
        }
    }
    return false;
}

TEST(DutchPairerTest, PairsTopHalfAgainstBottomHalf) {
    const DutchPairer pairer(ColorRules{}, SearchBudget{});
    const auto result = pairer.Pair(Contenders({0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(result.stage, SearchStage::kStrict);
    ASSERT_EQ(result.pairs.size(), 3u);
    EXPECT_TRUE(HasPair(result, 0, 3));
    EXPECT_TRUE(HasPair(result, 1, 4));
    EXPECT_TRUE(HasPair(result, 2, 5));
}

TEST(DutchPairerTest, TransposesToAvoidRematch) {
    auto contenders = Contenders({0, 0, 0, 0});
    MarkMet(contenders, 0, 2);
    const DutchPairer pairer(ColorRules{}, SearchBudget{});
    const auto result = pairer.Pair(contenders);
    EXPECT_EQ(result.stage, SearchStage::kStrict);
    EXPECT_TRUE(HasPair(result, 0, 3));
    EXPECT_TRUE(HasPair(result, 1, 2));
}

TEST(DutchPairerTest, OddScoreGroupFloatsDown) {
    const DutchPairer pairer(ColorRules{}, SearchBudget{});
    const auto result = pairer.Pair(Contenders({2, 2, 2, 0, 0, 0}));
    EXPECT_EQ(result.stage, SearchStage::kStrict);
    ASSERT_EQ(result.pairs.size(), 3u);
    EXPECT_TRUE(result.unpaired.empty());
    EXPECT_TRUE(HasPair(result, 0, 1));
    // The floater heads S1 of the next bracket.
    EXPECT_TRUE(HasPair(result, 2, 4));
    EXPECT_TRUE(HasPair(result, 3, 5));
}

TEST(DutchPairerTest, FallsBackWhenEveryoneHasMet) {
    auto contenders = Contenders({0, 0, 0, 0});
    for (size_t a = 0; a < contenders.size(); ++a) {
        for (size_t b = a + 1; b < contenders.size(); ++b) {
            MarkMet(contenders, a, b);
        }
    }
    const DutchPairer pairer(ColorRules{}, SearchBudget{});
    const auto result = pairer.Pair(contenders);
    EXPECT_EQ(result.stage, SearchStage::kRepeatsAllowed);
    EXPECT_TRUE(result.exhausted());
    EXPECT_EQ(result.pairs.size(), 2u);
}

TEST(DutchPairerTest, EightPlayerFirstRound) {
    auto state = MakeField(8);
    EngineConfig config;
    PairingEngine engine;
    PairingOutcome outcome;
    PairingError error;
    ASSERT_TRUE(engine.GeneratePairings(state, 1, config, outcome, &error)) << error.message;

    ASSERT_EQ(outcome.pairings.size(), 4u);
    const std::vector<std::set<std::string>> expected{{"p1", "p5"}, {"p2", "p6"}, {"p3", "p7"}, {"p4", "p8"}};
    for (size_t board = 0; board < expected.size(); ++board) {
        EXPECT_EQ(PlayersOf(outcome.pairings[board]), expected[board]) << "board " << board + 1;
        EXPECT_EQ(outcome.pairings[board].board, static_cast<int>(board) + 1);
    }
    EXPECT_EQ(outcome.pairings[0].white_id, "p1");
    EXPECT_EQ(outcome.pairings[1].white_id, "p6");
    EXPECT_TRUE(outcome.deviations.empty());
    EXPECT_FALSE(outcome.exhausted);
}

TEST(DutchPairerTest, OddFieldGivesOneByePerRoundToDifferentPlayers) {
    auto state = MakeField(9);
    EngineConfig config;
    config.rounds = 5;
    PairingEngine engine;
    const auto result_for = HigherRatedWins(state);

    std::set<std::string> bye_players;
    std::set<std::pair<std::string, std::string>> games;
    for (int round = 1; round <= config.rounds; ++round) {
        PairingError error;
        ASSERT_TRUE(PlayRound(engine, state, round, config, result_for, &error)) << error.message;

        int byes = 0;
        for (const auto& pairing : state.FindRound(round)->pairings) {
            if (pairing.is_bye) {
                ++byes;
                EXPECT_EQ(pairing.bye_type, ByeType::kPairingAllocated);
                EXPECT_TRUE(bye_players.insert(pairing.white_id).second) << pairing.white_id << " had a bye already";
                continue;
            }
            const auto key = std::minmax(pairing.white_id, pairing.black_id);
            EXPECT_TRUE(games.insert(key).second) << key.first << " met " << key.second << " twice";
        }
        EXPECT_EQ(byes, 1) << "round " << round;
    }
}

TEST(DutchPairerTest, SecondByesWaitUntilEveryoneHasOne) {
    auto state = MakeField(5);
    EngineConfig config;
    config.rounds = 8;
    PairingEngine engine;
    const auto result_for = HigherRatedWins(state);

    std::map<std::string, int> byes;
    for (const auto& player : state.players) {
        byes[player.id] = 0;
    }
    for (int round = 1; round <= config.rounds; ++round) {
        PairingError error;
        ASSERT_TRUE(PlayRound(engine, state, round, config, result_for, &error)) << error.message;
        for (const auto& pairing : state.FindRound(round)->pairings) {
            if (pairing.is_bye) {
                byes[pairing.white_id] += 1;
            }
        }
        int fewest = config.rounds;
        int most = 0;
        for (const auto& item : byes) {
            fewest = std::min(fewest, item.second);
            most = std::max(most, item.second);
        }
        EXPECT_LE(most - fewest, 1) << "round " << round;
    }
    for (const auto& item : byes) {
        EXPECT_GE(item.second, 1) << item.first;
        EXPECT_LE(item.second, 2) << item.first;
    }
}

TEST(DutchPairerTest, ByeCandidatesShareOneIterationBudget) {
    auto contenders = Contenders({0, 0, 0, 0, 0, 0, 0, 0, 0});
    for (size_t a = 0; a < contenders.size(); ++a) {
        for (size_t b = a + 1; b < contenders.size(); ++b) {
            MarkMet(contenders, a, b);
        }
    }
    EngineConfig config;
    config.search.iteration_budget = 10;
    config.search.bye_candidates = 4;

    SwissPairing out;
    PairingError error;
    ASSERT_TRUE(pairkit::core::tournament::PairContenders(
        contenders, std::vector<bool>(contenders.size(), true), "", config, out, &error))
        << error.message;
    EXPECT_TRUE(out.search.budget_exhausted);
    EXPECT_LE(out.search.iterations, config.search.iteration_budget + 1);
    EXPECT_EQ(out.bye_index, 8);
    EXPECT_EQ(out.games.size(), 4u);

    config.search.fail_on_exhausted = true;
    EXPECT_FALSE(pairkit::core::tournament::PairContenders(
        contenders, std::vector<bool>(contenders.size(), true), "", config, out, &error));
    EXPECT_EQ(error.kind, ErrorKind::kExhaustedSearch);
}

TEST(DutchPairerTest, SameInputGivesSamePairings) {
    auto state = MakeField(12);
    EngineConfig config;
    PairingEngine engine;
    const auto result_for = HigherRatedWins(state);
    ASSERT_TRUE(PlayRound(engine, state, 1, config, result_for));
    ASSERT_TRUE(PlayRound(engine, state, 2, config, result_for));

    auto first = state;
    auto second = state;
    PairingOutcome a;
    PairingOutcome b;
    ASSERT_TRUE(engine.GeneratePairings(first, 3, config, a, nullptr));
    ASSERT_TRUE(PairingEngine().GeneratePairings(second, 3, config, b, nullptr));
    ASSERT_EQ(a.pairings.size(), b.pairings.size());
    for (size_t i = 0; i < a.pairings.size(); ++i) {
        EXPECT_EQ(a.pairings[i].white_id, b.pairings[i].white_id);
        EXPECT_EQ(a.pairings[i].black_id, b.pairings[i].black_id);
    }
}

TEST(DutchPairerTest, ExhaustedSearchIsReportedOrRefused) {
    auto state = MakeField(4);
    EngineConfig config;
    config.rounds = 4;
    PairingEngine engine;
    const auto result_for = HigherRatedWins(state);
    for (int round = 1; round <= 3; ++round) {
        PairingError error;
        ASSERT_TRUE(PlayRound(engine, state, round, config, result_for, &error)) << error.message;
    }

    auto strict_state = state;
    auto strict = config;
    strict.search.fail_on_exhausted = true;
    PairingOutcome outcome;
    PairingError error;
    EXPECT_FALSE(engine.GeneratePairings(strict_state, 4, strict, outcome, &error));
    EXPECT_EQ(error.kind, ErrorKind::kExhaustedSearch);
    EXPECT_EQ(strict_state.rounds.size(), 3u);

    ASSERT_TRUE(engine.GeneratePairings(state, 4, config, outcome, &error)) << error.message;
    EXPECT_TRUE(outcome.exhausted);
    std::map<DeviationKind, int> kinds;
    for (const auto& deviation : outcome.deviations) {
        kinds[deviation.kind] += 1;
    }
    EXPECT_EQ(kinds[DeviationKind::kSearchExhausted], 1);
    EXPECT_EQ(kinds[DeviationKind::kRepeatPairing], 2);
}

TEST(DutchPairerTest, WithdrawnAndRequestedByes) {
    auto state = MakeField(6);
    state.players[5].withdrawn = true;
    state.players[4].requested_bye_rounds = {1};
    EngineConfig config;
    PairingEngine engine;
    PairingOutcome outcome;
    PairingError error;
    ASSERT_TRUE(engine.GeneratePairings(state, 1, config, outcome, &error)) << error.message;

    ASSERT_EQ(outcome.pairings.size(), 3u);
    for (const auto& pairing : outcome.pairings) {
        EXPECT_FALSE(pairing.HasPlayer("p6"));
    }
    const auto& last = outcome.pairings.back();
    EXPECT_TRUE(last.is_bye);
    EXPECT_EQ(last.white_id, "p5");
    EXPECT_EQ(last.bye_type, ByeType::kHalfPoint);
}

}  // namespace
