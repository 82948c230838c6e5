#pragma once

#include "pairkit/core/tournament/ColorAllocator.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <chrono>
#include <string>
#include <vector>

namespace pairkit::core::tournament {

// One pairable unit: a player in individual events, a team in team swiss.
struct Contender {
    std::string id;
    HalfPoints score = 0;
    int rating = 0;
    ColorState colors;
    std::vector<std::string> opponents;
    // Pairing-allocated byes so far.
    int byes_received = 0;
};

struct SearchBudget {
    long long iterations = 200000;
    int time_ms = 2000;
};

// Iterations and wall-clock time left for one pairing call. Every search
// stage and every bye candidate draws on the same allowance.
class SearchAllowance {
public:
    explicit SearchAllowance(const SearchBudget& limits);

    bool Tick();
    bool exhausted() const { return exhausted_; }
    long long used() const { return used_; }

private:
    long long limit_;
    bool timed_;
    std::chrono::steady_clock::time_point deadline_;
    long long used_ = 0;
    bool exhausted_ = false;
};

struct DutchPair {
    int higher = -1;
    int lower = -1;
};

enum class SearchStage {
    kStrict,
    kColorsRelaxed,
    kRepeatsAllowed,
};

struct DutchResult {
    std::vector<DutchPair> pairs;
    std::vector<int> unpaired;
    SearchStage stage = SearchStage::kStrict;
    bool budget_exhausted = false;
    long long iterations = 0;

    bool exhausted() const { return stage != SearchStage::kStrict; }
};

// Bracket-by-bracket Dutch pairing over contenders given in ranking order
// (score descending, then rating). Brackets are searched with transpositions
// of S2, then S1/S2 exchanges, then extra floaters, backtracking across
// brackets on an explicit stack. When the strict search fails or runs out of
// budget the search is repeated with color constraints relaxed, and finally
// a greedy pass that may repeat opponents.
class DutchPairer {
public:
    DutchPairer(ColorRules rules, SearchBudget budget);

    // Searches with a fresh allowance of the configured budget.
    DutchResult Pair(const std::vector<Contender>& contenders) const;
    DutchResult Pair(const std::vector<Contender>& contenders, SearchAllowance& allowance) const;

    static bool Met(const Contender& a, const Contender& b);

private:
    ColorRules rules_;
    SearchBudget budget_;
};

}  // namespace pairkit::core::tournament
