#include "pairkit/core/tournament/DutchPairer.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <numeric>
#include <set>
#include <utility>

namespace pairkit::core::tournament {

namespace {

constexpr int kMaxExchangeSize = 2;
constexpr size_t kMaxExchangeCandidates = 20000;
constexpr int kExchangePool = 8;

class CompatMatrix {
public:
    CompatMatrix(size_t count, const std::function<bool(int, int)>& compatible) : count_(count), cells_(count * count, 0) {
        for (size_t i = 0; i < count; ++i) {
            for (size_t j = i + 1; j < count; ++j) {
                const char value = compatible(static_cast<int>(i), static_cast<int>(j)) ? 1 : 0;
                cells_[i * count + j] = value;
                cells_[j * count + i] = value;
            }
        }
    }

    bool operator()(int a, int b) const { return cells_[static_cast<size_t>(a) * count_ + static_cast<size_t>(b)] != 0; }

private:
    size_t count_;
    std::vector<char> cells_;
};

struct Exchange {
    std::vector<int> from_s1;
    std::vector<int> from_s2;
};

std::vector<Exchange> BuildExchanges(int p, int q, int size) {
    std::vector<Exchange> exchanges;
    if (size == 0) {
        exchanges.emplace_back();
        return exchanges;
    }
    // Larger exchanges only draw on the players nearest the S1/S2 border.
    int s1_low = 0;
    int s2_high = q;
    if (size > 1) {
        s1_low = std::max(0, p - kExchangePool);
        s2_high = std::min(q, kExchangePool);
    }

    struct Keyed {
        int total = 0;
        int s1_distance = 0;
        Exchange exchange;
    };
    std::vector<Keyed> keyed;
    std::vector<int> pick1;
    std::function<void(int, std::vector<int>&, int, int, std::vector<std::vector<int>>&)> combos =
        [&](int start, std::vector<int>& current, int end, int want, std::vector<std::vector<int>>& out) {
            if (static_cast<int>(current.size()) == want) {
                out.push_back(current);
                return;
            }
            for (int i = start; i < end; ++i) {
                current.push_back(i);
                combos(i + 1, current, end, want, out);
                current.pop_back();
            }
        };

    std::vector<std::vector<int>> s1_sets;
    std::vector<std::vector<int>> s2_sets;
    combos(s1_low, pick1, p, size, s1_sets);
    pick1.clear();
    combos(0, pick1, s2_high, size, s2_sets);

    for (const auto& s1_set : s1_sets) {
        int s1_distance = 0;
        for (const int i : s1_set) {
            s1_distance += p - 1 - i;
        }
        for (const auto& s2_set : s2_sets) {
            int s2_distance = 0;
            for (const int j : s2_set) {
                s2_distance += j;
            }
            keyed.push_back({s1_distance + s2_distance, s1_distance, Exchange{s1_set, s2_set}});
            if (keyed.size() >= kMaxExchangeCandidates) {
                break;
            }
        }
        if (keyed.size() >= kMaxExchangeCandidates) {
            break;
        }
    }
    // Smallest rank distance across the S1/S2 border first, then the lowest S1 players.
    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (a.total != b.total) {
            return a.total < b.total;
        }
        return a.s1_distance < b.s1_distance;
    });
    exchanges.reserve(keyed.size());
    for (auto& item : keyed) {
        exchanges.push_back(std::move(item.exchange));
    }
    return exchanges;
}

// Enumerates candidate pairings of one bracket in Dutch order.
class BracketEnumerator {
public:
    BracketEnumerator(std::vector<int> members, bool must_pair_all)
        : members_(std::move(members)) {
        const int n = static_cast<int>(members_.size());
        pairs_ = n / 2;
        // The last bracket may leave at most one player over, who becomes the bye.
        min_pairs_ = must_pair_all ? pairs_ : 0;
        exchanges_ = BuildExchanges(pairs_, n - pairs_, 0);
    }

    const std::vector<int>& members() const { return members_; }

    bool Next(const CompatMatrix& compatible,
              SearchAllowance& budget,
              std::vector<DutchPair>& pairs,
              std::vector<int>& floaters) {
        while (true) {
            if (!active_) {
                if (!PrepareSplit()) {
                    return false;
                }
                active_ = true;
                advance_from_ = -1;
            }
            if (advance_from_ >= 0) {
                std::sort(perm_.begin() + advance_from_, perm_.end(), std::greater<int>());
                if (!std::next_permutation(perm_.begin(), perm_.end())) {
                    active_ = false;
                    continue;
                }
            }
            if (!budget.Tick()) {
                return false;
            }

            int conflict = -1;
            for (int i = 0; i < pairs_; ++i) {
                if (!compatible(s1_[static_cast<size_t>(i)], s2_[static_cast<size_t>(perm_[static_cast<size_t>(i)])])) {
                    conflict = i;
                    break;
                }
            }
            if (conflict >= 0) {
                advance_from_ = conflict + 1;
                continue;
            }

            pairs.clear();
            floaters.clear();
            for (int i = 0; i < pairs_; ++i) {
                pairs.push_back({s1_[static_cast<size_t>(i)], s2_[static_cast<size_t>(perm_[static_cast<size_t>(i)])]});
            }
            for (size_t i = static_cast<size_t>(pairs_); i < perm_.size(); ++i) {
                floaters.push_back(s2_[static_cast<size_t>(perm_[i])]);
            }
            std::sort(floaters.begin(), floaters.end());
            advance_from_ = pairs_;
            return true;
        }
    }

private:
    bool PrepareSplit() {
        const int n = static_cast<int>(members_.size());
        while (pairs_ >= min_pairs_ && pairs_ >= 0) {
            const int q = n - pairs_;
            if (exchange_index_ < exchanges_.size()) {
                BuildSplit(exchanges_[exchange_index_++]);
                return true;
            }
            if (pairs_ > 0 && exchange_size_ < kMaxExchangeSize && exchange_size_ < std::min(pairs_, q)) {
                ++exchange_size_;
                exchanges_ = BuildExchanges(pairs_, q, exchange_size_);
                exchange_index_ = 0;
                continue;
            }
            --pairs_;
            exchange_size_ = 0;
            exchanges_ = BuildExchanges(pairs_, n - pairs_, 0);
            exchange_index_ = 0;
        }
        return false;
    }

    void BuildSplit(const Exchange& exchange) {
        s1_.assign(members_.begin(), members_.begin() + pairs_);
        s2_.assign(members_.begin() + pairs_, members_.end());
        for (size_t k = 0; k < exchange.from_s1.size(); ++k) {
            std::swap(s1_[static_cast<size_t>(exchange.from_s1[k])], s2_[static_cast<size_t>(exchange.from_s2[k])]);
        }
        std::sort(s1_.begin(), s1_.end());
        std::sort(s2_.begin(), s2_.end());
        perm_.resize(s2_.size());
        std::iota(perm_.begin(), perm_.end(), 0);
    }

    std::vector<int> members_;
    int pairs_ = 0;
    int min_pairs_ = 0;
    int exchange_size_ = 0;
    std::vector<Exchange> exchanges_;
    size_t exchange_index_ = 0;
    std::vector<int> s1_;
    std::vector<int> s2_;
    std::vector<int> perm_;
    bool active_ = false;
    int advance_from_ = -1;
};

struct Frame {
    BracketEnumerator enumerator;
    size_t group_index;
    std::vector<DutchPair> pairs;
};

std::vector<std::vector<int>> ScoreGroups(const std::vector<Contender>& contenders) {
    std::vector<std::vector<int>> groups;
    for (size_t i = 0; i < contenders.size(); ++i) {
        if (groups.empty() || contenders[i].score != contenders[static_cast<size_t>(groups.back().front())].score) {
            groups.emplace_back();
        }
        groups.back().push_back(static_cast<int>(i));
    }
    return groups;
}

bool Search(const std::vector<std::vector<int>>& groups,
            const CompatMatrix& compatible,
            SearchAllowance& budget,
            std::vector<DutchPair>& out,
            std::vector<int>& leftover) {
    out.clear();
    leftover.clear();
    if (groups.empty()) {
        return true;
    }
    std::set<std::pair<size_t, std::vector<int>>> dead;
    std::vector<Frame> frames;
    frames.push_back(Frame{BracketEnumerator(groups[0], groups.size() == 1), 0, {}});

    std::vector<DutchPair> pairs;
    std::vector<int> floaters;
    while (!frames.empty()) {
        Frame& frame = frames.back();
        if (!frame.enumerator.Next(compatible, budget, pairs, floaters)) {
            if (budget.exhausted()) {
                return false;
            }
            dead.insert({frame.group_index, frame.enumerator.members()});
            frames.pop_back();
            continue;
        }
        frame.pairs = pairs;
        const size_t next_group = frame.group_index + 1;
        if (next_group >= groups.size()) {
            for (const auto& done : frames) {
                out.insert(out.end(), done.pairs.begin(), done.pairs.end());
            }
            leftover = floaters;
            return true;
        }
        std::vector<int> members = floaters;
        members.insert(members.end(), groups[next_group].begin(), groups[next_group].end());
        std::sort(members.begin(), members.end());
        if (dead.count({next_group, members}) > 0) {
            continue;
        }
        const bool last = next_group + 1 == groups.size();
        frames.push_back(Frame{BracketEnumerator(std::move(members), last), next_group, {}});
    }
    return false;
}

}  // namespace

SearchAllowance::SearchAllowance(const SearchBudget& limits)
    : limit_(limits.iterations),
      timed_(limits.time_ms > 0),
      deadline_(std::chrono::steady_clock::now() + std::chrono::milliseconds(limits.time_ms)) {}

bool SearchAllowance::Tick() {
    if (exhausted_) {
        return false;
    }
    ++used_;
    if (used_ > limit_) {
        exhausted_ = true;
    } else if (timed_ && (used_ & 1023) == 0 && std::chrono::steady_clock::now() > deadline_) {
        exhausted_ = true;
    }
    return !exhausted_;
}

DutchPairer::DutchPairer(ColorRules rules, SearchBudget budget) : rules_(rules), budget_(budget) {}

bool DutchPairer::Met(const Contender& a, const Contender& b) {
    return std::find(a.opponents.begin(), a.opponents.end(), b.id) != a.opponents.end() ||
           std::find(b.opponents.begin(), b.opponents.end(), a.id) != b.opponents.end();
}

DutchResult DutchPairer::Pair(const std::vector<Contender>& contenders) const {
    SearchAllowance allowance(budget_);
    return Pair(contenders, allowance);
}

DutchResult DutchPairer::Pair(const std::vector<Contender>& contenders, SearchAllowance& allowance) const {
    DutchResult result;
    const size_t count = contenders.size();
    const auto groups = ScoreGroups(contenders);
    const long long used_before = allowance.used();

    const CompatMatrix strict(count, [&](int a, int b) {
        const auto& ca = contenders[static_cast<size_t>(a)];
        const auto& cb = contenders[static_cast<size_t>(b)];
        return !Met(ca, cb) && ColorsCompatible(ca.colors, cb.colors, rules_);
    });

    const bool strict_found = Search(groups, strict, allowance, result.pairs, result.unpaired);
    result.iterations = allowance.used() - used_before;
    if (strict_found) {
        result.stage = SearchStage::kStrict;
        return result;
    }
    result.budget_exhausted = allowance.exhausted();

    const CompatMatrix no_repeats(count, [&](int a, int b) {
        return !Met(contenders[static_cast<size_t>(a)], contenders[static_cast<size_t>(b)]);
    });
    const bool relaxed_found = Search(groups, no_repeats, allowance, result.pairs, result.unpaired);
    result.iterations = allowance.used() - used_before;
    result.budget_exhausted = allowance.exhausted();
    if (relaxed_found) {
        result.stage = SearchStage::kColorsRelaxed;
        return result;
    }

    // Greedy last resort in ranking order: strict partner, then any new opponent, then anyone.
    result.stage = SearchStage::kRepeatsAllowed;
    result.pairs.clear();
    result.unpaired.clear();
    std::vector<bool> used(count, false);
    for (size_t i = 0; i < count; ++i) {
        if (used[i]) {
            continue;
        }
        int partner = -1;
        for (const auto* matrix : {&strict, &no_repeats}) {
            for (size_t j = i + 1; j < count && partner < 0; ++j) {
                if (!used[j] && (*matrix)(static_cast<int>(i), static_cast<int>(j))) {
                    partner = static_cast<int>(j);
                }
            }
            if (partner >= 0) {
                break;
            }
        }
        for (size_t j = i + 1; j < count && partner < 0; ++j) {
            if (!used[j]) {
                partner = static_cast<int>(j);
            }
        }
        used[i] = true;
        if (partner < 0) {
            result.unpaired.push_back(static_cast<int>(i));
            continue;
        }
        used[static_cast<size_t>(partner)] = true;
        result.pairs.push_back({static_cast<int>(i), partner});
    }
    return result;
}

}  // namespace pairkit::core::tournament
