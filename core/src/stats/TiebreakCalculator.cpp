#include "pairkit/core/stats/TiebreakCalculator.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace pairkit::core::stats {

using api::TiebreakCriterion;
using history::EntryKind;
using history::PlayerHistory;
using tournament::HalfPoints;

namespace {

constexpr double kTieEpsilon = 1e-9;

bool SameValue(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) {
        return false;
    }
    return !a.has_value() || std::fabs(*a - *b) < kTieEpsilon;
}

double SumPoints(const std::vector<HalfPoints>& values, size_t skip_low, size_t skip_high) {
    if (values.size() <= skip_low + skip_high) {
        return 0.0;
    }
    HalfPoints total = 0;
    for (size_t i = skip_low; i < values.size() - skip_high; ++i) {
        total += values[i];
    }
    return tournament::ToPoints(total);
}

}  // namespace

TiebreakCalculator::TiebreakCalculator(api::TiebreakConfig config,
                                       const tournament::PlayerRegistry& registry,
                                       const history::ScoreHistory& history,
                                       const std::map<std::string, HalfPoints>* added_scores)
    : config_(std::move(config)), registry_(registry), history_(history), added_scores_(added_scores) {}

HalfPoints TiebreakCalculator::OpponentScore(const std::string& opponent_id) const {
    const auto* opponent = history_.Find(opponent_id);
    HalfPoints score = opponent ? opponent->score : 0;
    if (added_scores_) {
        const auto it = added_scores_->find(opponent_id);
        if (it != added_scores_->end()) {
            score += it->second;
        }
    }
    return score;
}

int TiebreakCalculator::RatingOf(const std::string& player_id) const {
    const auto* player = registry_.Find(player_id);
    return player ? player->rating : 0;
}

std::vector<HalfPoints> TiebreakCalculator::Contributions(const PlayerHistory& player) const {
    std::vector<HalfPoints> values;
    values.reserve(player.rounds.size());
    for (const auto& entry : player.rounds) {
        // A round still in progress counts once all of its results are in.
        if (entry.round > history_.rounds_completed()) {
            break;
        }
        if (entry.kind == EntryKind::kPlayed) {
            values.push_back(OpponentScore(entry.opponent_id));
            continue;
        }
        switch (config_.unplayed_policy) {
            case api::UnplayedRoundPolicy::kZero:
                values.push_back(0);
                break;
            case api::UnplayedRoundPolicy::kOwnScore:
                values.push_back(player.score);
                break;
            case api::UnplayedRoundPolicy::kAssumedScore:
                values.push_back(tournament::FromPoints(config_.assumed_score));
                break;
        }
    }
    std::sort(values.begin(), values.end());
    return values;
}

double TiebreakCalculator::Buchholz(const PlayerHistory& player) const {
    return SumPoints(Contributions(player), 0, 0);
}

double TiebreakCalculator::ModifiedBuchholz(const PlayerHistory& player) const {
    return SumPoints(Contributions(player), static_cast<size_t>(std::max(0, config_.modified_cut_lowest)), 0);
}

double TiebreakCalculator::MedianBuchholz(const PlayerHistory& player) const {
    const auto cut = static_cast<size_t>(std::max(0, config_.median_cut));
    return SumPoints(Contributions(player), cut, cut);
}

double TiebreakCalculator::SonnebornBerger(const PlayerHistory& player) const {
    double total = 0.0;
    for (const auto& entry : player.rounds) {
        if (entry.kind != EntryKind::kPlayed) {
            continue;
        }
        total += tournament::ToPoints(OpponentScore(entry.opponent_id)) * tournament::ToPoints(entry.points);
    }
    return total;
}

double TiebreakCalculator::Cumulative(const PlayerHistory& player) const {
    HalfPoints running = 0;
    HalfPoints total = 0;
    for (const auto& entry : player.rounds) {
        if (!(config_.cumulative_discount_unplayed && entry.unplayed())) {
            running += entry.points;
        }
        total += running;
    }
    return tournament::ToPoints(total);
}

double TiebreakCalculator::Koya(const PlayerHistory& player) const {
    // Half the available points, in half-point units, is one per completed round.
    const HalfPoints threshold = history_.rounds_completed();
    HalfPoints total = 0;
    for (const auto& entry : player.rounds) {
        if (entry.kind == EntryKind::kPlayed && OpponentScore(entry.opponent_id) >= threshold) {
            total += entry.points;
        }
    }
    return tournament::ToPoints(total);
}

double TiebreakCalculator::AverageOpponentRating(const PlayerHistory& player) const {
    long long total = 0;
    int count = 0;
    for (const auto& entry : player.rounds) {
        if (entry.kind != EntryKind::kPlayed) {
            continue;
        }
        const int rating = RatingOf(entry.opponent_id);
        if (rating > 0) {
            total += rating;
            count += 1;
        }
    }
    return count == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(count);
}

double TiebreakCalculator::PerformanceRating(const PlayerHistory& player) const {
    long long rating_total = 0;
    HalfPoints scored = 0;
    int games = 0;
    for (const auto& entry : player.rounds) {
        if (entry.kind != EntryKind::kPlayed) {
            continue;
        }
        const int rating = RatingOf(entry.opponent_id);
        if (rating <= 0) {
            continue;
        }
        rating_total += rating;
        scored += entry.points;
        games += 1;
    }
    if (games == 0) {
        return 0.0;
    }
    const double average = static_cast<double>(rating_total) / static_cast<double>(games);
    const double fraction = tournament::ToPoints(scored) / static_cast<double>(games);
    const double cap = static_cast<double>(config_.performance_cap);
    double difference = 0.0;
    if (fraction <= 0.0) {
        difference = -cap;
    } else if (fraction >= 1.0) {
        difference = cap;
    } else {
        // Inverse of the logistic expectation 1 / (1 + 10^(-d/400)).
        difference = std::clamp(400.0 * std::log10(fraction / (1.0 - fraction)), -cap, cap);
    }
    return std::round(average + difference);
}

double TiebreakCalculator::Value(TiebreakCriterion criterion, const PlayerHistory& player) const {
    switch (criterion) {
        case TiebreakCriterion::kBuchholz:
            return Buchholz(player);
        case TiebreakCriterion::kModifiedBuchholz:
            return ModifiedBuchholz(player);
        case TiebreakCriterion::kMedianBuchholz:
            return MedianBuchholz(player);
        case TiebreakCriterion::kSonnebornBerger:
            return SonnebornBerger(player);
        case TiebreakCriterion::kCumulative:
            return Cumulative(player);
        case TiebreakCriterion::kKoya:
            return Koya(player);
        case TiebreakCriterion::kAverageOpponentRating:
            return AverageOpponentRating(player);
        case TiebreakCriterion::kPerformanceRating:
            return PerformanceRating(player);
        case TiebreakCriterion::kGamesWon: {
            int wins = 0;
            for (const auto& entry : player.rounds) {
                wins += entry.kind == EntryKind::kPlayed && entry.points == 2 ? 1 : 0;
            }
            return wins;
        }
        case TiebreakCriterion::kGamesWithBlack: {
            int blacks = 0;
            for (const auto& entry : player.rounds) {
                blacks += entry.kind == EntryKind::kPlayed && entry.color == tournament::Color::kBlack ? 1 : 0;
            }
            return blacks;
        }
        case TiebreakCriterion::kDirectEncounter:
            break;
    }
    return 0.0;
}

std::optional<std::vector<double>> TiebreakCalculator::DirectEncounter(const std::vector<const PlayerHistory*>& group) {
    std::unordered_set<std::string> members;
    for (const auto* player : group) {
        members.insert(player->player_id);
    }
    std::vector<double> values;
    values.reserve(group.size());
    for (const auto* player : group) {
        std::unordered_set<std::string> met;
        HalfPoints scored = 0;
        for (const auto& entry : player->rounds) {
            if (entry.kind == EntryKind::kPending || !entry.paired() || members.count(entry.opponent_id) == 0) {
                continue;
            }
            met.insert(entry.opponent_id);
            scored += entry.points;
        }
        if (met.size() + 1 < group.size()) {
            return std::nullopt;
        }
        values.push_back(tournament::ToPoints(scored));
    }
    return values;
}

std::vector<RankedStanding> TiebreakCalculator::Rank(const std::vector<const tournament::Player*>& players) const {
    const StandingsTable table = StandingsTable::FromHistory(players, history_);
    const size_t criteria = config_.criteria.size();

    struct Row {
        const PlayerStats* stats = nullptr;
        const PlayerHistory* history = nullptr;
        std::vector<std::optional<double>> values;
    };
    std::vector<Row> rows;
    rows.reserve(players.size());
    for (const auto* player : players) {
        const auto* player_history = history_.Find(player->id);
        const auto* stats = table.Find(player->id);
        if (!player_history || !stats) {
            continue;
        }
        Row row;
        row.stats = stats;
        row.history = player_history;
        row.values.resize(criteria);
        for (size_t c = 0; c < criteria; ++c) {
            if (config_.criteria[c] != TiebreakCriterion::kDirectEncounter) {
                row.values[c] = Value(config_.criteria[c], *player_history);
            }
        }
        rows.push_back(std::move(row));
    }

    // Listing order inside a tie that nothing resolves.
    std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        if (a.stats->score != b.stats->score) {
            return a.stats->score > b.stats->score;
        }
        if (a.stats->rating != b.stats->rating) {
            return a.stats->rating > b.stats->rating;
        }
        return a.stats->player_id < b.stats->player_id;
    });

    std::vector<std::vector<size_t>> groups;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (groups.empty() || rows[groups.back().front()].stats->score != rows[i].stats->score) {
            groups.emplace_back();
        }
        groups.back().push_back(i);
    }

    for (size_t c = 0; c < criteria; ++c) {
        std::vector<std::vector<size_t>> split;
        for (auto& group : groups) {
            if (group.size() < 2) {
                split.push_back(std::move(group));
                continue;
            }
            if (config_.criteria[c] == TiebreakCriterion::kDirectEncounter) {
                std::vector<const PlayerHistory*> histories;
                for (const size_t index : group) {
                    histories.push_back(rows[index].history);
                }
                const auto encounter = DirectEncounter(histories);
                if (!encounter) {
                    split.push_back(std::move(group));
                    continue;
                }
                for (size_t k = 0; k < group.size(); ++k) {
                    rows[group[k]].values[c] = (*encounter)[k];
                }
            }
            std::stable_sort(group.begin(), group.end(), [&](size_t a, size_t b) {
                return rows[a].values[c].value_or(0.0) > rows[b].values[c].value_or(0.0) + kTieEpsilon;
            });
            std::vector<size_t> current;
            for (const size_t index : group) {
                if (!current.empty() && !SameValue(rows[current.front()].values[c], rows[index].values[c])) {
                    split.push_back(std::move(current));
                    current.clear();
                }
                current.push_back(index);
            }
            split.push_back(std::move(current));
        }
        groups = std::move(split);
    }

    std::vector<RankedStanding> ranked;
    ranked.reserve(rows.size());
    for (const auto& group : groups) {
        const int rank = static_cast<int>(ranked.size()) + 1;
        for (const size_t index : group) {
            RankedStanding standing;
            standing.rank = rank;
            standing.shared_rank = group.size() > 1;
            standing.stats = *rows[index].stats;
            for (size_t c = 0; c < criteria; ++c) {
                standing.tiebreaks.push_back({config_.criteria[c], rows[index].values[c]});
            }
            ranked.push_back(std::move(standing));
        }
    }
    return ranked;
}

}  // namespace pairkit::core::stats
