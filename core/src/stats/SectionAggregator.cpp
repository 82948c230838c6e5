#include "pairkit/core/stats/SectionAggregator.h"

#include "pairkit/core/tournament/Acceleration.h"

#include <algorithm>
#include <functional>
#include <future>
#include <utility>

namespace pairkit::core::stats {

using tournament::HalfPoints;

SectionAggregator::SectionAggregator(const api::EngineConfig& config,
                                     const tournament::TournamentState& state,
                                     const tournament::PlayerRegistry& registry,
                                     const history::ScoreHistory& history)
    : config_(config), state_(state), registry_(registry), history_(history) {}

std::map<std::string, HalfPoints> SectionAggregator::TiebreakAddedScores(const std::string& section) const {
    if (!config_.accelerated() || config_.acceleration.type != api::AccelerationType::kAddedScore ||
        !config_.acceleration.added_score_in_tiebreaks || history_.rounds_replayed() == 0) {
        return {};
    }
    // Added scores in force for the latest replayed round.
    const auto report = tournament::Acceleration::Evaluate(
        section, registry_.Seeded(section, true), history_.rounds_replayed(), config_);
    return report.added_scores;
}

std::vector<RankedStanding> SectionAggregator::SectionStandings(const std::string& section) const {
    const auto added = TiebreakAddedScores(section);
    const TiebreakCalculator calculator(config_.tiebreaks, registry_, history_, added.empty() ? nullptr : &added);
    return calculator.Rank(registry_.Seeded(section, false));
}

std::map<std::string, std::vector<RankedStanding>> SectionAggregator::AllSections() const {
    std::vector<std::pair<std::string, std::future<std::vector<RankedStanding>>>> pending;
    for (const auto& section : registry_.Sections()) {
        pending.emplace_back(section,
                             std::async(std::launch::async, [this, section]() { return SectionStandings(section); }));
    }
    std::map<std::string, std::vector<RankedStanding>> result;
    for (auto& item : pending) {
        result.emplace(item.first, item.second.get());
    }
    return result;
}

bool SectionAggregator::TeamStandings(const std::string& section,
                                      std::vector<TeamStanding>& out,
                                      std::string* error) const {
    history::TeamHistories teams;
    if (!history::TeamHistories::Build(state_, registry_, history_, config_.teams, teams, error)) {
        return false;
    }

    std::vector<TeamStanding> rows;
    for (const auto* team : registry_.TeamsIn(section)) {
        const auto& team_history = teams.At(team->id);
        TeamStanding row;
        row.team_id = team->id;
        row.name = team->name;
        row.match_points = team_history.match_points;
        row.game_points = team_history.game_points;
        row.byes = team_history.byes;
        for (const auto& entry : team_history.rounds) {
            if (entry.opponent_id.empty() || !entry.finished) {
                continue;
            }
            row.matches += 1;
            if (entry.game_points > entry.opponent_game_points) {
                row.wins += 1;
            } else if (entry.game_points == entry.opponent_game_points) {
                row.draws += 1;
            } else {
                row.losses += 1;
            }
        }
        std::vector<HalfPoints> member_scores;
        for (const auto& member_id : team->member_ids) {
            const auto* member = history_.Find(member_id);
            if (member) {
                member_scores.push_back(member->score);
            }
        }
        std::sort(member_scores.begin(), member_scores.end(), std::greater<HalfPoints>());
        const size_t counted = std::min(member_scores.size(), static_cast<size_t>(std::max(0, config_.teams.top_scores)));
        for (size_t i = 0; i < counted; ++i) {
            row.top_scores += member_scores[i];
        }
        rows.push_back(std::move(row));
    }

    const auto method = config_.teams.score_method;
    auto key = [method](const TeamStanding& row) {
        switch (method) {
            case api::TeamScoreMethod::kMatchPoints:
                return std::make_pair(static_cast<long long>(row.match_points), static_cast<long long>(row.game_points));
            case api::TeamScoreMethod::kGamePoints:
                return std::make_pair(static_cast<long long>(row.game_points), static_cast<long long>(row.match_points));
            case api::TeamScoreMethod::kTopScores:
                break;
        }
        return std::make_pair(static_cast<long long>(row.top_scores), static_cast<long long>(row.game_points));
    };
    std::stable_sort(rows.begin(), rows.end(), [&](const TeamStanding& a, const TeamStanding& b) {
        const auto ka = key(a);
        const auto kb = key(b);
        if (ka != kb) {
            return ka > kb;
        }
        return a.team_id < b.team_id;
    });
    for (size_t i = 0; i < rows.size(); ++i) {
        const bool tied_above = i > 0 && key(rows[i]) == key(rows[i - 1]);
        const bool tied_below = i + 1 < rows.size() && key(rows[i]) == key(rows[i + 1]);
        rows[i].rank = tied_above ? rows[i - 1].rank : static_cast<int>(i) + 1;
        rows[i].shared_rank = tied_above || tied_below;
    }
    out = std::move(rows);
    return true;
}

}  // namespace pairkit::core::stats
