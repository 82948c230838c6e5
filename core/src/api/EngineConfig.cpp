#include "pairkit/core/api/EngineConfig.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pairkit::core::api {

namespace {

struct NamedCriterion {
    const char* name;
    TiebreakCriterion criterion;
};

constexpr NamedCriterion kCriteria[] = {
    {"buchholz", TiebreakCriterion::kBuchholz},
    {"modified_buchholz", TiebreakCriterion::kModifiedBuchholz},
    {"median_buchholz", TiebreakCriterion::kMedianBuchholz},
    {"sonneborn_berger", TiebreakCriterion::kSonnebornBerger},
    {"cumulative", TiebreakCriterion::kCumulative},
    {"koya", TiebreakCriterion::kKoya},
    {"direct_encounter", TiebreakCriterion::kDirectEncounter},
    {"average_opponent_rating", TiebreakCriterion::kAverageOpponentRating},
    {"performance_rating", TiebreakCriterion::kPerformanceRating},
    {"games_won", TiebreakCriterion::kGamesWon},
    {"games_with_black", TiebreakCriterion::kGamesWithBlack},
};

bool IsHalfPointMultiple(double value) {
    const double doubled = value * 2.0;
    return std::fabs(doubled - std::round(doubled)) < 1e-9;
}

bool ValidByeValue(double value) {
    return value >= 0.0 && value <= 1.0 && IsHalfPointMultiple(value);
}

const char* UnplayedPolicyName(UnplayedRoundPolicy policy) {
    switch (policy) {
        case UnplayedRoundPolicy::kZero:
            return "zero";
        case UnplayedRoundPolicy::kOwnScore:
            return "own_score";
        case UnplayedRoundPolicy::kAssumedScore:
            return "assumed_score";
    }
    return "own_score";
}

bool ParseUnplayedPolicy(const std::string& text, UnplayedRoundPolicy& out) {
    if (text == "zero") {
        out = UnplayedRoundPolicy::kZero;
    } else if (text == "own_score") {
        out = UnplayedRoundPolicy::kOwnScore;
    } else if (text == "assumed_score") {
        out = UnplayedRoundPolicy::kAssumedScore;
    } else {
        return false;
    }
    return true;
}

const char* TeamScoreMethodName(TeamScoreMethod method) {
    switch (method) {
        case TeamScoreMethod::kMatchPoints:
            return "match_points";
        case TeamScoreMethod::kGamePoints:
            return "game_points";
        case TeamScoreMethod::kTopScores:
            return "top_scores";
    }
    return "match_points";
}

bool ParseTeamScoreMethod(const std::string& text, TeamScoreMethod& out) {
    if (text == "match_points") {
        out = TeamScoreMethod::kMatchPoints;
    } else if (text == "game_points") {
        out = TeamScoreMethod::kGamePoints;
    } else if (text == "top_scores") {
        out = TeamScoreMethod::kTopScores;
    } else {
        return false;
    }
    return true;
}

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

bool ParseRoot(const nlohmann::json& root, EngineConfig& config, std::string* error) {
    config = EngineConfig{};

    if (root.contains("method")) {
        const std::string method = root.at("method").get<std::string>();
        if (!ParsePairingMethod(method, config.method)) {
            return SetError(error, "Unknown pairing method: " + method);
        }
    }
    if (root.contains("pairing_type")) {
        const std::string type = root.at("pairing_type").get<std::string>();
        if (type == "standard") {
            config.type = PairingType::kStandard;
        } else if (type == "accelerated") {
            config.type = PairingType::kAccelerated;
        } else {
            return SetError(error, "Unknown pairing type: " + type);
        }
    }
    config.rounds = root.value("rounds", config.rounds);
    config.double_round_robin = root.value("double_round_robin", config.double_round_robin);

    if (root.contains("acceleration")) {
        const auto& node = root.at("acceleration");
        if (node.contains("type")) {
            const std::string type = node.at("type").get<std::string>();
            if (!ParseAccelerationType(type, config.acceleration.type)) {
                return SetError(error, "Unknown acceleration type: " + type);
            }
        }
        config.acceleration.rounds = node.value("rounds", config.acceleration.rounds);
        config.acceleration.threshold = node.value("threshold", config.acceleration.threshold);
        config.acceleration.break_point = node.value("break_point", config.acceleration.break_point);
        if (node.contains("added_scores")) {
            config.acceleration.added_scores = node.at("added_scores").get<std::vector<double>>();
        }
        config.acceleration.added_score_in_tiebreaks =
            node.value("added_score_in_tiebreaks", config.acceleration.added_score_in_tiebreaks);
    }

    if (root.contains("byes")) {
        const auto& node = root.at("byes");
        config.byes.pairing_allocated = node.value("pairing_allocated", config.byes.pairing_allocated);
        config.byes.half_point = node.value("half_point", config.byes.half_point);
        config.byes.full_point = node.value("full_point", config.byes.full_point);
        config.byes.zero_point = node.value("zero_point", config.byes.zero_point);
        config.byes.forfeit_win = node.value("forfeit_win", config.byes.forfeit_win);
    }

    if (root.contains("colors")) {
        const auto& node = root.at("colors");
        config.colors.alternation_limit = node.value("alternation_limit", config.colors.alternation_limit);
        config.colors.equalization_limit = node.value("equalization_limit", config.colors.equalization_limit);
        const std::string initial = node.value("initial_color", std::string("white"));
        if (initial == "white") {
            config.colors.initial_color = tournament::Color::kWhite;
        } else if (initial == "black") {
            config.colors.initial_color = tournament::Color::kBlack;
        } else {
            return SetError(error, "Unknown initial color: " + initial);
        }
    }

    if (root.contains("search")) {
        const auto& node = root.at("search");
        config.search.iteration_budget = node.value("iteration_budget", config.search.iteration_budget);
        config.search.time_budget_ms = node.value("time_budget_ms", config.search.time_budget_ms);
        config.search.bye_candidates = node.value("bye_candidates", config.search.bye_candidates);
        config.search.fail_on_exhausted = node.value("fail_on_exhausted", config.search.fail_on_exhausted);
    }

    if (root.contains("tiebreaks")) {
        const auto& node = root.at("tiebreaks");
        if (node.contains("criteria")) {
            config.tiebreaks.criteria.clear();
            for (const auto& item : node.at("criteria")) {
                if (!item.is_string()) {
                    return SetError(error, "Tiebreak criteria must be strings");
                }
                TiebreakCriterion criterion;
                const std::string name = item.get<std::string>();
                if (!ParseTiebreakCriterion(name, criterion)) {
                    return SetError(error, "Unknown tiebreak criterion: " + name);
                }
                config.tiebreaks.criteria.push_back(criterion);
            }
        }
        config.tiebreaks.modified_cut_lowest =
            node.value("modified_cut_lowest", config.tiebreaks.modified_cut_lowest);
        config.tiebreaks.median_cut = node.value("median_cut", config.tiebreaks.median_cut);
        if (node.contains("unplayed_policy")) {
            const std::string policy = node.at("unplayed_policy").get<std::string>();
            if (!ParseUnplayedPolicy(policy, config.tiebreaks.unplayed_policy)) {
                return SetError(error, "Unknown unplayed round policy: " + policy);
            }
        }
        config.tiebreaks.assumed_score = node.value("assumed_score", config.tiebreaks.assumed_score);
        config.tiebreaks.cumulative_discount_unplayed =
            node.value("cumulative_discount_unplayed", config.tiebreaks.cumulative_discount_unplayed);
        config.tiebreaks.performance_cap = node.value("performance_cap", config.tiebreaks.performance_cap);
    }

    if (root.contains("teams")) {
        const auto& node = root.at("teams");
        if (node.contains("score_method")) {
            const std::string method = node.at("score_method").get<std::string>();
            if (!ParseTeamScoreMethod(method, config.teams.score_method)) {
                return SetError(error, "Unknown team score method: " + method);
            }
        }
        config.teams.boards_per_match = node.value("boards_per_match", config.teams.boards_per_match);
        config.teams.match_win_points = node.value("match_win_points", config.teams.match_win_points);
        config.teams.match_draw_points = node.value("match_draw_points", config.teams.match_draw_points);
        config.teams.top_scores = node.value("top_scores", config.teams.top_scores);
    }

    return true;
}

nlohmann::json WriteRoot(const EngineConfig& config) {
    nlohmann::json root;
    root["method"] = PairingMethodName(config.method);
    root["pairing_type"] = config.accelerated() ? "accelerated" : "standard";
    root["rounds"] = config.rounds;
    root["double_round_robin"] = config.double_round_robin;

    root["acceleration"] = {
        {"type", AccelerationTypeName(config.acceleration.type)},
        {"rounds", config.acceleration.rounds},
        {"threshold", config.acceleration.threshold},
        {"break_point", config.acceleration.break_point},
        {"added_scores", config.acceleration.added_scores},
        {"added_score_in_tiebreaks", config.acceleration.added_score_in_tiebreaks},
    };

    root["byes"] = {
        {"pairing_allocated", config.byes.pairing_allocated},
        {"half_point", config.byes.half_point},
        {"full_point", config.byes.full_point},
        {"zero_point", config.byes.zero_point},
        {"forfeit_win", config.byes.forfeit_win},
    };

    root["colors"] = {
        {"alternation_limit", config.colors.alternation_limit},
        {"equalization_limit", config.colors.equalization_limit},
        {"initial_color", config.colors.initial_color == tournament::Color::kBlack ? "black" : "white"},
    };

    root["search"] = {
        {"iteration_budget", config.search.iteration_budget},
        {"time_budget_ms", config.search.time_budget_ms},
        {"bye_candidates", config.search.bye_candidates},
        {"fail_on_exhausted", config.search.fail_on_exhausted},
    };

    nlohmann::json criteria = nlohmann::json::array();
    for (const auto criterion : config.tiebreaks.criteria) {
        criteria.push_back(TiebreakCriterionName(criterion));
    }
    root["tiebreaks"] = {
        {"criteria", criteria},
        {"modified_cut_lowest", config.tiebreaks.modified_cut_lowest},
        {"median_cut", config.tiebreaks.median_cut},
        {"unplayed_policy", UnplayedPolicyName(config.tiebreaks.unplayed_policy)},
        {"assumed_score", config.tiebreaks.assumed_score},
        {"cumulative_discount_unplayed", config.tiebreaks.cumulative_discount_unplayed},
        {"performance_cap", config.tiebreaks.performance_cap},
    };

    root["teams"] = {
        {"score_method", TeamScoreMethodName(config.teams.score_method)},
        {"boards_per_match", config.teams.boards_per_match},
        {"match_win_points", config.teams.match_win_points},
        {"match_draw_points", config.teams.match_draw_points},
        {"top_scores", config.teams.top_scores},
    };
    return root;
}

}  // namespace

bool EngineConfig::Validate(std::string* error) const {
    if (rounds < 1) {
        return SetError(error, "rounds must be at least 1");
    }
    if (method == PairingMethod::kQuad && rounds != 3) {
        return SetError(error, "Quad tournaments play exactly 3 rounds, configured " + std::to_string(rounds));
    }
    if (accelerated() && method != PairingMethod::kFideDutch) {
        return SetError(error, std::string("Acceleration requires fide_dutch pairing, not ") +
                                   PairingMethodName(method));
    }
    if (accelerated()) {
        if (acceleration.type != AccelerationType::kAllRounds && acceleration.rounds < 1) {
            return SetError(error, "acceleration.rounds must be at least 1");
        }
        if (acceleration.threshold < 0 || acceleration.break_point < 0) {
            return SetError(error, "acceleration threshold and break point must not be negative");
        }
        if (acceleration.break_point % 2 != 0) {
            return SetError(error, "acceleration.break_point must be even");
        }
        if (acceleration.type == AccelerationType::kAddedScore) {
            if (acceleration.added_scores.empty()) {
                return SetError(error, "added_score acceleration needs at least one added score");
            }
            for (const double value : acceleration.added_scores) {
                if (value < 0.0 || !IsHalfPointMultiple(value)) {
                    return SetError(error, "added scores must be non-negative half-point multiples");
                }
            }
        }
    }
    if (!ValidByeValue(byes.pairing_allocated) || !ValidByeValue(byes.half_point) ||
        !ValidByeValue(byes.full_point) || !ValidByeValue(byes.zero_point) ||
        !ValidByeValue(byes.forfeit_win)) {
        return SetError(error, "bye and forfeit values must be 0, 0.5 or 1");
    }
    if (colors.alternation_limit < 1 || colors.equalization_limit < 1) {
        return SetError(error, "color alternation and equalization limits must be at least 1");
    }
    if (colors.initial_color == tournament::Color::kNone) {
        return SetError(error, "initial color must be white or black");
    }
    if (search.iteration_budget < 1 || search.time_budget_ms < 0 || search.bye_candidates < 1) {
        return SetError(error, "search budget values must be positive");
    }
    if (tiebreaks.modified_cut_lowest < 0 || tiebreaks.median_cut < 0 || tiebreaks.performance_cap < 0) {
        return SetError(error, "tiebreak cut counts and performance cap must not be negative");
    }
    for (size_t i = 0; i < tiebreaks.criteria.size(); ++i) {
        for (size_t j = i + 1; j < tiebreaks.criteria.size(); ++j) {
            if (tiebreaks.criteria[i] == tiebreaks.criteria[j]) {
                return SetError(error, std::string("Tiebreak listed twice: ") +
                                           TiebreakCriterionName(tiebreaks.criteria[i]));
            }
        }
    }
    if (method == PairingMethod::kTeamSwiss && teams.boards_per_match < 1) {
        return SetError(error, "teams.boards_per_match must be at least 1");
    }
    if (teams.top_scores < 1 || teams.match_win_points < teams.match_draw_points) {
        return SetError(error, "team scoring values are inconsistent");
    }
    return true;
}

bool EngineConfig::LoadFromFile(const std::string& path, EngineConfig& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        return SetError(error, "Failed to open config: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadFromJson(buffer.str(), config, error);
}

bool EngineConfig::LoadFromJson(const std::string& payload, EngineConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        return SetError(error, "Config root must be a JSON object");
    }
    try {
        return ParseRoot(root, config, error);
    } catch (const nlohmann::json::exception& ex) {
        return SetError(error, std::string("Invalid config value: ") + ex.what());
    }
}

bool EngineConfig::SaveToFile(const std::string& path, const EngineConfig& config, std::string* error) {
    const std::filesystem::path fs_path(path);
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path());
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return SetError(error, "Failed to write config: " + path);
    }
    output << WriteRoot(config).dump(2);
    return true;
}

std::string EngineConfig::ToJsonString(const EngineConfig& config) {
    return WriteRoot(config).dump();
}

const char* PairingMethodName(PairingMethod method) {
    switch (method) {
        case PairingMethod::kFideDutch:
            return "fide_dutch";
        case PairingMethod::kRoundRobin:
            return "round_robin";
        case PairingMethod::kQuad:
            return "quad";
        case PairingMethod::kSingleElimination:
            return "single_elimination";
        case PairingMethod::kTeamSwiss:
            return "team_swiss";
    }
    return "fide_dutch";
}

bool ParsePairingMethod(const std::string& text, PairingMethod& out) {
    if (text == "fide_dutch" || text == "swiss") {
        out = PairingMethod::kFideDutch;
    } else if (text == "round_robin") {
        out = PairingMethod::kRoundRobin;
    } else if (text == "quad") {
        out = PairingMethod::kQuad;
    } else if (text == "single_elimination") {
        out = PairingMethod::kSingleElimination;
    } else if (text == "team_swiss") {
        out = PairingMethod::kTeamSwiss;
    } else {
        return false;
    }
    return true;
}

const char* AccelerationTypeName(AccelerationType type) {
    switch (type) {
        case AccelerationType::kStandard:
            return "standard";
        case AccelerationType::kSixths:
            return "sixths";
        case AccelerationType::kAddedScore:
            return "added_score";
        case AccelerationType::kAllRounds:
            return "all_rounds";
    }
    return "standard";
}

bool ParseAccelerationType(const std::string& text, AccelerationType& out) {
    if (text == "standard") {
        out = AccelerationType::kStandard;
    } else if (text == "sixths") {
        out = AccelerationType::kSixths;
    } else if (text == "added_score") {
        out = AccelerationType::kAddedScore;
    } else if (text == "all_rounds") {
        out = AccelerationType::kAllRounds;
    } else {
        return false;
    }
    return true;
}

const char* TiebreakCriterionName(TiebreakCriterion criterion) {
    for (const auto& entry : kCriteria) {
        if (entry.criterion == criterion) {
            return entry.name;
        }
    }
    return "unknown";
}

bool ParseTiebreakCriterion(const std::string& text, TiebreakCriterion& out) {
    for (const auto& entry : kCriteria) {
        if (text == entry.name) {
            out = entry.criterion;
            return true;
        }
    }
    if (text == "buchholz_cut1") {
        out = TiebreakCriterion::kModifiedBuchholz;
        return true;
    }
    if (text == "sonnebornBerger") {
        out = TiebreakCriterion::kSonnebornBerger;
        return true;
    }
    return false;
}

}  // namespace pairkit::core::api
