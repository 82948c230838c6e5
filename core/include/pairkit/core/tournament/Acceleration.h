#pragma once

#include "pairkit/core/api/EngineConfig.h"
#include "pairkit/core/tournament/TournamentTypes.h"

#include <map>
#include <string>
#include <vector>

namespace pairkit::core::tournament {

enum class AccelerationStatus {
    kDisabled,
    kOutsideWindow,
    kBelowThreshold,
    kApplied,
};

// Provenance of the acceleration decision for one section and round.
struct AccelerationReport {
    std::string section;
    int round_number = 0;
    AccelerationStatus status = AccelerationStatus::kDisabled;
    api::AccelerationType type = api::AccelerationType::kStandard;
    int section_size = 0;
    int threshold = 0;
    int break_point = 0;
    // Sorting-only points; never part of real scores.
    std::map<std::string, HalfPoints> virtual_points;
    // Added-score (USCF 28R1) values, tracked apart from virtual points.
    std::map<std::string, HalfPoints> added_scores;

    bool applied() const { return status == AccelerationStatus::kApplied; }
    HalfPoints VirtualFor(const std::string& player_id) const;
    HalfPoints AddedFor(const std::string& player_id) const;
    std::string Describe() const;
};

class Acceleration {
public:
    // seeded holds the section's active players in initial ranking order.
    static AccelerationReport Evaluate(const std::string& section,
                                       const std::vector<const Player*>& seeded,
                                       int round_number,
                                       const api::EngineConfig& config);

    static int DefaultThreshold(int rounds);
    static int StandardBreakPoint(int section_size, int configured);
};

const char* AccelerationStatusName(AccelerationStatus status);

}  // namespace pairkit::core::tournament
