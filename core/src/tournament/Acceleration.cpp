#include "pairkit/core/tournament/Acceleration.h"

#include <algorithm>
#include <sstream>

namespace pairkit::core::tournament {

namespace {

int CeilDiv(int value, int divisor) {
    return (value + divisor - 1) / divisor;
}

bool InWindow(const api::AccelerationConfig& acceleration, int round_number) {
    if (acceleration.type == api::AccelerationType::kAllRounds) {
        return true;
    }
    return round_number <= acceleration.rounds;
}

}  // namespace

HalfPoints AccelerationReport::VirtualFor(const std::string& player_id) const {
    const auto it = virtual_points.find(player_id);
    return it == virtual_points.end() ? 0 : it->second;
}

HalfPoints AccelerationReport::AddedFor(const std::string& player_id) const {
    const auto it = added_scores.find(player_id);
    return it == added_scores.end() ? 0 : it->second;
}

std::string AccelerationReport::Describe() const {
    std::ostringstream out;
    out << "acceleration " << AccelerationStatusName(status) << " for section '" << section << "' round "
        << round_number;
    if (status == AccelerationStatus::kDisabled) {
        return out.str();
    }
    out << " (" << api::AccelerationTypeName(type) << ", " << section_size << " players, threshold "
        << threshold;
    if (status == AccelerationStatus::kApplied && break_point > 0) {
        out << ", break point " << break_point;
    }
    out << ")";
    return out.str();
}

int Acceleration::DefaultThreshold(int rounds) {
    const int capped = std::min(std::max(rounds, 0), 29);
    return 1 << (capped + 1);
}

int Acceleration::StandardBreakPoint(int section_size, int configured) {
    int break_point = configured > 0 ? configured : CeilDiv(section_size, 2);
    if (break_point % 2 != 0) {
        break_point += 1;
    }
    return std::min(break_point, section_size);
}

AccelerationReport Acceleration::Evaluate(const std::string& section,
                                          const std::vector<const Player*>& seeded,
                                          int round_number,
                                          const api::EngineConfig& config) {
    AccelerationReport report;
    report.section = section;
    report.round_number = round_number;
    report.type = config.acceleration.type;
    report.section_size = static_cast<int>(seeded.size());
    if (!config.accelerated()) {
        report.status = AccelerationStatus::kDisabled;
        return report;
    }
    report.threshold = config.acceleration.threshold > 0 ? config.acceleration.threshold
                                                         : DefaultThreshold(config.rounds);
    if (!InWindow(config.acceleration, round_number)) {
        report.status = AccelerationStatus::kOutsideWindow;
        return report;
    }
    if (report.section_size <= report.threshold) {
        report.status = AccelerationStatus::kBelowThreshold;
        return report;
    }
    report.status = AccelerationStatus::kApplied;

    const int n = report.section_size;
    switch (config.acceleration.type) {
        case api::AccelerationType::kStandard:
        case api::AccelerationType::kAllRounds: {
            report.break_point = StandardBreakPoint(n, config.acceleration.break_point);
            for (int i = 0; i < report.break_point; ++i) {
                report.virtual_points[seeded[static_cast<size_t>(i)]->id] = 2;
            }
            break;
        }
        case api::AccelerationType::kSixths: {
            // Six bands; each band sits half a point below the one above it.
            const int band_size = CeilDiv(n, 6);
            report.break_point = band_size;
            for (int i = 0; i < n; ++i) {
                const int band = i / band_size;
                const HalfPoints points = std::max(0, 5 - band);
                if (points > 0) {
                    report.virtual_points[seeded[static_cast<size_t>(i)]->id] = points;
                }
            }
            break;
        }
        case api::AccelerationType::kAddedScore: {
            const auto& values = config.acceleration.added_scores;
            const int bands = static_cast<int>(values.size());
            const int band_size = CeilDiv(n, bands);
            report.break_point = band_size;
            for (int i = 0; i < n; ++i) {
                const int band = std::min(i / band_size, bands - 1);
                const HalfPoints points = FromPoints(values[static_cast<size_t>(band)]);
                if (points > 0) {
                    report.added_scores[seeded[static_cast<size_t>(i)]->id] = points;
                }
            }
            break;
        }
    }
    return report;
}

const char* AccelerationStatusName(AccelerationStatus status) {
    switch (status) {
        case AccelerationStatus::kDisabled:
            return "disabled";
        case AccelerationStatus::kOutsideWindow:
            return "outside_window";
        case AccelerationStatus::kBelowThreshold:
            return "below_threshold";
        case AccelerationStatus::kApplied:
            return "applied";
    }
    return "disabled";
}

}  // namespace pairkit::core::tournament
