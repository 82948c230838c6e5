#include "pairkit/core/tournament/PairingErrors.h"

#include <sstream>

namespace pairkit::core::tournament {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidConfiguration:
            return "InvalidConfiguration";
        case ErrorKind::kDataIntegrity:
            return "DataIntegrityError";
        case ErrorKind::kExhaustedSearch:
            return "ExhaustedSearch";
        case ErrorKind::kValidation:
            return "ValidationError";
        case ErrorKind::kNone:
            break;
    }
    return "None";
}

const char* DeviationKindName(DeviationKind kind) {
    switch (kind) {
        case DeviationKind::kSearchExhausted:
            return "search_exhausted";
        case DeviationKind::kRepeatPairing:
            return "repeat_pairing";
        case DeviationKind::kAbsoluteColorConflict:
            return "absolute_color_conflict";
        case DeviationKind::kColorEqualization:
            return "color_equalization_violated";
        case DeviationKind::kColorAlternation:
            return "color_alternation_violated";
        case DeviationKind::kRepeatBye:
            return "repeat_bye";
    }
    return "unknown";
}

std::string DescribeDeviation(const Deviation& deviation) {
    std::ostringstream out;
    out << DeviationKindName(deviation.kind);
    if (!deviation.section.empty()) {
        out << " [" << deviation.section << "]";
    }
    for (size_t i = 0; i < deviation.player_ids.size(); ++i) {
        out << (i == 0 ? " " : ",") << deviation.player_ids[i];
    }
    if (!deviation.detail.empty()) {
        out << ": " << deviation.detail;
    }
    return out.str();
}

}  // namespace pairkit::core::tournament
