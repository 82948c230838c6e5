#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pairkit::core::tournament {

enum class ErrorKind {
    kNone,
    kInvalidConfiguration,
    kDataIntegrity,
    kExhaustedSearch,
    kValidation,
};

struct PairingError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;
};

// Accepted departures from strict pairing rules. Each one is reported to the caller.
enum class DeviationKind {
    kSearchExhausted,
    kRepeatPairing,
    kAbsoluteColorConflict,
    kColorEqualization,
    kColorAlternation,
    kRepeatBye,
};

struct Deviation {
    DeviationKind kind = DeviationKind::kSearchExhausted;
    std::string section;
    std::vector<std::string> player_ids;
    std::string detail;
};

const char* ErrorKindName(ErrorKind kind);
const char* DeviationKindName(DeviationKind kind);
std::string DescribeDeviation(const Deviation& deviation);

inline bool Fail(PairingError* error, ErrorKind kind, std::string message) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
    }
    return false;
}

}  // namespace pairkit::core::tournament
