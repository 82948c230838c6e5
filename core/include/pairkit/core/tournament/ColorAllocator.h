#pragma once

#include "pairkit/core/tournament/TournamentTypes.h"

namespace pairkit::core::tournament {

struct ColorState {
    int whites = 0;
    int blacks = 0;
    Color last = Color::kNone;
    int streak = 0;

    int difference() const { return whites - blacks; }
    bool empty() const { return whites == 0 && blacks == 0; }
    ColorState After(Color color) const;
};

struct ColorRules {
    int alternation_limit = 2;
    int equalization_limit = 2;
};

enum class PreferenceStrength {
    kNone,
    kMild,
    kStrong,
    kAbsolute,
};

struct ColorPreference {
    Color color = Color::kNone;
    PreferenceStrength strength = PreferenceStrength::kNone;
};

ColorPreference PreferenceFor(const ColorState& state, const ColorRules& rules);

// False when both players can only take the same color without breaking a limit.
bool ColorsCompatible(const ColorState& a, const ColorState& b, const ColorRules& rules);

bool ViolatesEqualization(const ColorState& state, const ColorRules& rules);
bool ViolatesAlternation(const ColorState& state, const ColorRules& rules);

struct ColorAssignment {
    bool higher_gets_white = true;
    bool absolute_conflict = false;
};

// higher is the better-ranked side; default_for_higher applies when no rule decides.
ColorAssignment AssignColors(const ColorState& higher,
                             const ColorState& lower,
                             const ColorRules& rules,
                             Color default_for_higher);

}  // namespace pairkit::core::tournament
