#include "pairkit/core/tournament/ColorAllocator.h"

#include <cstdlib>

namespace pairkit::core::tournament {

namespace {

bool Forbidden(const ColorState& state, Color color, const ColorRules& rules) {
    const ColorState next = state.After(color);
    return ViolatesEqualization(next, rules) || ViolatesAlternation(next, rules);
}

}  // namespace

ColorState ColorState::After(Color color) const {
    ColorState next = *this;
    if (color == Color::kWhite) {
        next.whites += 1;
    } else if (color == Color::kBlack) {
        next.blacks += 1;
    } else {
        return next;
    }
    if (next.last == color) {
        next.streak += 1;
    } else {
        next.last = color;
        next.streak = 1;
    }
    return next;
}

bool ViolatesEqualization(const ColorState& state, const ColorRules& rules) {
    return std::abs(state.difference()) > rules.equalization_limit;
}

bool ViolatesAlternation(const ColorState& state, const ColorRules& rules) {
    return state.last != Color::kNone && state.streak > rules.alternation_limit;
}

ColorPreference PreferenceFor(const ColorState& state, const ColorRules& rules) {
    ColorPreference preference;
    if (state.empty()) {
        return preference;
    }
    const bool white_forbidden = Forbidden(state, Color::kWhite, rules);
    const bool black_forbidden = Forbidden(state, Color::kBlack, rules);
    if (white_forbidden != black_forbidden) {
        preference.color = white_forbidden ? Color::kBlack : Color::kWhite;
        preference.strength = PreferenceStrength::kAbsolute;
        return preference;
    }
    if (state.difference() != 0) {
        preference.color = state.difference() > 0 ? Color::kBlack : Color::kWhite;
        preference.strength = PreferenceStrength::kStrong;
        return preference;
    }
    preference.color = Opposite(state.last);
    preference.strength = PreferenceStrength::kMild;
    return preference;
}

bool ColorsCompatible(const ColorState& a, const ColorState& b, const ColorRules& rules) {
    const auto pa = PreferenceFor(a, rules);
    const auto pb = PreferenceFor(b, rules);
    return !(pa.strength == PreferenceStrength::kAbsolute && pb.strength == PreferenceStrength::kAbsolute &&
             pa.color == pb.color);
}

ColorAssignment AssignColors(const ColorState& higher,
                             const ColorState& lower,
                             const ColorRules& rules,
                             Color default_for_higher) {
    ColorAssignment assignment;
    const auto ph = PreferenceFor(higher, rules);
    const auto pl = PreferenceFor(lower, rules);
    const bool h_absolute = ph.strength == PreferenceStrength::kAbsolute;
    const bool l_absolute = pl.strength == PreferenceStrength::kAbsolute;

    if (h_absolute && l_absolute && ph.color == pl.color) {
        // Both are bound to the same color: the larger imbalance wins, then rank.
        assignment.absolute_conflict = true;
        const int h_imbalance = std::abs(higher.difference());
        const int l_imbalance = std::abs(lower.difference());
        const bool higher_takes = h_imbalance >= l_imbalance;
        const Color higher_color = higher_takes ? ph.color : Opposite(pl.color);
        assignment.higher_gets_white = higher_color == Color::kWhite;
        return assignment;
    }
    if (h_absolute) {
        assignment.higher_gets_white = ph.color == Color::kWhite;
        return assignment;
    }
    if (l_absolute) {
        assignment.higher_gets_white = pl.color == Color::kBlack;
        return assignment;
    }

    // Equalization first: the side that has had fewer whites takes white.
    if (!higher.empty() && !lower.empty() && higher.difference() != lower.difference()) {
        assignment.higher_gets_white = higher.difference() < lower.difference();
        return assignment;
    }
    if (higher.empty() != lower.empty()) {
        const auto& seasoned = higher.empty() ? pl : ph;
        if (seasoned.strength != PreferenceStrength::kNone) {
            const bool seasoned_white = seasoned.color == Color::kWhite;
            assignment.higher_gets_white = higher.empty() ? !seasoned_white : seasoned_white;
            return assignment;
        }
    }

    // Then alternation from each player's most recent color.
    if (higher.last != Color::kNone && lower.last != Color::kNone && higher.last != lower.last) {
        assignment.higher_gets_white = higher.last == Color::kBlack;
        return assignment;
    }
    if (ph.strength != PreferenceStrength::kNone) {
        assignment.higher_gets_white = ph.color == Color::kWhite;
        return assignment;
    }
    assignment.higher_gets_white = default_for_higher != Color::kBlack;
    return assignment;
}

}  // namespace pairkit::core::tournament
