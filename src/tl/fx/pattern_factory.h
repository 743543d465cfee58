#pragma once

#include "tl/fx/pattern.h"

namespace tl {

// Every pattern the scene scheduler can pick, in selection-index order.
enum PatternKind {
    PATTERN_RAINBOW = 0,
    PATTERN_MOVING_DOTS_1 = 1,
    PATTERN_MOVING_DOTS_2 = 2,
    PATTERN_COMBINE = 3,
    PATTERN_FADE_1 = 4,
    PATTERN_FADE_2 = 5,
    PATTERN_SPARKLING_1 = 6,
};

const int kPatternCount = 7;

/// @return true if @p index names a PatternKind.
inline bool isPatternIndex(int index) {
    return index >= 0 && index < kPatternCount;
}

const char *patternName(PatternKind kind);

/// Build a freshly randomized pattern of @p kind. Every random parameter is
/// drawn from @p rng, which must outlive the pattern.
PatternPtr makePattern(PatternKind kind, u16 numLeds, Random &rng);

} // namespace tl
