#include "tl/fx/pattern_factory.h"

#include "tl/fx/1d/fade.h"
#include "tl/fx/1d/moving_dots.h"
#include "tl/fx/1d/rainbow.h"
#include "tl/fx/1d/sparkling.h"
#include "tl/warn.h"

namespace tl {

const char *patternName(PatternKind kind) {
    switch (kind) {
    case PATTERN_RAINBOW:
        return "Rainbow";
    case PATTERN_MOVING_DOTS_1:
        return "MovingDots1";
    case PATTERN_MOVING_DOTS_2:
        return "MovingDots2";
    case PATTERN_COMBINE:
        return "Combine";
    case PATTERN_FADE_1:
        return "Fade1";
    case PATTERN_FADE_2:
        return "Fade2";
    case PATTERN_SPARKLING_1:
        return "Sparkling1";
    }
    return "Unknown";
}

PatternPtr makePattern(PatternKind kind, u16 numLeds, Random &rng) {
    switch (kind) {
    case PATTERN_RAINBOW:
        return PatternPtr(new Rainbow(numLeds, rng));
    case PATTERN_MOVING_DOTS_1:
        return PatternPtr(new MovingDots1(numLeds, rng));
    case PATTERN_MOVING_DOTS_2:
        return PatternPtr(new MovingDots2(numLeds, rng));
    case PATTERN_COMBINE:
        return PatternPtr(new Combine(numLeds, rng));
    case PATTERN_FADE_1:
        return PatternPtr(new Fade1(numLeds, rng));
    case PATTERN_FADE_2:
        return PatternPtr(new Fade2(numLeds, rng));
    case PATTERN_SPARKLING_1:
        return PatternPtr(new Sparkling1(numLeds, rng));
    }
    TL_WARN("unknown pattern kind " << int(kind) << ", using Rainbow");
    return PatternPtr(new Rainbow(numLeds, rng));
}

} // namespace tl
