#include "tl/fx/pattern.h"

namespace tl {

void PixelTimerPattern::countdown() {
    for (size_t i = 0; i < mTimers.size(); ++i) {
        if (mTimers[i]) {
            --mTimers[i];
        }
    }
}

void PixelTimerPattern::countdownWrap(u16 period) {
    for (size_t i = 0; i < mTimers.size(); ++i) {
        if (mTimers[i]) {
            --mTimers[i];
        } else {
            mTimers[i] = period;
        }
    }
}

} // namespace tl
