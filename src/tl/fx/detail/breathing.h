#pragma once

#include "tl/int.h"

namespace tl {
namespace breathing {

// Phase layout shared by the breathing patterns. Phases count down:
//   [kFlashEnd, kFlashTop)  flash rising to full at kFlashEnd
//   (kSlow2, kFlashEnd)     flash fading out over the background tint
//   [0, kSlow2]             background, V-shaped around kSlow
const u16 kSlow = 50;
const u16 kSlow2 = kSlow * 2;
const u16 kFast = 20;
const u16 kFlashEnd = kSlow2 + kFast;
const u16 kFlashTop = kFlashEnd + 5;

// Background brightness for a phase in [0, kSlow2]: 1 at both ends, 0 at
// kSlow.
inline double level(u16 phase) {
    if (phase < kSlow) {
        return double(kSlow - phase) / kSlow;
    }
    return double(phase - kSlow) / kSlow;
}

} // namespace breathing
} // namespace tl
