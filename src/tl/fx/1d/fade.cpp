#include "tl/fx/1d/fade.h"

#include "tl/fx/detail/breathing.h"
#include "tl/palette.h"

namespace tl {

const u16 Fade1::kLifetime;

Fade1::Fade1(u16 numLeds, Random &rng)
    : PixelTimerPattern(numLeds, rng), mColor(wheel(rng(256))) {}

Color Fade1::sample(u16 index) const {
    const u16 s = mTimers[index];
    if (s == 0) {
        return Color();
    }
    Color c = mColor;
    if (s < 20) {
        c *= s / 20.0;
    } else {
        c *= (25 - s) / 5.0;
    }
    return c;
}

void Fade1::advance() {
    countdown();
    if (mNumLeds && (*mRng)(5) == 0) {
        const u16 i = mRng->random16(mNumLeds);
        if (mTimers[i] == 0) {
            mTimers[i] = kLifetime;
        }
    }
}

Fade2::Fade2(u16 numLeds, Random &rng)
    : PixelTimerPattern(numLeds, rng), mHigh(wheel(rng(256))),
      mLow(fixcolor(rng(7))) {
    mLow *= 0.08;
    for (size_t i = 0; i < mTimers.size(); ++i) {
        mTimers[i] = rng.random16(breathing::kSlow2);
    }
}

Color Fade2::sample(u16 index) const {
    using namespace breathing;
    const u16 s = mTimers[index];
    Color ret = mLow;
    if (s <= kSlow2) {
        ret *= level(s);
        return ret;
    }
    Color high = mHigh;
    if (s < kFlashEnd) {
        high *= double(s - kSlow2) / kFast;
        ret += high;
        return ret;
    }
    // Top of the flash: the background does not show through.
    high *= double(kFlashTop - s) / 5;
    return high;
}

void Fade2::advance() {
    countdownWrap(breathing::kSlow2);
    if (mNumLeds && (*mRng)(10) == 0) {
        const u16 i = mRng->random16(mNumLeds);
        if (mTimers[i] <= breathing::kSlow2) {
            mTimers[i] = breathing::kFlashEnd + 4;
        }
    }
}

} // namespace tl
