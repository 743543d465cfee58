#include "tl/fx/1d/sparkling.h"

#include "tl/fx/detail/breathing.h"
#include "tl/palette.h"

namespace tl {

Sparkling1::Sparkling1(u16 numLeds, Random &rng)
    : PixelTimerPattern(numLeds, rng), mHigh(wheel(rng(256))),
      mLow(fixcolor(rng(7))) {
    mLow *= 0.08;
    for (size_t i = 0; i < mTimers.size(); ++i) {
        mTimers[i] = rng.random16(breathing::kSlow2);
    }
}

Color Sparkling1::sample(u16 index) const {
    if ((*mRng)(u32(mNumLeds) * 10) == 0) {
        return mHigh;
    }
    Color ret = mLow;
    ret *= breathing::level(mTimers[index]);
    return ret;
}

void Sparkling1::advance() { countdownWrap(breathing::kSlow2); }

} // namespace tl
