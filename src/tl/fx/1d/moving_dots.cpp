#include "tl/fx/1d/moving_dots.h"

#include <math.h>

#include "tl/math_macros.h"
#include "tl/palette.h"

namespace tl {

namespace {

const double kTwoPi = TL_TWO_PI;

// Below this envelope value a dot pixel is off.
const double kDotThreshold = 0.1;

Color dot(const Color &color, double envelope) {
    if (envelope < kDotThreshold) {
        return Color();
    }
    Color c = color;
    c *= envelope;
    return c;
}

} // namespace

MovingDots1::MovingDots1(u16 numLeds, Random &rng, double brightness,
                         double speed)
    : Pattern(numLeds), mBrightness(brightness), mColor(wheel(rng(256))),
      mWave(rng(2, 5) / 10.0),
      mShift(rng.randomInt(-100, 100) / 200.0 * speed) {}

Color MovingDots1::sample(u16 index) const {
    return dot(mColor, sin(index * mWave + mPhase) * mBrightness);
}

void MovingDots1::advance() { mPhase = fmod(mPhase + mShift, kTwoPi); }

MovingDots2::MovingDots2(u16 numLeds, Random &rng)
    : Pattern(numLeds), mColor(wheel(rng(256))),
      mWave(numLeds ? kTwoPi * (rng(3) + 1) / numLeds : 0.0),
      mSpeed(rng.randomInt(-100, 100) / 200.0) {}

Color MovingDots2::sample(u16 index) const {
    return dot(mColor, sin(index * mWave + mPhase) * 4 - 3);
}

void MovingDots2::advance() { mPhase = fmod(mPhase + mSpeed, kTwoPi); }

Combine::Combine(u16 numLeds, Random &rng)
    : Pattern(numLeds), mBackground(numLeds, rng, 0.2, 0.1),
      mDots(numLeds, rng) {}

Color Combine::sample(u16 index) const {
    Color c = mBackground.sample(index);
    c += mDots.sample(index);
    return c;
}

void Combine::advance() {
    mBackground.advance();
    mDots.advance();
}

} // namespace tl
