#pragma once

#include <math.h>

#include "tl/math_macros.h"

#include "tl/fx/pattern.h"
#include "tl/palette.h"

namespace tl {

/// @brief Hue wheel scrolling along the strip under a slowly travelling sine
/// brightness wave.
class Rainbow : public Pattern {
  public:
    Rainbow(u16 numLeds, Random &rng)
        : Pattern(numLeds), mWave(rng(2, 5) / 10.0),
          mShift(rng(20, 100) / 200.0) {}

    Color sample(u16 index) const override {
        Color c = wheel((mHue + index) & 255);
        c *= sin(index * mWave + mPhase) * 0.4 + 0.6;
        return c;
    }

    void advance() override {
        mHue = (mHue + 1) & 255;
        mPhase = fmod(mPhase + mShift, TL_TWO_PI);
    }

    std::string fxName() const override { return "Rainbow"; }

    double wave() const { return mWave; }
    double shift() const { return mShift; }

  private:
    u16 mHue = 0;
    double mPhase = 0;
    double mWave;
    double mShift;
};

} // namespace tl
