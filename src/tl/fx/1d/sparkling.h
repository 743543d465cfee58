#pragma once

#include "tl/fx/pattern.h"

namespace tl {

/// @brief Breathing background tint (as Fade2) with random full-brightness
/// sparkles. A sample sparkles with probability 1 / (10 * numLeds), so on
/// average one pixel every ten frames.
class Sparkling1 : public PixelTimerPattern {
  public:
    Sparkling1(u16 numLeds, Random &rng);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "Sparkling1"; }

  private:
    Color mHigh;
    Color mLow;
};

} // namespace tl
