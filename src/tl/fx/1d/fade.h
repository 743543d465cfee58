#pragma once

#include "tl/fx/pattern.h"

namespace tl {

/// @brief Random pixels flare up in one hue and fade out again.
///
/// Each pixel owns a countdown. A triggered pixel starts at 24: it rises to
/// full brightness over the first five frames and dims over the remaining
/// twenty.
class Fade1 : public PixelTimerPattern {
  public:
    static const u16 kLifetime = 24;

    Fade1(u16 numLeds, Random &rng);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "Fade1"; }

  private:
    Color mColor;
};

/// @brief Breathing background tint with occasional bright flashes.
///
/// The background is a dim palette color (8%) whose brightness follows the
/// per-pixel breathing phase. Now and then a pixel in the background range is
/// kicked into the flash range and flares in the accent hue.
class Fade2 : public PixelTimerPattern {
  public:
    Fade2(u16 numLeds, Random &rng);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "Fade2"; }

  private:
    Color mHigh;
    Color mLow;
};

} // namespace tl
