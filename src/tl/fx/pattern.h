#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tl/color.h"
#include "tl/int.h"
#include "tl/random.h"

namespace tl {

class Pattern;
typedef std::unique_ptr<Pattern> PatternPtr;

// Abstract base class for the per-pixel pattern generators on a strip.
//
// A pattern is sampled once per pixel per frame and then advanced once.
// sample() must not change what later samples of the same frame return.
class Pattern {
  public:
    explicit Pattern(u16 numLeds) : mNumLeds(numLeds) {}
    virtual ~Pattern() {}

    virtual Color sample(u16 index) const = 0;

    // Step the animation by one frame.
    virtual void advance() = 0;

    virtual std::string fxName() const = 0;

    u16 getNumLeds() const { return mNumLeds; }

  protected:
    u16 mNumLeds;
};

// Base for patterns that keep an independent countdown per pixel.
class PixelTimerPattern : public Pattern {
  public:
    PixelTimerPattern(u16 numLeds, Random &rng)
        : Pattern(numLeds), mTimers(numLeds, 0), mRng(&rng) {}

    u16 timer(u16 index) const { return mTimers[index]; }

  protected:
    // Decrement every running timer, idle ones stay at 0.
    void countdown();

    // Decrement every timer; a timer already at 0 restarts at @p period.
    void countdownWrap(u16 period);

    std::vector<u16> mTimers;
    Random *mRng;
};

} // namespace tl
