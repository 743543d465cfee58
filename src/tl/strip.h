#pragma once

#include "tl/config.h"
#include "tl/int.h"

namespace tl {

// Interface to the physical LED strip. The light show sets every pixel of a
// frame and then calls show() once to push the buffer out.
class StripDriver {
  public:
    virtual ~StripDriver() {}

    /// Prepare the hardware for @p numLeds pixels.
    /// @return false if the strip could not be initialized.
    virtual bool begin(u16 numLeds, const HardwareConfig &hardware) = 0;

    /// @param packed Color word as produced by Color::pack().
    virtual void setPixel(u16 index, u32 packed) = 0;

    /// Push the pixel buffer to the LEDs. May block.
    virtual void show() = 0;

    virtual u16 size() const = 0;
};

} // namespace tl
