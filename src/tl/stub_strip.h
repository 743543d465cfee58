#pragma once

#include <vector>

#include "tl/strip.h"

namespace tl {

// In-memory strip: keeps the pixel buffer and a copy of the last frame that
// was shown. Used when no hardware is attached and by the tests.
class StubStrip : public StripDriver {
  public:
    bool begin(u16 numLeds, const HardwareConfig &hardware) override;
    void setPixel(u16 index, u32 packed) override;
    void show() override;
    u16 size() const override { return u16(mPixels.size()); }

    bool isInitialized() const { return mInitialized; }
    const HardwareConfig &hardware() const { return mHardware; }

    /// Buffer as last written by setPixel().
    const std::vector<u32> &pixels() const { return mPixels; }
    /// Buffer as of the last show().
    const std::vector<u32> &shown() const { return mShown; }
    u32 showCount() const { return mShowCount; }

  private:
    bool mInitialized = false;
    HardwareConfig mHardware;
    std::vector<u32> mPixels;
    std::vector<u32> mShown;
    u32 mShowCount = 0;
};

} // namespace tl
