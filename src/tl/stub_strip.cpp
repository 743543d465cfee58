#include "tl/stub_strip.h"

#include "tl/warn.h"

namespace tl {

bool StubStrip::begin(u16 numLeds, const HardwareConfig &hardware) {
    if (numLeds == 0) {
        TL_WARN("cannot drive a strip with no pixels");
        return false;
    }
    mHardware = hardware;
    mPixels.assign(numLeds, 0);
    mShown.assign(numLeds, 0);
    mShowCount = 0;
    mInitialized = true;
    TL_DBG("stub strip: " << numLeds << " pixels on pin " << hardware.pin
                          << ", " << hardware.frequencyHz << " Hz, dma "
                          << hardware.dma);
    return true;
}

void StubStrip::setPixel(u16 index, u32 packed) {
    if (index >= mPixels.size()) {
        TL_WARN("pixel " << index << " out of range (" << mPixels.size()
                         << " pixels)");
        return;
    }
    mPixels[index] = packed & 0xFFFFFF;
}

void StubStrip::show() {
    mShown = mPixels;
    ++mShowCount;
}

} // namespace tl
