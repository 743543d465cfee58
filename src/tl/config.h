#pragma once

#include "tl/int.h"

#ifndef TREELIGHTS_DEFAULT_NUM_LEDS
#define TREELIGHTS_DEFAULT_NUM_LEDS 100
#endif

#ifndef TREELIGHTS_DEFAULT_WAIT_SECONDS
#define TREELIGHTS_DEFAULT_WAIT_SECONDS 20
#endif

namespace tl {

// Driver parameters for a WS281x strip on a single PWM/DMA channel.
struct HardwareConfig {
    int pin = 18;                ///< GPIO pin (18 uses PWM)
    u32 frequencyHz = 800000;    ///< LED signal frequency
    int dma = 10;                ///< DMA channel
    u8 brightness = 255;         ///< 0 darkest, 255 brightest
    bool invert = false;         ///< invert the signal (NPN level shifter)
    int channel = 0;             ///< 1 for GPIOs 13, 19, 41, 45 or 53
};

/// Everything the light show reads at startup.
struct ShowConfig {
    static const int kNoFixedPattern = -1;
    /// Longest scene whose deadline still fits the signed 32-bit millisecond
    /// comparison, about 24.8 days.
    static const int kMaxWaitSeconds = 2147483;

    int fixedPattern = kNoFixedPattern;
    int waitSeconds = TREELIGHTS_DEFAULT_WAIT_SECONDS;
    bool reportFps = false;
    bool verbose = false;
    bool clearOnExit = false;
    u16 numLeds = TREELIGHTS_DEFAULT_NUM_LEDS;
    HardwareConfig hardware;

    bool hasFixedPattern() const { return fixedPattern != kNoFixedPattern; }

    /// Scene duration in milliseconds, clamped to [0, kMaxWaitSeconds].
    u32 waitMs() const {
        if (waitSeconds <= 0) {
            return 0;
        }
        if (waitSeconds > kMaxWaitSeconds) {
            return u32(kMaxWaitSeconds) * 1000;
        }
        return u32(waitSeconds) * 1000;
    }

    /// Clamp the wait into [0, kMaxWaitSeconds] and drop a fixed pattern
    /// index that names no pattern. Each correction is reported with TL_WARN.
    /// @return true if nothing had to be corrected.
    bool sanitize();
};

} // namespace tl
