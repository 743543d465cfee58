#include "tl/show.h"

#include "tl/delay.h"
#include "tl/io.h"
#include "tl/strstream.h"
#include "tl/time.h"
#include "tl/warn.h"

namespace tl {

namespace {
ShowConfig sanitized(ShowConfig config) {
    config.sanitize();
    return config;
}
} // namespace

LightShow::LightShow(StripDriver &strip, Random &rng, const ShowConfig &config)
    : mStrip(strip), mConfig(sanitized(config)),
      mScheduler(mConfig.numLeds, rng, mConfig), mStopRequested(false) {}

bool LightShow::begin() {
    if (!mStrip.begin(mConfig.numLeds, mConfig.hardware)) {
        TL_WARN("strip initialization failed");
        return false;
    }
    const u32 now = tl::time();
    mScheduler.begin(now);
    mPacer.begin(now);
    mFps.begin(now);
    mFrameCount = 0;
    return true;
}

void LightShow::step() {
    for (u16 i = 0; i < mConfig.numLeds; ++i) {
        mStrip.setPixel(i, mScheduler.render(i).pack());
    }
    mStrip.show();
    ++mFrameCount;

    u32 now = tl::time();
    mScheduler.advanceFrame(now);

    u32 fps = 0;
    if (mConfig.reportFps && mFps.frame(now, &fps)) {
        println((StrStream() << "FPS: " << fps).c_str());
    }

    now = tl::time();
    tl::delay(mPacer.nextSleep(now));
}

u32 LightShow::run() {
    const u32 start = mFrameCount;
    while (!stopRequested()) {
        step();
    }
    if (mConfig.clearOnExit) {
        clear();
    }
    return mFrameCount - start;
}

void LightShow::clear() {
    for (u16 i = 0; i < mConfig.numLeds; ++i) {
        mStrip.setPixel(i, 0);
    }
    mStrip.show();
}

} // namespace tl
