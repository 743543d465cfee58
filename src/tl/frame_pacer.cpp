#include "tl/frame_pacer.h"

namespace tl {

const u32 FramePacer::kFrameMs;
const u32 FramePacer::kMinSleepMs;
const u32 FramePacer::kCatchUpMs;

u32 FramePacer::nextSleep(u32 now) {
    const i32 remaining = i32(mNextTick - now);
    if (remaining >= i32(kMinSleepMs)) {
        mNextTick += kFrameMs;
        return u32(remaining);
    }
    mNextTick = now + kCatchUpMs;
    return kMinSleepMs;
}

} // namespace tl
