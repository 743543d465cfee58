#pragma once

#include "tl/int.h"

namespace tl {

/// Adaptive frame pacing for a 25 fps loop.
///
/// The pacer tracks the intended time of the next tick. When at least
/// kMinSleepMs remain until that tick it sleeps the remainder and moves the
/// tick one period on. When the frame overran it sleeps the floor and
/// restarts the schedule at now + kCatchUpMs, so a long stall never turns
/// into a burst of back-to-back frames.
class FramePacer {
  public:
    static const u32 kFrameMs = 40;
    static const u32 kMinSleepMs = 10;
    static const u32 kCatchUpMs = 50;

    void begin(u32 now) { mNextTick = now + kFrameMs; }

    /// @return how long to sleep before the next frame, never below
    /// kMinSleepMs.
    u32 nextSleep(u32 now);

    u32 nextTick() const { return mNextTick; }

  private:
    u32 mNextTick = kFrameMs;
};

/// Frames-per-second counter reporting once per elapsed wall-clock second.
class FpsCounter {
  public:
    void begin(u32 now) {
        mMark = now;
        mFrames = 0;
    }

    /// Count one frame. @return true and set @p fps when a second has
    /// elapsed since the last report.
    bool frame(u32 now, u32 *fps) {
        ++mFrames;
        if (i32(now - (mMark + 1000)) >= 0) {
            mMark += 1000;
            *fps = mFrames;
            mFrames = 0;
            return true;
        }
        return false;
    }

  private:
    u32 mMark = 0;
    u32 mFrames = 0;
};

} // namespace tl
