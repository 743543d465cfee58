#pragma once

#include <atomic>

#include "tl/config.h"
#include "tl/frame_pacer.h"
#include "tl/fx/scene.h"
#include "tl/int.h"
#include "tl/random.h"
#include "tl/strip.h"

namespace tl {

/**
 * @class LightShow
 * @brief The frame loop: render, push, advance, pace.
 *
 * @code
 * tl::StubStrip strip;
 * tl::Random rng(tl::entropySeed());
 * tl::LightShow show(strip, rng, config);
 * if (show.begin()) {
 *     show.run();   // until stop()
 * }
 * @endcode
 */
class LightShow {
  public:
    /// @p strip and @p rng must outlive the show. @p config is copied and
    /// sanitized.
    LightShow(StripDriver &strip, Random &rng, const ShowConfig &config);

    /// Initialize the strip and select the first scene.
    /// @return false if the strip failed to initialize.
    bool begin();

    /// Render and push one frame, advance the scene, then sleep until the
    /// next tick.
    void step();

    /// Run frames until stop() is requested. A frame in progress always
    /// completes. Clears the strip afterwards if configured.
    /// @return the number of frames shown.
    u32 run();

    /// Request the loop to exit after the current frame. Safe to call from
    /// a signal handler.
    void stop() { mStopRequested.store(true); }

    bool stopRequested() const { return mStopRequested.load(); }

    /// Push an all-zero frame.
    void clear();

    const SceneScheduler &scheduler() const { return mScheduler; }
    const ShowConfig &config() const { return mConfig; }
    const FramePacer &pacer() const { return mPacer; }
    u32 frameCount() const { return mFrameCount; }

  private:
    StripDriver &mStrip;
    ShowConfig mConfig;
    SceneScheduler mScheduler;
    FramePacer mPacer;
    FpsCounter mFps;
    std::atomic<bool> mStopRequested;
    u32 mFrameCount = 0;
};

} // namespace tl
