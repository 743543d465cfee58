#pragma once

#include "tl/color.h"
#include "tl/config.h"
#include "tl/fx/detail/transition.h"
#include "tl/fx/pattern.h"
#include "tl/fx/pattern_factory.h"
#include "tl/int.h"
#include "tl/random.h"

namespace tl {

/**
 * @class SceneScheduler
 * @brief Picks patterns, times scenes and cross-fades between them.
 *
 * The scheduler is either showing a single pattern or fading from the
 * active pattern to an incoming one:
 * - While single, the first frame after the scene deadline selects the
 *   incoming pattern and starts a transition at mix 0.
 * - While transitioning, every frame moves the mix by 1/50. On reaching 1
 *   the incoming pattern replaces the active one and the next scene deadline
 *   is set to now + wait.
 */
class SceneScheduler {
  public:
    /**
     * @param numLeds Pixels per pattern.
     * @param rng Random source for scene selection and pattern parameters.
     *            Must outlive the scheduler.
     * @param config Sanitized show configuration (fixed pattern, wait,
     *               verbose).
     */
    SceneScheduler(u16 numLeds, Random &rng, const ShowConfig &config);

    /**
     * @brief Selects the first scene and arms the scene deadline.
     * @param now The current time in milliseconds.
     */
    void begin(u32 now);

    /// Output color for one pixel of the current frame.
    Color render(u16 index) const;

    /**
     * @brief Advances the active pattern(s) by one frame and runs the scene
     * state machine. Call once per frame after every pixel was rendered.
     * @param now The current time in milliseconds.
     */
    void advanceFrame(u32 now);

    bool isTransitioning() const { return mIncoming.get() != nullptr; }

    /// Cross-fade progress in [0,1]; 0 while single.
    double mix() const { return mTransition.getProgress(); }

    PatternKind activeKind() const { return mActiveKind; }
    PatternKind incomingKind() const { return mIncomingKind; }

    const Pattern *active() const { return mActive.get(); }
    const Pattern *incoming() const { return mIncoming.get(); }

    u32 nextTransitionDeadline() const { return mDeadline; }

    /// Number of completed cross-fades.
    u32 transitionCount() const { return mTransitionCount; }

    /// Linear blend used by render(): @p from scaled by (1 - mix) merged with
    /// @p to scaled by mix.
    static Color crossFade(const Color &from, const Color &to, double mix);

  private:
    PatternPtr selectPattern(PatternKind *kind);
    void startTransition();
    void completeTransition(u32 now);

    u16 mNumLeds;
    Random *mRng;
    int mFixedPattern;
    u32 mWaitMs;
    bool mVerbose;

    PatternPtr mActive;
    PatternPtr mIncoming;
    PatternKind mActiveKind = PATTERN_RAINBOW;
    PatternKind mIncomingKind = PATTERN_RAINBOW;
    Transition mTransition;
    u32 mDeadline = 0;
    u32 mTransitionCount = 0;
};

} // namespace tl
