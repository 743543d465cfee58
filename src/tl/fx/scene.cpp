#include "tl/fx/scene.h"

#include <utility>

#include "tl/io.h"
#include "tl/strstream.h"
#include "tl/warn.h"

namespace tl {

const u8 Transition::kSteps;

SceneScheduler::SceneScheduler(u16 numLeds, Random &rng,
                               const ShowConfig &config)
    : mNumLeds(numLeds), mRng(&rng), mFixedPattern(config.fixedPattern),
      mWaitMs(config.waitMs()),
      mVerbose(config.verbose) {
    if (config.hasFixedPattern() && !isPatternIndex(config.fixedPattern)) {
        TL_WARN("ignoring fixed pattern " << config.fixedPattern);
        mFixedPattern = ShowConfig::kNoFixedPattern;
    }
}

void SceneScheduler::begin(u32 now) {
    mIncoming.reset();
    mTransition.end();
    mActive = selectPattern(&mActiveKind);
    mDeadline = now + mWaitMs;
}

Color SceneScheduler::crossFade(const Color &from, const Color &to,
                                double mix) {
    Color out = from;
    out *= 1.0 - mix;
    Color in = to;
    in *= mix;
    out += in;
    return out;
}

Color SceneScheduler::render(u16 index) const {
    if (!mActive) {
        return Color();
    }
    if (!mIncoming) {
        return mActive->sample(index);
    }
    return crossFade(mActive->sample(index), mIncoming->sample(index), mix());
}

void SceneScheduler::advanceFrame(u32 now) {
    if (!mActive) {
        TL_WARN("advanceFrame() before begin()");
        begin(now);
        return;
    }
    mActive->advance();
    if (!mIncoming) {
        // Signed difference keeps the comparison valid across clock wrap.
        if (i32(now - mDeadline) > 0) {
            startTransition();
        }
        return;
    }
    mTransition.step();
    if (mTransition.isComplete()) {
        completeTransition(now);
        return;
    }
    mIncoming->advance();
}

PatternPtr SceneScheduler::selectPattern(PatternKind *kind) {
    if (mFixedPattern != ShowConfig::kNoFixedPattern) {
        *kind = PatternKind(mFixedPattern);
    } else {
        *kind = PatternKind((*mRng)(kPatternCount));
    }
    if (mVerbose) {
        println((StrStream() << "Next scene: " << patternName(*kind)).c_str());
    }
    return makePattern(*kind, mNumLeds, *mRng);
}

void SceneScheduler::startTransition() {
    mIncoming = selectPattern(&mIncomingKind);
    mTransition.start();
}

void SceneScheduler::completeTransition(u32 now) {
    mActive = std::move(mIncoming);
    mActiveKind = mIncomingKind;
    mTransition.end();
    mDeadline = now + mWaitMs;
    ++mTransitionCount;
    TL_DBG("scene " << patternName(mActiveKind) << " active, next change at "
                    << mDeadline);
}

} // namespace tl
