#pragma once

#include "tl/int.h"

namespace tl {

// Frame-stepped progress of a cross-fade. Progress moves by 1/kSteps per
// step() and is counted in whole steps, so completion lands on exactly 1.
class Transition {
  public:
    static const u8 kSteps = 50;

    Transition() : mStep(0), mNotStarted(true) {}

    double getProgress() const {
        if (mNotStarted) {
            return 0;
        }
        return double(mStep) / kSteps;
    }

    void start() {
        mNotStarted = false;
        mStep = 0;
    }

    void step() {
        if (!mNotStarted && mStep < kSteps) {
            ++mStep;
        }
    }

    void end() {
        mNotStarted = true;
        mStep = 0;
    }

    bool isTransitioning() const { return !mNotStarted; }

    bool isComplete() const { return !mNotStarted && mStep >= kSteps; }

  private:
    u8 mStep;
    bool mNotStarted;
};

} // namespace tl
