#pragma once

#include "tl/fx/pattern.h"

namespace tl {

/// @brief Soft blobs of one hue drifting along a sine wave.
class MovingDots1 : public Pattern {
  public:
    MovingDots1(u16 numLeds, Random &rng, double brightness = 1.0,
                double speed = 1.0);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "MovingDots1"; }

    double wave() const { return mWave; }
    double shift() const { return mShift; }

  private:
    double mBrightness;
    Color mColor;
    double mWave;
    double mShift;
    double mPhase = 0;
};

/// @brief One to three narrow dots per strip length, sliding around.
class MovingDots2 : public Pattern {
  public:
    MovingDots2(u16 numLeds, Random &rng);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "MovingDots2"; }

    double wave() const { return mWave; }
    double speed() const { return mSpeed; }

  private:
    Color mColor;
    double mWave;
    double mSpeed;
    double mPhase = 0;
};

/// @brief Dim, slow MovingDots1 under a regular MovingDots2.
class Combine : public Pattern {
  public:
    Combine(u16 numLeds, Random &rng);

    Color sample(u16 index) const override;
    void advance() override;
    std::string fxName() const override { return "Combine"; }

  private:
    MovingDots1 mBackground;
    MovingDots2 mDots;
};

} // namespace tl
