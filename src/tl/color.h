#pragma once

#include <string>

#include "tl/int.h"

namespace tl {

/// Additive color accumulator.
///
/// Channels are kept as doubles and may run past 255 while colors are being
/// summed; only pack() clamps. A color that nothing has contributed to yet is
/// "empty", which is not the same thing as explicit black: adding an empty
/// color changes nothing, and scaling an empty color keeps it empty.
class Color {
  public:
    /// Empty color.
    Color() : mRed(0), mGreen(0), mBlue(0), mEmpty(true) {}

    /// Three zero channels also produce an empty color.
    Color(double red, double green, double blue)
        : mRed(red), mGreen(green), mBlue(blue),
          mEmpty(red == 0 && green == 0 && blue == 0) {}

    double red() const { return mRed; }
    double green() const { return mGreen; }
    double blue() const { return mBlue; }
    bool isEmpty() const { return mEmpty; }

    /// Merge @p rhs into this color. An empty @p rhs is a no-op; an empty
    /// left side adopts @p rhs.
    Color &operator+=(const Color &rhs);

    /// Multiply every channel by @p factor, negative factors count as 0.
    Color &operator*=(double factor);

    /// Hardware word: red in bits 8-15, green in bits 16-23, blue in bits 0-7.
    /// Empty colors pack to 0.
    u32 pack() const;

    std::string toString() const;

  private:
    double mRed;
    double mGreen;
    double mBlue;
    bool mEmpty;
};

inline Color operator+(Color lhs, const Color &rhs) {
    lhs += rhs;
    return lhs;
}

inline Color operator*(Color lhs, double factor) {
    lhs *= factor;
    return lhs;
}

// Channel extraction from a packed hardware word.
inline u8 packedRed(u32 packed) { return (packed >> 8) & 0xFF; }
inline u8 packedGreen(u32 packed) { return (packed >> 16) & 0xFF; }
inline u8 packedBlue(u32 packed) { return packed & 0xFF; }

} // namespace tl
