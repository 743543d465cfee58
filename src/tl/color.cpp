#include "tl/color.h"

#include <math.h>
#include <stdio.h>

#include "tl/strstream.h"

namespace tl {

namespace {

// Clamp into [0,255] before rounding so the packed byte can never overflow.
// nearbyint() rounds half to even under the default rounding mode.
u32 packChannel(double value) {
    if (!(value > 0.0)) {
        return 0;
    }
    if (value > 255.0) {
        value = 255.0;
    }
    return static_cast<u32>(nearbyint(value));
}

} // namespace

Color &Color::operator+=(const Color &rhs) {
    if (rhs.mEmpty) {
        return *this;
    }
    if (mEmpty) {
        mRed = rhs.mRed;
        mGreen = rhs.mGreen;
        mBlue = rhs.mBlue;
        mEmpty = false;
        return *this;
    }
    mRed += rhs.mRed;
    mGreen += rhs.mGreen;
    mBlue += rhs.mBlue;
    return *this;
}

Color &Color::operator*=(double factor) {
    if (mEmpty) {
        return *this;
    }
    if (factor < 0.0) {
        factor = 0.0;
    }
    mRed *= factor;
    mGreen *= factor;
    mBlue *= factor;
    return *this;
}

u32 Color::pack() const {
    if (mEmpty) {
        return 0;
    }
    return (packChannel(mRed) << 8) | (packChannel(mGreen) << 16) |
           packChannel(mBlue);
}

std::string Color::toString() const {
    if (mEmpty) {
        return "Color(empty)";
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "Color(%.2f,%.2f,%.2f)", mRed, mGreen, mBlue);
    return buf;
}

StrStream &StrStream::operator<<(const Color &color) {
    mStr.append(color.toString());
    return *this;
}

} // namespace tl
