#pragma once

#include "tl/color.h"
#include "tl/int.h"

namespace tl {

/// Hue wheel over [0,255] in three 85-wide linear segments:
/// green -> red -> blue -> green.
Color wheel(u8 position);

/// Fixed palette: red, green, blue, olive, teal, purple; white for any other
/// index.
Color fixcolor(int index);

} // namespace tl
