#include "tl/palette.h"

namespace tl {

Color wheel(u8 position) {
    int pos = position;
    if (pos < 85) {
        return Color(pos * 3, 255 - pos * 3, 0);
    }
    if (pos < 170) {
        pos -= 85;
        return Color(255 - pos * 3, 0, pos * 3);
    }
    pos -= 170;
    return Color(0, pos * 3, 255 - pos * 3);
}

Color fixcolor(int index) {
    switch (index) {
    case 0:
        return Color(255, 0, 0);
    case 1:
        return Color(0, 255, 0);
    case 2:
        return Color(0, 0, 255);
    case 3:
        return Color(128, 128, 0);
    case 4:
        return Color(0, 128, 128);
    case 5:
        return Color(128, 0, 128);
    default:
        return Color(255, 255, 255);
    }
}

} // namespace tl
