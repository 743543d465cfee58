#include "tl/random.h"

#include <chrono>

namespace tl {

u16 entropySeed() {
    const u64 ticks = static_cast<u64>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    static int anchor = 0;
    u64 mixed = ticks ^ (static_cast<u64>(reinterpret_cast<uintptr_t>(&anchor))
                         << 7);
    mixed ^= mixed >> 33;
    mixed *= 0xff51afd7ed558ccdULL;
    mixed ^= mixed >> 33;
    return static_cast<u16>(mixed ^ (mixed >> 16) ^ (mixed >> 32) ^
                            (mixed >> 48));
}

} // namespace tl
