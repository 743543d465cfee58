#pragma once

#include "tl/int.h"

// X(n+1) = (2053 * X(n)) + 13849
#define TREELIGHTS_RAND16_2053 ((tl::u16)(2053))
#define TREELIGHTS_RAND16_13849 ((tl::u16)(13849))
#define TREELIGHTS_RAND16_SEED 1337

namespace tl {

/// @brief Seeded pseudo-random generator handed to every pattern.
///
/// Each instance keeps its own seed state, so a show seeded once at startup
/// replays the same sequence of scenes and sparkles.
///
/// @code
/// tl::Random rng(42);
/// tl::u32 hue = rng(256);          // [0, 256)
/// tl::i32 drift = rng.randomInt(-100, 100);
/// @endcode
class Random {
  private:
    u16 seed_;

    u16 next_random16() {
        seed_ = (u16)(seed_ * TREELIGHTS_RAND16_2053) + TREELIGHTS_RAND16_13849;
        return seed_;
    }

    u32 next_random32() {
        u32 high = next_random16();
        u32 low = next_random16();
        return (high << 16) | low;
    }

  public:
    typedef u32 result_type;

    Random() : seed_(TREELIGHTS_RAND16_SEED) {}

    explicit Random(u16 seed) : seed_(seed) {}

    /// A random number in [0, n), 0 when n is 0
    result_type operator()(result_type n) {
        if (n == 0) {
            return 0;
        }
        u32 r = next_random32();
        u64 p = (u64)n * (u64)r;
        return (u32)(p >> 32);
    }

    /// A random number in [min, max)
    result_type operator()(result_type min, result_type max) {
        result_type delta = max - min;
        result_type r = (*this)(delta) + min;
        return r;
    }

    /// A random signed number in [min, max), min when the range is empty
    i32 randomInt(i32 min, i32 max) {
        if (max <= min) {
            return min;
        }
        u32 delta = (u32)(max - min);
        return min + (i32)(*this)(delta);
    }

    void set_seed(u16 seed) { seed_ = seed; }

    u16 get_seed() const { return seed_; }

    /// Mix @p entropy into the current seed
    void add_entropy(u16 entropy) { seed_ += entropy; }

    u16 random16() { return next_random16(); }

    u16 random16(u16 n) { return static_cast<u16>((*this)(n)); }

    u16 random16(u16 min, u16 max) {
        return static_cast<u16>((*this)(min, max));
    }
};

/// Seed for a fresh show: clock and address-space entropy folded to 16 bits.
u16 entropySeed();

} // namespace tl
