#include "test.h"

#include "tl/fx/1d/fade.h"
#include "tl/fx/1d/moving_dots.h"
#include "tl/fx/1d/rainbow.h"
#include "tl/fx/1d/sparkling.h"
#include "tl/fx/detail/breathing.h"
#include "tl/math_macros.h"
#include "tl/palette.h"

TEST_CASE("Rainbow") {
    Random rng(1234);
    Rainbow rainbow(100, rng);

    SUBCASE("parameters drawn from their ranges") {
        const double wave = rainbow.wave();
        const bool validWave = fabs(wave - 0.2) < 1e-9 ||
                               fabs(wave - 0.3) < 1e-9 ||
                               fabs(wave - 0.4) < 1e-9;
        CHECK(validWave);
        CHECK(rainbow.shift() >= 0.1);
        CHECK(rainbow.shift() < 0.5);
    }

    SUBCASE("first frame") {
        // sin(0) * 0.4 + 0.6 on top of wheel(0)
        CHECK_COLOR(rainbow.sample(0), 0, 153, 0);
        const double m = sin(10 * rainbow.wave()) * 0.4 + 0.6;
        const Color expected = wheel(10) * m;
        CHECK_CLOSE(rainbow.sample(10).red(), expected.red(), 0.001f);
        CHECK_CLOSE(rainbow.sample(10).green(), expected.green(), 0.001f);
    }

    SUBCASE("hue and phase move each frame") {
        rainbow.advance();
        const double m = sin(rainbow.shift()) * 0.4 + 0.6;
        const Color expected = wheel(1) * m;
        CHECK_CLOSE(rainbow.sample(0).red(), expected.red(), 0.001f);
        CHECK_CLOSE(rainbow.sample(0).green(), expected.green(), 0.001f);
        CHECK_CLOSE(rainbow.sample(0).blue(), expected.blue(), 0.001f);
    }

    SUBCASE("hue index wraps at 256") {
        Random other(99);
        Rainbow wide(300, other);
        // pixel 256 sees the same hue as pixel 0 before brightness
        const double m = sin(256 * wide.wave()) * 0.4 + 0.6;
        CHECK_CLOSE(channelSum(wide.sample(256)), 255 * m, 0.01f);
        CHECK_CLOSE(wide.sample(256).green(), 255 * m, 0.01f);
    }

    SUBCASE("sample has no side effects") {
        const u32 first = rainbow.sample(42).pack();
        CHECK(rainbow.sample(42).pack() == first);
    }

    CHECK(rainbow.fxName() == "Rainbow");
}

TEST_CASE("MovingDots1") {
    Random rng(55);

    SUBCASE("shift scales with speed") {
        MovingDots1 dots(100, rng);
        CHECK(dots.shift() >= -0.5);
        CHECK(dots.shift() < 0.5);
        MovingDots1 slow(100, rng, 0.2, 0.1);
        CHECK(slow.shift() >= -0.05 - 1e-12);
        CHECK(slow.shift() < 0.05);
    }

    SUBCASE("pixels below the threshold are empty") {
        MovingDots1 dots(100, rng);
        // sin(0) == 0 at pixel 0 on the first frame
        CHECK(dots.sample(0).isEmpty());
        for (int frame = 0; frame < 20; ++frame) {
            for (u16 i = 0; i < 100; ++i) {
                const Color c = dots.sample(i);
                if (!c.isEmpty()) {
                    // envelope in [0.1, 1] times a wheel color
                    CHECK(channelSum(c) >= 0.1f * 255 - 0.01f);
                    CHECK(channelSum(c) <= 255 + 0.01f);
                }
            }
            dots.advance();
        }
    }

    SUBCASE("brightness caps the envelope") {
        MovingDots1 dim(100, rng, 0.2, 1.0);
        int lit = 0;
        for (int frame = 0; frame < 50; ++frame) {
            for (u16 i = 0; i < 100; ++i) {
                const Color c = dim.sample(i);
                if (!c.isEmpty()) {
                    ++lit;
                    CHECK(channelSum(c) <= 0.2f * 255 + 0.01f);
                }
            }
            dim.advance();
        }
        CHECK(lit > 0);
    }
}

TEST_CASE("MovingDots2") {
    Random rng(321);
    const u16 numLeds = 120;
    MovingDots2 dots(numLeds, rng);

    SUBCASE("one to three waves per strip") {
        const double k = dots.wave() * numLeds / TL_TWO_PI;
        const double rounded = floor(k + 0.5);
        CHECK_CLOSE(k, rounded, 0.001f);
        CHECK(rounded >= 1.0);
        CHECK(rounded <= 3.0);
        CHECK(dots.speed() >= -0.5);
        CHECK(dots.speed() < 0.5);
    }

    SUBCASE("peak of the envelope is the full hue") {
        const int k = int(floor(dots.wave() * numLeds / TL_TWO_PI + 0.5));
        const u16 peak = u16(30 / k); // sin(pi/2)
        CHECK_CLOSE(channelSum(dots.sample(peak)), 255, 0.5f);
        CHECK(dots.sample(0).isEmpty());
    }

    SUBCASE("most of the strip is dark") {
        int lit = 0;
        for (u16 i = 0; i < numLeds; ++i) {
            lit += dots.sample(i).isEmpty() ? 0 : 1;
        }
        // 4 sin(x) - 3 >= 0.1 on about 22% of each period
        CHECK(lit > 0);
        CHECK(lit <= numLeds * 3 / 10);
    }
}

TEST_CASE("Combine is the sum of its two layers") {
    Random a(77);
    Random b(77);
    Combine combine(100, a);
    MovingDots1 background(100, b, 0.2, 0.1);
    MovingDots2 dots(100, b);

    CHECK(combine.sample(0).isEmpty());
    for (int frame = 0; frame < 30; ++frame) {
        for (u16 i = 0; i < 100; ++i) {
            Color expected = background.sample(i);
            expected += dots.sample(i);
            CHECK(combine.sample(i).pack() == expected.pack());
        }
        combine.advance();
        background.advance();
        dots.advance();
    }
}

TEST_CASE("Fade1") {
    Random rng(2024);
    Fade1 fade(50, rng);

    SUBCASE("starts dark") {
        for (u16 i = 0; i < 50; ++i) {
            CHECK(fade.timer(i) == 0);
            CHECK(fade.sample(i).isEmpty());
        }
    }

    SUBCASE("triggered pixels follow the envelope") {
        bool triggered = false;
        for (int frame = 0; frame < 300; ++frame) {
            fade.advance();
            for (u16 i = 0; i < 50; ++i) {
                const u16 s = fade.timer(i);
                CHECK(s <= Fade1::kLifetime);
                if (s == 0) {
                    CHECK(fade.sample(i).isEmpty());
                    continue;
                }
                triggered = true;
                const double factor = s < 20 ? s / 20.0 : (25 - s) / 5.0;
                CHECK_CLOSE(channelSum(fade.sample(i)), 255 * factor, 0.01f);
            }
        }
        CHECK(triggered);
    }

    SUBCASE("a lit pixel counts down to zero") {
        int frame = 0;
        int lit = -1;
        while (lit < 0 && frame < 500) {
            fade.advance();
            ++frame;
            for (u16 i = 0; i < 50; ++i) {
                if (fade.timer(i) == Fade1::kLifetime) {
                    lit = i;
                    break;
                }
            }
        }
        REQUIRE(lit >= 0);
        for (u16 expected = Fade1::kLifetime - 1; expected > 0; --expected) {
            fade.advance();
            // may be re-triggered only once it is idle again
            CHECK(fade.timer(u16(lit)) == expected);
        }
        fade.advance();
        const u16 last = fade.timer(u16(lit));
        CHECK((last == 0 || last == Fade1::kLifetime));
    }
}

TEST_CASE("Fade2") {
    using namespace breathing;
    Random rng(99);
    Fade2 fade(60, rng);

    SUBCASE("phases start in the background range") {
        for (u16 i = 0; i < 60; ++i) {
            CHECK(fade.timer(i) < kSlow2);
        }
    }

    SUBCASE("envelopes") {
        bool flashed = false;
        for (int frame = 0; frame < 400; ++frame) {
            fade.advance();
            for (u16 i = 0; i < 60; ++i) {
                const u16 s = fade.timer(i);
                REQUIRE(s < kFlashTop);
                const double sum = channelSum(fade.sample(i));
                if (s <= kSlow2) {
                    // 8% of a palette color, white at most
                    CHECK(sum <= 765 * 0.08f * level(s) + 0.01f);
                } else if (s < kFlashEnd) {
                    flashed = true;
                    const double flash = 255.0 * (s - kSlow2) / kFast;
                    CHECK(sum >= flash + 20.0f);
                    CHECK(sum <= flash + 765 * 0.08f + 0.01f);
                } else {
                    flashed = true;
                    // background suppressed at the top of the flash
                    CHECK_CLOSE(sum, 255.0f * (kFlashTop - s) / 5, 0.01f);
                }
            }
        }
        CHECK(flashed);
    }

    SUBCASE("background wraps from 0 back to the top") {
        u16 zeroPixel = 0;
        bool found = false;
        for (int frame = 0; frame < kSlow2 && !found; ++frame) {
            for (u16 i = 0; i < 60; ++i) {
                if (fade.timer(i) == 0) {
                    zeroPixel = i;
                    found = true;
                    break;
                }
            }
            if (!found) {
                fade.advance();
            }
        }
        REQUIRE(found);
        fade.advance();
        const u16 next = fade.timer(zeroPixel);
        CHECK((next == kSlow2 || next == kFlashEnd + 4));
    }
}

TEST_CASE("Sparkling1") {
    using namespace breathing;
    Random rng(4242);
    Sparkling1 sparkle(10, rng);

    int sparkles = 0;
    for (int frame = 0; frame < 500; ++frame) {
        for (u16 i = 0; i < 10; ++i) {
            const u16 s = sparkle.timer(i);
            CHECK(s <= kSlow2);
            const double sum = channelSum(sparkle.sample(i));
            if (sum > 765 * 0.08f + 0.01f) {
                // full-brightness accent hue
                CHECK_CLOSE(sum, 255, 0.01f);
                ++sparkles;
            }
        }
        sparkle.advance();
    }
    // one in 100 samples on average
    CHECK(sparkles > 0);
    CHECK(sparkles < 500);
    CHECK(sparkle.fxName() == "Sparkling1");
}
