#include "test.h"

#include "tl/color.h"

TEST_CASE("Color empty sentinel") {
    SUBCASE("default constructed") {
        Color c;
        CHECK(c.isEmpty());
        CHECK(c.pack() == 0);
    }

    SUBCASE("explicit zero is empty") {
        Color c(0, 0, 0);
        CHECK(c.isEmpty());
        CHECK(c.pack() == 0);
    }

    SUBCASE("any nonzero channel is not empty") {
        CHECK_FALSE(Color(0, 0, 1).isEmpty());
        CHECK_FALSE(Color(0.25f, 0, 0).isEmpty());
    }

    SUBCASE("scaling keeps empty") {
        Color c;
        c *= 3.0f;
        CHECK(c.isEmpty());
    }
}

TEST_CASE("Color merge") {
    SUBCASE("adding empty is a no-op") {
        Color x(10, 20, 30);
        x += Color();
        CHECK_COLOR(x, 10, 20, 30);
    }

    SUBCASE("empty adopts the right hand side") {
        Color e;
        e += Color(40, 50, 60);
        CHECK_COLOR(e, 40, 50, 60);
        CHECK(e.pack() == Color(40, 50, 60).pack());
    }

    SUBCASE("channels sum without clamping") {
        Color c(200, 100, 0);
        c += Color(100, 100, 5);
        CHECK_COLOR(c, 300, 200, 5);
        CHECK(packedRed(c.pack()) == 255);
        CHECK(packedGreen(c.pack()) == 200);
        CHECK(packedBlue(c.pack()) == 5);
    }

    SUBCASE("operator+ leaves the operands alone") {
        const Color a(1, 2, 3);
        const Color b(4, 5, 6);
        Color sum = a + b;
        CHECK_COLOR(sum, 5, 7, 9);
        CHECK_COLOR(a, 1, 2, 3);
    }
}

TEST_CASE("Color scale") {
    SUBCASE("positive factor") {
        Color c(100, 50, 10);
        c *= 0.5f;
        CHECK_COLOR(c, 50, 25, 5);
    }

    SUBCASE("zero factor packs to zero") {
        Color c(100, 50, 10);
        c *= 0.0f;
        CHECK(c.pack() == 0);
    }

    SUBCASE("negative factor is treated as zero") {
        Color c(100, 50, 10);
        c *= -2.0f;
        CHECK(c.pack() == 0);
        CHECK(c.red() == 0);
        CHECK(c.green() == 0);
        CHECK(c.blue() == 0);
    }

    SUBCASE("copy then scale leaves the original") {
        const Color base(255, 128, 0);
        Color scaled = base * 0.25f;
        CHECK_COLOR(base, 255, 128, 0);
        CHECK_COLOR(scaled, 63.75f, 32, 0);
    }
}

TEST_CASE("Color pack layout") {
    CHECK(Color(255, 0, 0).pack() == 0x00FF00u);
    CHECK(Color(0, 255, 0).pack() == 0xFF0000u);
    CHECK(Color(0, 0, 255).pack() == 0x0000FFu);
    CHECK(Color(0x12, 0x34, 0x56).pack() == 0x341256u);

    SUBCASE("unpacking yields the clamped, rounded channels") {
        const Color c(127.6f, 300.0f, 0.4f);
        const u32 v = c.pack();
        CHECK(packedRed(v) == 128);
        CHECK(packedGreen(v) == 255);
        CHECK(packedBlue(v) == 0);
        CHECK((v >> 24) == 0);
    }

    SUBCASE("scaled channels round in double precision") {
        // 45 * 0.7 lands just below 31.5, 50 * 0.59 exactly on 29.5
        Color below(45, 0, 0);
        below *= 0.7;
        CHECK(packedRed(below.pack()) == 31);
        Color tie(50, 0, 0);
        tie *= 0.59;
        CHECK(packedRed(tie.pack()) == 30);
        Color odd(0, 0, 75);
        odd *= 0.82;
        CHECK(packedBlue(odd.pack()) == 61);
    }

    SUBCASE("pack does not modify the color") {
        const Color c(400, 0, 0);
        c.pack();
        CHECK(c.red() == 400);
    }
}

TEST_CASE("Color toString") {
    CHECK(Color().toString() == "Color(empty)");
    CHECK(Color(1, 2, 3).toString() == "Color(1.00,2.00,3.00)");
}
