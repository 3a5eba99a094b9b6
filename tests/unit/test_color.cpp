/**
 * @file test_color.cpp
 * @brief Unit tests for colors and the foreground policy
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <statusind/color.h>

using namespace statusind;
using Catch::Matchers::WithinAbs;

TEST_CASE("Color constants", "[unit][color]") {
    REQUIRE(Color() == Color::White);
    REQUIRE_THAT(Color::Silver.r, WithinAbs(0.753f, 0.0001f));
    REQUIRE_THAT(Color::Gray.g, WithinAbs(0.502f, 0.0001f));
    REQUIRE(Color::Black.channelSum() == 0.0f);
    REQUIRE(Color::White.channelSum() == 3.0f);
}

TEST_CASE("Color::parse", "[unit][color]") {
    Color c;

    SECTION("three channels") {
        REQUIRE(Color::parse("0.1,0.2,0.3", c));
        REQUIRE_THAT(c.g, WithinAbs(0.2f, 0.0001f));
        REQUIRE(c.a == 1.0f);
    }

    SECTION("four channels") {
        REQUIRE(Color::parse("1,1,1,0.5", c));
        REQUIRE(c.a == 0.5f);
    }

    SECTION("malformed input leaves the color untouched") {
        c = Color::Gray;
        REQUIRE_FALSE(Color::parse("1,1", c));
        REQUIRE_FALSE(Color::parse("a,b,c", c));
        REQUIRE_FALSE(Color::parse("1,1,1,1,1", c));
        REQUIRE(c == Color::Gray);
    }
}

TEST_CASE("pickForeground", "[unit][color]") {
    SECTION("dark backgrounds get white text") {
        REQUIRE(pickForeground(0.0f) == Foreground::White);
        REQUIRE(pickForeground(1.19f) == Foreground::White);
    }

    SECTION("light backgrounds get black text") {
        REQUIRE(pickForeground(1.21f) == Foreground::Black);
        REQUIRE(pickForeground(3.0f) == Foreground::Black);
    }

    SECTION("the threshold itself counts as dark") {
        REQUIRE(pickForeground(LIGHT_BACKGROUND_THRESHOLD) == Foreground::White);
    }
}

TEST_CASE("ColorPolicy", "[unit][color]") {
    ColorPolicy policy;
    REQUIRE(policy.foreground() == Foreground::White);

    SECTION("samples a solid background") {
        Background bg;
        bg.color = Color(0.5f, 0.5f, 0.5f);
        policy.reset(bg);
        REQUIRE(policy.foreground() == Foreground::Black);
        REQUIRE_THAT(policy.luminanceSum(), WithinAbs(1.5f, 0.0001f));
    }

    SECTION("gradients use the bottom color") {
        Background bg;
        bg.color = Color::White;
        bg.gradient = true;
        bg.gradientBottom = Color(0.1f, 0.1f, 0.1f);
        policy.reset(bg);
        REQUIRE(policy.foreground() == Foreground::White);
    }

    SECTION("toColor maps the foreground") {
        REQUIRE(toColor(Foreground::Black) == Color::Black);
        REQUIRE(toColor(Foreground::White) == Color::White);
    }
}
