/**
 * @file test_overlay_layout.cpp
 * @brief Unit tests for the display-space geometry of the overlay
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <statusind/overlay_layout.h>
#include <utility>

using namespace statusind;
using Catch::Matchers::WithinAbs;

static ViewportMetrics makeViewport(int w, int h, float scale = 1.0f,
                                    Projection projection = Projection::Perspective) {
    ViewportMetrics m;
    m.pixelWidth = w;
    m.pixelHeight = h;
    m.scaleFactor = scale;
    m.nearClip = 0.5f;
    m.projection = projection;
    return m;
}

TEST_CASE("Layout display extents", "[unit][layout]") {
    SECTION("display height is a quarter of the pixel height over the scale") {
        OverlayLayout layout = computeLayout(makeViewport(800, 600, 2.0f), 0.0f);
        REQUIRE_THAT(layout.displayHeight, WithinAbs(75.0f, 0.0001f));
        REQUIRE_THAT(layout.displayWidth, WithinAbs(100.0f, 0.0001f));
    }

    SECTION("display extents keep the viewport aspect ratio") {
        for (auto size : {std::pair<int, int>{800, 600}, {1920, 1080}, {300, 900}}) {
            OverlayLayout layout = computeLayout(makeViewport(size.first, size.second), 0.5f);
            float expected = static_cast<float>(size.first) / size.second;
            REQUIRE_THAT(layout.displayWidth / layout.displayHeight, WithinAbs(expected, 0.0001f));
        }
    }

    SECTION("pixel units span one screen pixel") {
        OverlayLayout layout = computeLayout(makeViewport(800, 600), 0.0f);
        REQUIRE_THAT(layout.pixelWidthUnit * 800.0f, WithinAbs(2.0f * layout.displayWidth, 0.001f));
        REQUIRE_THAT(layout.pixelHeightUnit * 600.0f, WithinAbs(2.0f * layout.displayHeight, 0.001f));
        REQUIRE_THAT(layout.pixelWidthUnit, WithinAbs(layout.pixelHeightUnit, 0.0001f));
    }
}

TEST_CASE("Layout front plane", "[unit][layout]") {
    SECTION("perspective draws at zero depth") {
        OverlayLayout layout = computeLayout(makeViewport(800, 600, 2.0f), 0.0f);
        REQUIRE(layout.front == 0.0f);
    }

    SECTION("orthographic sits just inside the near clip plane") {
        OverlayLayout layout =
            computeLayout(makeViewport(800, 600, 2.0f, Projection::Orthographic), 0.0f);
        REQUIRE_THAT(layout.front, WithinAbs((2.0f - 0.5f - 0.001f) / 2.0f, 0.00001f));
    }
}

TEST_CASE("Layout bar rectangles", "[unit][layout]") {
    OverlayLayout layout = computeLayout(makeViewport(800, 600), 0.5f);

    SECTION("outer bar hugs the bottom edge") {
        REQUIRE_THAT(layout.outer.bottom, WithinAbs(-150.0f + 3.0f, 0.001f));
        REQUIRE_THAT(layout.outer.top, WithinAbs(-150.0f + 3.0f + 6.0f, 0.001f));
        REQUIRE_THAT(layout.outer.left, WithinAbs(-0.95f * 200.0f, 0.001f));
        REQUIRE_THAT(layout.outer.right, WithinAbs(0.95f * 200.0f, 0.001f));
    }

    SECTION("inner track is inset by one pixel") {
        REQUIRE_THAT(layout.inner.left - layout.outer.left, WithinAbs(layout.pixelWidthUnit, 0.0001f));
        REQUIRE_THAT(layout.outer.right - layout.inner.right, WithinAbs(layout.pixelWidthUnit, 0.0001f));
        REQUIRE_THAT(layout.outer.top - layout.inner.top, WithinAbs(layout.pixelHeightUnit, 0.0001f));
        REQUIRE_THAT(layout.inner.bottom - layout.outer.bottom, WithinAbs(layout.pixelHeightUnit, 0.0001f));
    }

    SECTION("fill shares the inner track's left, top and bottom") {
        REQUIRE(layout.fill.left == layout.inner.left);
        REQUIRE(layout.fill.top == layout.inner.top);
        REQUIRE(layout.fill.bottom == layout.inner.bottom);
    }

    SECTION("depths step toward the viewer") {
        REQUIRE(layout.outer.z < layout.inner.z);
        REQUIRE(layout.inner.z < layout.fill.z);
        REQUIRE(layout.fill.z == layout.front);
        REQUIRE_THAT(layout.inner.z - layout.outer.z, WithinAbs(layout.pixelWidthUnit, 0.0001f));
    }
}

TEST_CASE("Layout fill follows progress", "[unit][layout]") {
    ViewportMetrics vp = makeViewport(800, 600);

    SECTION("empty at 0%") {
        OverlayLayout layout = computeLayout(vp, 0.0f);
        REQUIRE(layout.fill.width() == 0.0f);
    }

    SECTION("covers the track at 100%") {
        OverlayLayout layout = computeLayout(vp, 1.0f);
        REQUIRE_THAT(layout.fill.right, WithinAbs(layout.inner.right, 0.0001f));
    }

    SECTION("half the track at 50%") {
        OverlayLayout layout = computeLayout(vp, 0.5f);
        REQUIRE_THAT(layout.fill.width(), WithinAbs(0.5f * layout.inner.width(), 0.001f));
    }

    SECTION("width is monotonic in progress") {
        float previous = -1.0f;
        for (int i = 0; i <= 20; ++i) {
            OverlayLayout layout = computeLayout(vp, i / 20.0f);
            REQUIRE(layout.fill.width() >= previous);
            previous = layout.fill.width();
        }
    }

    SECTION("out of range progress is clamped") {
        REQUIRE(computeLayout(vp, -0.5f).fill.width() == 0.0f);
        OverlayLayout over = computeLayout(vp, 1.5f);
        REQUIRE_THAT(over.fill.right, WithinAbs(over.inner.right, 0.0001f));
    }
}

TEST_CASE("Layout inner track stays inside the border", "[unit][layout]") {
    for (auto size : {std::pair<int, int>{2, 2}, {3, 7}, {800, 600}, {4000, 100}, {100, 4000}}) {
        for (float scale : {0.25f, 1.0f, 8.0f}) {
            OverlayLayout layout = computeLayout(makeViewport(size.first, size.second, scale), 1.0f);
            INFO(size.first << "x" << size.second << " scale " << scale);
            REQUIRE(layout.outer.strictlyContains(layout.inner));
            REQUIRE(layout.fill.right <= layout.inner.right + 0.0001f);
        }
    }
}

TEST_CASE("Layout inset stays one pixel on short viewports", "[unit][layout]") {
    SECTION("200x150") {
        OverlayLayout layout = computeLayout(makeViewport(200, 150), 1.0f);
        REQUIRE_THAT(layout.pixelHeightUnit, WithinAbs(0.5f, 0.00001f));
        REQUIRE_THAT(layout.outer.top - layout.inner.top, WithinAbs(layout.pixelHeightUnit, 0.00001f));
        REQUIRE_THAT(layout.inner.bottom - layout.outer.bottom, WithinAbs(layout.pixelHeightUnit, 0.00001f));
        REQUIRE(layout.outer.strictlyContains(layout.inner));
    }

    SECTION("every height above two bar pixels") {
        for (int height : {101, 120, 150, 199, 200}) {
            OverlayLayout layout = computeLayout(makeViewport(320, height), 0.5f);
            INFO("height " << height);
            REQUIRE_THAT(layout.outer.top - layout.inner.top,
                         WithinAbs(layout.pixelHeightUnit, 0.0001f));
            REQUIRE(layout.outer.strictlyContains(layout.inner));
        }
    }

    SECTION("shrinks only when one pixel would close the track") {
        OverlayLayout layout = computeLayout(makeViewport(320, 50), 0.5f);
        REQUIRE(layout.outer.top - layout.inner.top < layout.pixelHeightUnit);
        REQUIRE(layout.outer.strictlyContains(layout.inner));
    }
}

TEST_CASE("Layout label anchors", "[unit][layout]") {
    OverlayLayout layout = computeLayout(makeViewport(800, 600), 0.25f);

    SECTION("time label sits above the bar at the track's left edge") {
        REQUIRE(layout.timeLabelAnchor.x == layout.inner.left);
        REQUIRE_THAT(layout.timeLabelAnchor.y, WithinAbs(-0.87f * 150.0f, 0.001f));
        REQUIRE(layout.timeLabelAnchor.y > layout.outer.top);
        REQUIRE(layout.timeLabelAnchor.z == layout.front);
    }

    SECTION("header sits ten pixels below the top margin") {
        REQUIRE(layout.headerAnchor.x == layout.inner.left);
        REQUIRE_THAT(layout.headerAnchor.y,
                     WithinAbs(150.0f - 3.0f - 10.0f * layout.pixelHeightUnit, 0.001f));
        REQUIRE(layout.headerAnchor.z == layout.front);
    }
}
