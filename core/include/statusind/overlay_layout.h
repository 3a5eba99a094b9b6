#pragma once

/**
 * @file overlay_layout.h
 * @brief Display-space geometry of the progress bar and its labels
 *
 * The overlay lives in the host's normalized display space, where the
 * camera view spans roughly [-displayWidth, displayWidth] x
 * [-displayHeight, displayHeight]. Borders are inset by one pixel-unit,
 * the display-space length of one screen pixel at the current zoom.
 */

#include <statusind/types.h>
#include <glm/glm.hpp>

namespace statusind {

/**
 * @brief Axis-aligned rectangle at a fixed depth
 */
struct OverlayRect {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float z = 0.0f;

    float width() const { return right - left; }
    float height() const { return top - bottom; }

    /// @brief True if every edge of @p inner lies strictly inside this rectangle
    bool strictlyContains(const OverlayRect& inner) const {
        return inner.left > left && inner.right < right &&
               inner.bottom > bottom && inner.top < top &&
               inner.left <= inner.right && inner.bottom <= inner.top;
    }
};

/**
 * @brief Output of computeLayout()
 *
 * Depths decrease away from the viewer: the outer rectangle sits two
 * pixel-units behind the front plane, the inner one one pixel-unit behind,
 * the fill on the front plane.
 */
struct OverlayLayout {
    float displayWidth = 0.0f;
    float displayHeight = 0.0f;
    float front = 0.0f;            ///< Depth of the plane nearest the viewer
    float pixelWidthUnit = 0.0f;   ///< Display-space width of one pixel
    float pixelHeightUnit = 0.0f;  ///< Display-space height of one pixel
    float thickness = 0.0f;        ///< Bar height
    float margin = 0.0f;           ///< Gap between the bar and the view edge

    OverlayRect outer;             ///< Gray border
    OverlayRect inner;             ///< White track
    OverlayRect fill;              ///< Silver progress

    glm::vec3 timeLabelAnchor{0.0f};
    glm::vec3 headerAnchor{0.0f};
};

/// Fraction of the viewport height covered by displayHeight
constexpr float DISPLAY_HEIGHT_FACTOR = 0.25f;
/// Keeps the orthographic front plane just inside the clip volume
constexpr float FRONT_EPSILON = 0.001f;
/// Bar thickness and margin, as fractions of the full display height
constexpr float BAR_THICKNESS_FRACTION = 0.02f;
constexpr float BAR_MARGIN_FRACTION = 0.01f;
/// Horizontal extent of the bar relative to displayWidth
constexpr float BAR_WIDTH_FRACTION = 0.95f;
/// Vertical position of the time label relative to displayHeight
constexpr float TIME_LABEL_HEIGHT_FRACTION = -0.87f;
/// Distance of the header below the top margin, in pixel-units
constexpr float HEADER_OFFSET_PIXELS = 10.0f;

/**
 * @brief Compute overlay geometry for a viewport
 * @param metrics Viewport snapshot (must satisfy isValid())
 * @param percentage Progress in [0,1]; values outside are clamped
 */
OverlayLayout computeLayout(const ViewportMetrics& metrics, float percentage);

} // namespace statusind
