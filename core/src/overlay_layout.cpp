#include <statusind/overlay_layout.h>
#include <algorithm>

namespace statusind {

namespace {

// Inset an edge pair by one pixel-unit. Only when two pixel-units would
// meet or cross (extent of a pixel or two) does the inset shrink to a
// quarter of the extent, so the inner rectangle never inverts.
float borderInset(float pixelUnit, float extent) {
    if (2.0f * pixelUnit < extent) {
        return pixelUnit;
    }
    return 0.25f * extent;
}

} // namespace

OverlayLayout computeLayout(const ViewportMetrics& metrics, float percentage) {
    OverlayLayout layout;

    const float pixelWidth = static_cast<float>(metrics.pixelWidth);
    const float pixelHeight = static_cast<float>(metrics.pixelHeight);

    layout.displayHeight = DISPLAY_HEIGHT_FACTOR * pixelHeight / metrics.scaleFactor;
    layout.displayWidth = layout.displayHeight * pixelWidth / pixelHeight;

    if (metrics.projection == Projection::Orthographic) {
        layout.front = (2.0f - metrics.nearClip - FRONT_EPSILON) / metrics.scaleFactor;
    } else {
        layout.front = 0.0f;
    }

    layout.pixelWidthUnit = 2.0f * layout.displayWidth / pixelWidth;
    layout.pixelHeightUnit = 2.0f * layout.displayHeight / pixelHeight;

    // Bar sits along the bottom edge of the view
    layout.thickness = BAR_THICKNESS_FRACTION * 2.0f * layout.displayHeight;
    layout.margin = BAR_MARGIN_FRACTION * 2.0f * layout.displayHeight;

    OverlayRect& outer = layout.outer;
    outer.bottom = -layout.displayHeight + layout.margin;
    outer.top = outer.bottom + layout.thickness;
    outer.left = -BAR_WIDTH_FRACTION * layout.displayWidth;
    outer.right = BAR_WIDTH_FRACTION * layout.displayWidth;
    outer.z = layout.front - 2.0f * layout.pixelWidthUnit;

    const float insetX = borderInset(layout.pixelWidthUnit, outer.width());
    const float insetY = borderInset(layout.pixelHeightUnit, outer.height());

    OverlayRect& inner = layout.inner;
    inner.left = outer.left + insetX;
    inner.right = outer.right - insetX;
    inner.top = outer.top - insetY;
    inner.bottom = outer.bottom + insetY;
    inner.z = layout.front - layout.pixelWidthUnit;

    const float p = std::clamp(percentage, 0.0f, 1.0f);

    OverlayRect& fill = layout.fill;
    fill.left = inner.left;
    fill.right = inner.left + p * (inner.right - inner.left);
    fill.top = inner.top;
    fill.bottom = inner.bottom;
    fill.z = layout.front;

    layout.timeLabelAnchor = glm::vec3(inner.left,
                                       TIME_LABEL_HEIGHT_FRACTION * layout.displayHeight,
                                       layout.front);
    layout.headerAnchor = glm::vec3(inner.left,
                                    layout.displayHeight - layout.margin -
                                        HEADER_OFFSET_PIXELS * layout.pixelHeightUnit,
                                    layout.front);

    return layout;
}

} // namespace statusind
