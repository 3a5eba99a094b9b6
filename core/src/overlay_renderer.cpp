#include <statusind/overlay_renderer.h>

namespace statusind {

void OverlayRenderer::drawRectangle(Drawable& drawable, const OverlayRect& rect, const Color& color) {
    const glm::vec3 topLeft(rect.left, rect.top, rect.z);
    const glm::vec3 topRight(rect.right, rect.top, rect.z);
    const glm::vec3 bottomLeft(rect.left, rect.bottom, rect.z);
    const glm::vec3 bottomRight(rect.right, rect.bottom, rect.z);

    drawable.addTriangle(topLeft, topRight, bottomLeft, color);
    drawable.addTriangle(bottomLeft, topRight, bottomRight, color);
}

void OverlayRenderer::render(Drawable& drawable, const OverlayLayout& layout,
                             const RenderState& state, const std::string& header) const {
    drawRectangle(drawable, layout.outer, m_style.border);
    drawRectangle(drawable, layout.inner, m_style.track);
    drawRectangle(drawable, layout.fill, m_style.fill);

    const Color fg = toColor(state.foreground);
    drawable.addText(layout.timeLabelAnchor, state.timeLabel,
                     m_style.labelSize, m_style.labelThickness, fg);

    if (!header.empty()) {
        drawable.addText(layout.headerAnchor, header,
                         m_style.headerSize, m_style.headerThickness, fg);
    }
}

} // namespace statusind
