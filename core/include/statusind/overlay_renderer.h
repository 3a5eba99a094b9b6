#pragma once

/**
 * @file overlay_renderer.h
 * @brief Emits the overlay primitives into a host drawable
 */

#include <statusind/color.h>
#include <statusind/host.h>
#include <statusind/indicator_state.h>
#include <statusind/overlay_layout.h>
#include <string>

namespace statusind {

/**
 * @brief Colors and text sizes of the overlay
 */
struct OverlayStyle {
    Color border = Color::Gray;
    Color track = Color::White;
    Color fill = Color::Silver;
    float labelSize = 2.0f;
    float labelThickness = 2.0f;
    float headerSize = 1.0f;
    float headerThickness = 1.0f;
};

/**
 * @brief Turns a layout and render state into triangles and text
 *
 * Stateless apart from its style. Clearing the drawable is the caller's
 * job; render() only appends.
 */
class OverlayRenderer {
public:
    OverlayRenderer() = default;
    explicit OverlayRenderer(const OverlayStyle& style) : m_style(style) {}

    /**
     * @brief Append the bar, the time label and the header
     *
     * Emits border, track and fill (back to front), the time label, then
     * the header if it is not empty.
     */
    void render(Drawable& drawable, const OverlayLayout& layout, const RenderState& state,
                const std::string& header) const;

    /// @brief Append a rectangle as two triangles
    static void drawRectangle(Drawable& drawable, const OverlayRect& rect, const Color& color);

    const OverlayStyle& style() const { return m_style; }

private:
    OverlayStyle m_style;
};

} // namespace statusind
