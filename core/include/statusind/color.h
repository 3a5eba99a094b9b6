#pragma once

/**
 * @file color.h
 * @brief Color type and the foreground color policy
 *
 * Color stores RGBA values in 0-1 range.
 *
 * @par Example
 * @code
 * ColorPolicy policy;
 * policy.reset(host.background());
 * drawable.addText(pos, label, 2.0f, 2.0f, toColor(policy.foreground()));
 * @endcode
 */

#include <string>

namespace statusind {

/**
 * @brief RGBA color (0-1 range)
 */
class Color {
public:
    float r, g, b, a;

    /**
     * @brief Default constructor (opaque white)
     */
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    /**
     * @brief Construct from RGBA values (0-1 range)
     */
    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    /**
     * @brief Sum of the R, G and B channels (0-3)
     *
     * This is the brightness measure the foreground policy thresholds on.
     */
    constexpr float channelSum() const {
        return r + g + b;
    }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    /**
     * @brief Parse "r,g,b" or "r,g,b,a" with components in 0-1
     * @param text Comma separated components
     * @param out Receives the color on success
     * @return false on malformed input
     */
    static bool parse(const std::string& text, Color& out);

    // Named colors used by the overlay
    static const Color White;
    static const Color Silver;
    static const Color Gray;
    static const Color Black;
};

inline constexpr Color Color::White  {1.000f, 1.000f, 1.000f};
inline constexpr Color Color::Silver {0.753f, 0.753f, 0.753f};
inline constexpr Color Color::Gray   {0.502f, 0.502f, 0.502f};
inline constexpr Color Color::Black  {0.000f, 0.000f, 0.000f};

/**
 * @brief Text color chosen against the viewport background
 */
enum class Foreground {
    Black,
    White
};

inline const char* foregroundName(Foreground fg) {
    return fg == Foreground::Black ? "black" : "white";
}

inline Color toColor(Foreground fg) {
    return fg == Foreground::Black ? Color::Black : Color::White;
}

/**
 * @brief Host background description
 *
 * When the host draws a vertical gradient, the bottom color is the one
 * the progress bar sits on.
 */
struct Background {
    Color color = Color::Black;
    bool gradient = false;
    Color gradientBottom = Color::Black;

    /// @brief The color directly behind the overlay
    Color effective() const { return gradient ? gradientBottom : color; }
};

/// Channel sum above which the background counts as light
constexpr float LIGHT_BACKGROUND_THRESHOLD = 1.2f;

/**
 * @brief Pick a legible foreground for a background brightness
 * @param backgroundLuminanceSum R+G+B of the background (0-3)
 * @return Black if the sum is strictly above 1.2, White otherwise
 */
Foreground pickForeground(float backgroundLuminanceSum);

/**
 * @brief Caches the foreground color between explicit resets
 *
 * The background is sampled when the overlay is enabled and on reset(),
 * not once per frame.
 */
class ColorPolicy {
public:
    /// @brief Sample a background and recompute the foreground
    void reset(const Background& background);

    Foreground foreground() const { return m_foreground; }
    float luminanceSum() const { return m_luminanceSum; }

private:
    Foreground m_foreground = Foreground::White;
    float m_luminanceSum = 0.0f;
};

} // namespace statusind
