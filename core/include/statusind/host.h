#pragma once

/**
 * @file host.h
 * @brief Interfaces the overlay requires from the visualization host
 *
 * The host owns the 3D view, the animation frame counter and the
 * drawables. The overlay never mutates host state other than the one
 * drawable it created.
 */

#include <statusind/color.h>
#include <statusind/signal.h>
#include <statusind/types.h>
#include <glm/glm.hpp>
#include <functional>
#include <string>

namespace statusind {

/// Handle to a drawable owned by the host
using DrawableHandle = int;

/**
 * @brief Graphics container the host renders in display space
 *
 * Primitives accumulate until clear() is called.
 */
class Drawable {
public:
    virtual ~Drawable() = default;

    /// @brief Remove every primitive previously added
    virtual void clear() = 0;

    /**
     * @brief Reset center/rotation/global transforms to identity and apply a uniform scale
     * @param scale Scale factor copied from the host's active view
     */
    virtual void resetTransform(float scale) = 0;

    /// @brief Add a filled, unlit triangle
    virtual void addTriangle(const glm::vec3& p1, const glm::vec3& p2, const glm::vec3& p3,
                             const Color& color) = 0;

    /**
     * @brief Add a text label
     * @param position Anchor of the first glyph (display space)
     * @param text Label text
     * @param size Font size multiplier
     * @param thickness Stroke thickness
     * @param color Text color
     */
    virtual void addText(const glm::vec3& position, const std::string& text,
                         float size, float thickness, const Color& color) = 0;
};

/**
 * @brief Visualization host
 *
 * Callbacks registered with onFrameChanged()/onQuitRequested() are invoked
 * synchronously on the host's thread. Subscription ids are released with
 * unsubscribe().
 */
class Host {
public:
    using FrameChangedFn = std::function<void(int frame)>;
    using QuitFn = std::function<void()>;
    using ViewChangedFn = std::function<void()>;

    virtual ~Host() = default;

    virtual ConnectionId onFrameChanged(FrameChangedFn callback) = 0;
    virtual ConnectionId onQuitRequested(QuitFn callback) = 0;

    /// @brief Fired after the view is resized, zoomed or switches projection
    virtual ConnectionId onViewChanged(ViewChangedFn callback) = 0;

    virtual void unsubscribe(ConnectionId id) = 0;

    /// @brief Metrics of the view the overlay is drawn into
    virtual ViewportMetrics activeViewport() const = 0;

    /// @brief Frame index of the tracked trajectory (0-based)
    virtual int currentFrameIndex() const = 0;

    /// @brief Number of frames of the tracked trajectory
    virtual int totalFrameCount() const = 0;

    virtual DrawableHandle createDrawable(const std::string& name) = 0;
    virtual void destroyDrawable(DrawableHandle handle) = 0;

    /// @return The drawable, or nullptr if the handle no longer exists
    virtual Drawable* drawable(DrawableHandle handle) = 0;

    virtual Background background() const = 0;
};

} // namespace statusind
