#pragma once

/**
 * @file status_indicator.h
 * @brief Reactive controller that keeps the overlay in sync with the host
 *
 * StatusIndicator has two states. While Disabled it holds no drawable and
 * no subscriptions. While Enabled it owns one host drawable and listens to
 * the host's frame-change, view-change and quit events and to its own
 * configuration changes. Every such event runs exactly one redraw before
 * returning (quit detaches instead).
 *
 * @par Example
 * @code
 * StatusIndicator indicator(host);
 * indicator.state().setTimestep(0.004);
 * indicator.toggle(true);   // attach and draw
 * host.setFrame(10);        // redraws synchronously
 * indicator.toggle(false);  // detach and delete the drawable
 * @endcode
 */

#include <statusind/color.h>
#include <statusind/host.h>
#include <statusind/indicator_state.h>
#include <statusind/overlay_layout.h>
#include <statusind/overlay_renderer.h>
#include <optional>
#include <string>
#include <vector>

namespace statusind {

/// Name given to the drawable created in the host
constexpr const char* DRAWABLE_NAME = "statusIndicator";

class StatusIndicator {
public:
    explicit StatusIndicator(Host& host, const OverlayStyle& style = OverlayStyle());
    ~StatusIndicator();

    // Non-copyable (subscriptions capture this)
    StatusIndicator(const StatusIndicator&) = delete;
    StatusIndicator& operator=(const StatusIndicator&) = delete;

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Attach to the host
     *
     * No-op while the owned drawable is alive. Otherwise creates the
     * drawable, copies the active view's scale, samples the background and
     * subscribes to frame, view, quit and configuration events.
     */
    void enable();

    /**
     * @brief Detach from the host
     * @param cleanup Also destroy the owned drawable
     */
    void disable(bool cleanup);

    /**
     * @brief Switch between Disabled and Enabled
     *
     * Entering Enabled attaches and redraws immediately. Leaving it detaches
     * and destroys the drawable. Requests for the current state are ignored.
     */
    void toggle(bool enabled);

    /// @brief Alias of toggle() for configuration dialogs
    void setEnabled(bool enabled) { toggle(enabled); }

    bool isEnabled() const { return m_state.enabled(); }

    /// @brief True while a drawable is owned and alive in the host
    bool isAttached() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Drawing
    /// @{

    /**
     * @brief Run one redraw cycle
     *
     * Clears the drawable, then draws if Enabled and the state is
     * renderable. On error the overlay stays empty and
     * renderState().errorMessage describes why.
     */
    void redraw();

    /// @brief Resample the host background for the text color
    void resetColors();

    /// @}
    // -------------------------------------------------------------------------
    /// @name State access
    /// @{

    IndicatorState& state() { return m_state; }
    const IndicatorState& state() const { return m_state; }

    const IndicatorConfig& config() const { return m_state.config(); }
    const RenderState& renderState() const { return m_state.renderState(); }

    /// @brief Layout of the last successful redraw
    const OverlayLayout& layout() const { return m_layout; }

    std::optional<DrawableHandle> drawableHandle() const { return m_drawable; }

    /// @brief Scale copied from the host's active view on the last enable/redraw
    float scale() const { return m_scale; }

    const ColorPolicy& colorPolicy() const { return m_colors; }

    /// @brief Number of live subscriptions (host and configuration)
    size_t subscriptionCount() const;

    /// @brief Number of completed redraw cycles
    int redrawCount() const { return m_redrawCount; }

    void setDebug(bool enabled) { m_debug = enabled; }
    bool debug() const { return m_debug; }

    /// @}

private:
    void onFrameChanged(int frame);
    void onQuitRequested();
    void onConfigChanged(ConfigField field);
    void debugLog(const std::string& msg) const;

    Host& m_host;
    IndicatorState m_state;
    ColorPolicy m_colors;
    OverlayRenderer m_renderer;
    OverlayLayout m_layout;

    std::optional<DrawableHandle> m_drawable;
    std::vector<ConnectionId> m_hostSubscriptions;
    ConnectionId m_configSubscription = INVALID_CONNECTION;

    float m_scale = 1.0f;
    int m_redrawCount = 0;
    bool m_debug = false;
};

} // namespace statusind
