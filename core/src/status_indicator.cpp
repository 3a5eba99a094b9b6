#include <statusind/status_indicator.h>
#include <iostream>

namespace statusind {

StatusIndicator::StatusIndicator(Host& host, const OverlayStyle& style)
    : m_host(host), m_renderer(style) {}

StatusIndicator::~StatusIndicator() {
    // Callbacks capture this; they must not outlive the controller.
    // The host must still be alive here unless it already sent quit.
    disable(true);
}

bool StatusIndicator::isAttached() const {
    return m_drawable.has_value() && m_host.drawable(*m_drawable) != nullptr;
}

void StatusIndicator::enable() {
    if (isAttached()) {
        return;
    }

    // A handle whose drawable vanished also left stale subscriptions behind
    disable(false);

    m_drawable = m_host.createDrawable(DRAWABLE_NAME);
    m_scale = m_host.activeViewport().scaleFactor;
    if (Drawable* d = m_host.drawable(*m_drawable)) {
        d->resetTransform(m_scale);
    }

    resetColors();

    m_hostSubscriptions.push_back(
        m_host.onFrameChanged([this](int frame) { onFrameChanged(frame); }));
    m_hostSubscriptions.push_back(
        m_host.onQuitRequested([this]() { onQuitRequested(); }));
    m_hostSubscriptions.push_back(
        m_host.onViewChanged([this]() { redraw(); }));
    m_configSubscription =
        m_state.changed().connect([this](ConfigField field) { onConfigChanged(field); });

    debugLog("Enabled");
}

void StatusIndicator::disable(bool cleanup) {
    for (ConnectionId id : m_hostSubscriptions) {
        m_host.unsubscribe(id);
    }
    m_hostSubscriptions.clear();

    if (m_configSubscription != INVALID_CONNECTION) {
        m_state.changed().disconnect(m_configSubscription);
        m_configSubscription = INVALID_CONNECTION;
    }

    if (cleanup && m_drawable) {
        m_host.destroyDrawable(*m_drawable);
        m_drawable.reset();
    }
}

void StatusIndicator::toggle(bool enabled) {
    if (enabled && !m_state.enabled()) {
        m_state.setEnabled(true);
        enable();
        redraw();
    } else if (!enabled && m_state.enabled()) {
        m_state.setEnabled(false);
        disable(true);
    }
}

void StatusIndicator::resetColors() {
    m_colors.reset(m_host.background());
}

size_t StatusIndicator::subscriptionCount() const {
    return m_hostSubscriptions.size() + (m_configSubscription != INVALID_CONNECTION ? 1 : 0);
}

void StatusIndicator::redraw() {
    if (!m_drawable) {
        return;
    }

    Drawable* drawable = m_host.drawable(*m_drawable);
    if (!drawable) {
        std::cerr << "[StatusIndicator] Drawable " << *m_drawable
                  << " no longer exists, detaching\n";
        m_state.setEnabled(false);
        disable(false);
        m_drawable.reset();
        return;
    }

    const ViewportMetrics metrics = m_host.activeViewport();
    m_scale = metrics.scaleFactor;
    drawable->resetTransform(m_scale);
    drawable->clear();

    if (!m_state.enabled()) {
        return;
    }

    RenderState next;
    if (!metrics.isValid()) {
        next = m_state.renderState();
        next.errorMessage = "Error: viewport has no drawable area";
    } else {
        next = computeRenderState(m_state.config(), m_host.currentFrameIndex(),
                                  m_host.totalFrameCount(), m_state.renderState());
    }
    next.foreground = m_colors.foreground();
    m_state.setRenderState(next);
    ++m_redrawCount;

    if (next.hasError()) {
        debugLog(next.errorMessage);
        return;
    }

    m_layout = computeLayout(metrics, next.percentage);
    m_renderer.render(*drawable, m_layout, next, m_state.header());
}

void StatusIndicator::onFrameChanged(int frame) {
    (void)frame;  // Frame index is read back from the host
    redraw();
}

void StatusIndicator::onQuitRequested() {
    std::cout << "[StatusIndicator] Got quit event\n";
    m_state.setEnabled(false);
    disable(false);
    // The host is tearing down; forget the handle without touching it
    m_drawable.reset();
}

void StatusIndicator::onConfigChanged(ConfigField field) {
    debugLog(std::string("Config changed: ") + configFieldName(field));
    redraw();
}

void StatusIndicator::debugLog(const std::string& msg) const {
    if (m_debug) {
        std::cout << "[StatusIndicator] " << msg << "\n";
    }
}

} // namespace statusind
