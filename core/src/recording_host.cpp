#include <statusind/recording_host.h>
#include <utility>

namespace statusind {

void RecordingDrawable::clear() {
    m_triangles.clear();
    m_texts.clear();
    ++m_clearCount;
}

void RecordingDrawable::addTriangle(const glm::vec3& p1, const glm::vec3& p2, const glm::vec3& p3,
                                    const Color& color) {
    m_triangles.push_back({p1, p2, p3, color});
}

void RecordingDrawable::addText(const glm::vec3& position, const std::string& text,
                                float size, float thickness, const Color& color) {
    m_texts.push_back({position, text, size, thickness, color});
}

ConnectionId RecordingHost::onFrameChanged(FrameChangedFn callback) {
    return m_frameChanged.connect(std::move(callback));
}

ConnectionId RecordingHost::onQuitRequested(QuitFn callback) {
    return m_quit.connect(std::move(callback));
}

ConnectionId RecordingHost::onViewChanged(ViewChangedFn callback) {
    return m_viewChanged.connect(std::move(callback));
}

void RecordingHost::unsubscribe(ConnectionId id) {
    // Ids are unique across signals, at most one of these succeeds
    if (m_frameChanged.disconnect(id)) return;
    if (m_quit.disconnect(id)) return;
    m_viewChanged.disconnect(id);
}

DrawableHandle RecordingHost::createDrawable(const std::string& name) {
    DrawableHandle handle = m_nextHandle++;
    m_drawables[handle] = std::make_unique<RecordingDrawable>(name);
    ++m_drawablesCreated;
    return handle;
}

void RecordingHost::destroyDrawable(DrawableHandle handle) {
    m_drawables.erase(handle);
}

Drawable* RecordingHost::drawable(DrawableHandle handle) {
    auto it = m_drawables.find(handle);
    return it != m_drawables.end() ? it->second.get() : nullptr;
}

const RecordingDrawable* RecordingHost::recording(DrawableHandle handle) const {
    auto it = m_drawables.find(handle);
    return it != m_drawables.end() ? it->second.get() : nullptr;
}

void RecordingHost::setFrame(int frame) {
    m_frame = frame;
    m_frameChanged.emit(frame);
}

void RecordingHost::setViewport(const ViewportMetrics& metrics) {
    m_viewport = metrics;
    m_viewChanged.emit();
}

void RecordingHost::requestQuit() {
    m_quit.emit();
}

} // namespace statusind
