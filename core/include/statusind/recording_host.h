#pragma once

/**
 * @file recording_host.h
 * @brief In-memory Host that records the primitives it receives
 *
 * Used by the statusind command-line player and by the tests. The
 * trajectory, the viewport and the background are plain settable values;
 * setFrame() and requestQuit() fire the subscribed callbacks synchronously,
 * the way an interactive host would from its event loop.
 */

#include <statusind/host.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace statusind {

struct RecordedTriangle {
    glm::vec3 p1, p2, p3;
    Color color;
};

struct RecordedText {
    glm::vec3 position;
    std::string text;
    float size;
    float thickness;
    Color color;
};

/**
 * @brief Drawable that keeps its primitives in vectors
 */
class RecordingDrawable : public Drawable {
public:
    explicit RecordingDrawable(const std::string& name) : m_name(name) {}

    void clear() override;
    void resetTransform(float scale) override { m_scale = scale; }
    void addTriangle(const glm::vec3& p1, const glm::vec3& p2, const glm::vec3& p3,
                     const Color& color) override;
    void addText(const glm::vec3& position, const std::string& text,
                 float size, float thickness, const Color& color) override;

    const std::string& name() const { return m_name; }
    const std::vector<RecordedTriangle>& triangles() const { return m_triangles; }
    const std::vector<RecordedText>& texts() const { return m_texts; }
    size_t primitiveCount() const { return m_triangles.size() + m_texts.size(); }
    int clearCount() const { return m_clearCount; }
    float scale() const { return m_scale; }

private:
    std::string m_name;
    std::vector<RecordedTriangle> m_triangles;
    std::vector<RecordedText> m_texts;
    int m_clearCount = 0;
    float m_scale = 1.0f;
};

class RecordingHost : public Host {
public:
    RecordingHost() = default;

    // Host interface
    ConnectionId onFrameChanged(FrameChangedFn callback) override;
    ConnectionId onQuitRequested(QuitFn callback) override;
    ConnectionId onViewChanged(ViewChangedFn callback) override;
    void unsubscribe(ConnectionId id) override;
    ViewportMetrics activeViewport() const override { return m_viewport; }
    int currentFrameIndex() const override { return m_frame; }
    int totalFrameCount() const override { return m_frameCount; }
    DrawableHandle createDrawable(const std::string& name) override;
    void destroyDrawable(DrawableHandle handle) override;
    Drawable* drawable(DrawableHandle handle) override;
    Background background() const override { return m_background; }

    // -------------------------------------------------------------------------
    /// @name Host-side controls
    /// @{

    /// @brief Move to a frame and notify frame listeners
    void setFrame(int frame);

    /// @brief Change the trajectory length without notifying
    void setFrameCount(int count) { m_frameCount = count; }

    /// @brief Replace the viewport and notify view listeners
    void setViewport(const ViewportMetrics& metrics);
    void setBackground(const Background& background) { m_background = background; }

    /// @brief Notify quit listeners
    void requestQuit();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Inspection
    /// @{

    /// @brief Typed access to a recorded drawable (nullptr if unknown)
    const RecordingDrawable* recording(DrawableHandle handle) const;

    size_t drawableCount() const { return m_drawables.size(); }
    int drawablesCreated() const { return m_drawablesCreated; }
    size_t frameSubscriberCount() const { return m_frameChanged.size(); }
    size_t quitSubscriberCount() const { return m_quit.size(); }
    size_t viewSubscriberCount() const { return m_viewChanged.size(); }

    /// @}

private:
    Signal<int> m_frameChanged;
    Signal<> m_quit;
    Signal<> m_viewChanged;

    std::map<DrawableHandle, std::unique_ptr<RecordingDrawable>> m_drawables;
    DrawableHandle m_nextHandle = 1;
    int m_drawablesCreated = 0;

    ViewportMetrics m_viewport;
    Background m_background;
    int m_frame = 0;
    int m_frameCount = 0;
};

} // namespace statusind
