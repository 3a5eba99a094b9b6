#pragma once

/**
 * @file indicator_state.h
 * @brief Indicator configuration, derived render state and the label math
 */

#include <statusind/color.h>
#include <statusind/signal.h>
#include <statusind/types.h>
#include <string>
#include <vector>

namespace statusind {

/// Timestep used until one is configured (per frame, in the configured unit)
constexpr double DEFAULT_TIMESTEP = 0.001;

/**
 * @brief User-facing configuration
 */
struct IndicatorConfig {
    double timestep = DEFAULT_TIMESTEP;
    std::string header;
    TimeUnit unit = TimeUnit::Picoseconds;
    bool enabled = false;
};

/**
 * @brief Values derived during a redraw cycle
 *
 * A non-empty errorMessage means nothing was drawn for that cycle.
 */
struct RenderState {
    float percentage = 0.0f;
    std::string timeLabel;
    std::string errorMessage;
    Foreground foreground = Foreground::White;

    bool hasError() const { return !errorMessage.empty(); }
};

/**
 * @brief Configuration fields that trigger a redraw when written
 */
enum class ConfigField {
    Timestep,
    Header,
    Unit
};

inline const char* configFieldName(ConfigField field) {
    switch (field) {
        case ConfigField::Timestep: return "timestep";
        case ConfigField::Header:   return "header";
        case ConfigField::Unit:     return "unit";
        default:                    return "unknown";
    }
}

/**
 * @brief Format the time label for a frame
 * @return e.g. "Time: 0.05 / 0.10 ps"
 */
std::string formatTimeLabel(int frameIndex, int totalFrames, double timestep, TimeUnit unit);

/**
 * @brief Derive percentage and label for the current host frame
 *
 * Fails (sets errorMessage) when the timestep is not positive, or when the
 * trajectory has fewer than two frames. On failure percentage and
 * timeLabel are carried over from @p previous.
 *
 * @param config Current configuration
 * @param frameIndex Host frame index
 * @param totalFrames Host frame count
 * @param previous State of the previous cycle
 */
RenderState computeRenderState(const IndicatorConfig& config, int frameIndex, int totalFrames,
                               const RenderState& previous);

/**
 * @brief Owns the configuration and the last render state
 *
 * Every write to timestep, header or unit emits changed(), whether or not
 * the value differs. The enabled flag is written by the controller only
 * and does not emit.
 */
class IndicatorState {
public:
    const IndicatorConfig& config() const { return m_config; }
    const RenderState& renderState() const { return m_render; }

    void setTimestep(double timestep);
    void setHeader(const std::string& header);
    void setUnit(TimeUnit unit);
    void setEnabled(bool enabled) { m_config.enabled = enabled; }
    void setRenderState(const RenderState& state) { m_render = state; }

    double timestep() const { return m_config.timestep; }
    const std::string& header() const { return m_config.header; }
    TimeUnit unit() const { return m_config.unit; }
    bool enabled() const { return m_config.enabled; }

    /// @brief Emitted after timestep, header or unit is written
    Signal<ConfigField>& changed() { return m_changed; }

    // -------------------------------------------------------------------------
    /// @name Dialog interface
    /// @{

    /// @brief Declarations of the editable fields with their current values
    std::vector<ParamDecl> params() const;

    /**
     * @brief Read a field as text
     * @return false for unknown names
     */
    bool getParam(const std::string& name, std::string& out) const;

    /**
     * @brief Write a field from text
     * @return false for unknown names or values that do not parse
     */
    bool setParam(const std::string& name, const std::string& value);

    /// @}

private:
    IndicatorConfig m_config;
    RenderState m_render;
    Signal<ConfigField> m_changed;
};

/**
 * @brief Keystroke validator for a timestep text field
 * @return true for the empty string and for text that parses as a number
 */
bool validateTimestepInput(const std::string& text);

/**
 * @brief Parse a timestep
 * @param text Candidate value
 * @param out Receives the value on success
 * @return false if the text is not a complete finite number
 */
bool parseTimestep(const std::string& text, double& out);

} // namespace statusind
