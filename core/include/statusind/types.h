#pragma once

/**
 * @file types.h
 * @brief Shared value types: viewport metrics, time units, parameter declarations
 */

#include <string>
#include <vector>

namespace statusind {

/**
 * @brief Camera projection mode reported by the host viewport
 */
enum class Projection {
    Orthographic,
    Perspective
};

/**
 * @brief Snapshot of the host's active viewport
 *
 * Read from the host at the start of every redraw cycle. Never stored
 * between cycles.
 */
struct ViewportMetrics {
    int pixelWidth = 1;                          ///< Viewport width in pixels (> 0)
    int pixelHeight = 1;                         ///< Viewport height in pixels (> 0)
    float scaleFactor = 1.0f;                    ///< World-to-display scale (> 0)
    float nearClip = 0.5f;                       ///< Near clip plane distance
    Projection projection = Projection::Perspective;

    /// @brief True when the metrics describe a drawable area
    bool isValid() const {
        return pixelWidth > 0 && pixelHeight > 0 && scaleFactor > 0.0f;
    }
};

/**
 * @brief Unit appended to the time label
 */
enum class TimeUnit {
    Femtoseconds,
    Picoseconds,
    Nanoseconds
};

inline const char* timeUnitName(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Femtoseconds: return "fs";
        case TimeUnit::Picoseconds:  return "ps";
        case TimeUnit::Nanoseconds:  return "ns";
        default:                     return "ps";
    }
}

/**
 * @brief Parse "fs", "ps" or "ns"
 * @param name Unit abbreviation
 * @param out Receives the unit on success
 * @return false if the name is not a known unit
 */
inline bool parseTimeUnit(const std::string& name, TimeUnit& out) {
    if (name == "fs") { out = TimeUnit::Femtoseconds; return true; }
    if (name == "ps") { out = TimeUnit::Picoseconds;  return true; }
    if (name == "ns") { out = TimeUnit::Nanoseconds;  return true; }
    return false;
}

/**
 * @brief Parameter types exposed to configuration surfaces
 */
enum class ParamType {
    Float,    ///< Single numeric value
    Bool,     ///< Boolean toggle
    String,   ///< Free text
    Choice    ///< One of a fixed list of strings
};

/**
 * @brief Parameter declaration for introspection and dialog generation
 */
struct ParamDecl {
    std::string name;                 ///< Field name ("timestep", "header", ...)
    ParamType type;                   ///< Data type
    std::string value;                ///< Current value, formatted as text
    std::vector<std::string> choices; ///< Allowed values for Choice parameters
};

} // namespace statusind
