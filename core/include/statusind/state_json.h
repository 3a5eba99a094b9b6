#pragma once

/**
 * @file state_json.h
 * @brief JSON snapshots of the indicator for tooling and the CLI
 */

#include <statusind/overlay_layout.h>
#include <statusind/status_indicator.h>
#include <nlohmann/json.hpp>

namespace statusind {

nlohmann::json toJson(const IndicatorConfig& config);
nlohmann::json toJson(const RenderState& state);
nlohmann::json toJson(const OverlayRect& rect);
nlohmann::json toJson(const OverlayLayout& layout);

/**
 * @brief Full snapshot: enabled/attached flags, config, render state, layout
 *
 * The layout is only included once a redraw has succeeded.
 */
nlohmann::json toJson(const StatusIndicator& indicator);

} // namespace statusind
