#include <statusind/state_json.h>

using json = nlohmann::json;

namespace statusind {

json toJson(const IndicatorConfig& config) {
    return {
        {"timestep", config.timestep},
        {"header", config.header},
        {"unit", timeUnitName(config.unit)},
        {"enabled", config.enabled}
    };
}

json toJson(const RenderState& state) {
    json j = {
        {"percentage", state.percentage},
        {"timeLabel", state.timeLabel},
        {"foreground", foregroundName(state.foreground)}
    };
    if (state.hasError()) {
        j["error"] = state.errorMessage;
    } else {
        j["error"] = nullptr;
    }
    return j;
}

json toJson(const OverlayRect& rect) {
    return {
        {"left", rect.left},
        {"top", rect.top},
        {"right", rect.right},
        {"bottom", rect.bottom},
        {"z", rect.z}
    };
}

json toJson(const OverlayLayout& layout) {
    return {
        {"displayWidth", layout.displayWidth},
        {"displayHeight", layout.displayHeight},
        {"front", layout.front},
        {"pixelWidthUnit", layout.pixelWidthUnit},
        {"pixelHeightUnit", layout.pixelHeightUnit},
        {"outer", toJson(layout.outer)},
        {"inner", toJson(layout.inner)},
        {"fill", toJson(layout.fill)},
        {"timeLabelAnchor", {layout.timeLabelAnchor.x, layout.timeLabelAnchor.y, layout.timeLabelAnchor.z}},
        {"headerAnchor", {layout.headerAnchor.x, layout.headerAnchor.y, layout.headerAnchor.z}}
    };
}

json toJson(const StatusIndicator& indicator) {
    json j;
    j["enabled"] = indicator.isEnabled();
    j["attached"] = indicator.isAttached();
    j["config"] = toJson(indicator.config());
    j["render"] = toJson(indicator.renderState());
    if (indicator.redrawCount() > 0 && !indicator.renderState().hasError()) {
        j["layout"] = toJson(indicator.layout());
    }
    return j;
}

} // namespace statusind
