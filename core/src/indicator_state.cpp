#include <statusind/indicator_state.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace statusind {

std::string formatTimeLabel(int frameIndex, int totalFrames, double timestep, TimeUnit unit) {
    const double current = frameIndex * timestep;
    const double total = (totalFrames - 1) * timestep;

    char buf[128];
    snprintf(buf, sizeof(buf), "Time: %.2f / %.2f %s", current, total, timeUnitName(unit));
    return buf;
}

RenderState computeRenderState(const IndicatorConfig& config, int frameIndex, int totalFrames,
                               const RenderState& previous) {
    RenderState state = previous;

    if (!(config.timestep > 0.0) || !std::isfinite(config.timestep)) {
        state.errorMessage = "Error: timestep must be > 0";
        return state;
    }
    if (totalFrames <= 0) {
        state.errorMessage = "Error: top molecule has no frames";
        return state;
    }
    if (totalFrames == 1) {
        state.errorMessage = "Error: top molecule has only one frame";
        return state;
    }

    const double ratio = static_cast<double>(frameIndex) / (totalFrames - 1);
    state.percentage = static_cast<float>(std::clamp(ratio, 0.0, 1.0));
    state.timeLabel = formatTimeLabel(frameIndex, totalFrames, config.timestep, config.unit);
    state.errorMessage.clear();
    return state;
}

void IndicatorState::setTimestep(double timestep) {
    m_config.timestep = timestep;
    m_changed.emit(ConfigField::Timestep);
}

void IndicatorState::setHeader(const std::string& header) {
    m_config.header = header;
    m_changed.emit(ConfigField::Header);
}

void IndicatorState::setUnit(TimeUnit unit) {
    m_config.unit = unit;
    m_changed.emit(ConfigField::Unit);
}

std::vector<ParamDecl> IndicatorState::params() const {
    std::vector<ParamDecl> decls;
    for (const char* name : {"enabled", "timestep", "unit", "header"}) {
        ParamDecl decl;
        decl.name = name;
        getParam(decl.name, decl.value);
        if (decl.name == "enabled") {
            decl.type = ParamType::Bool;
        } else if (decl.name == "timestep") {
            decl.type = ParamType::Float;
        } else if (decl.name == "unit") {
            decl.type = ParamType::Choice;
            decl.choices = {"fs", "ps", "ns"};
        } else {
            decl.type = ParamType::String;
        }
        decls.push_back(decl);
    }
    return decls;
}

bool IndicatorState::getParam(const std::string& name, std::string& out) const {
    if (name == "enabled") {
        out = m_config.enabled ? "on" : "off";
        return true;
    }
    if (name == "timestep") {
        char buf[64];
        snprintf(buf, sizeof(buf), "%g", m_config.timestep);
        out = buf;
        return true;
    }
    if (name == "unit") {
        out = timeUnitName(m_config.unit);
        return true;
    }
    if (name == "header") {
        out = m_config.header;
        return true;
    }
    return false;
}

bool IndicatorState::setParam(const std::string& name, const std::string& value) {
    if (name == "timestep") {
        double v = 0.0;
        if (!parseTimestep(value, v)) return false;
        setTimestep(v);
        return true;
    }
    if (name == "unit") {
        TimeUnit unit;
        if (!parseTimeUnit(value, unit)) return false;
        setUnit(unit);
        return true;
    }
    if (name == "header") {
        setHeader(value);
        return true;
    }
    // "enabled" goes through StatusIndicator::toggle so the overlay attaches
    return false;
}

bool parseTimestep(const std::string& text, double& out) {
    if (text.empty()) return false;

    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ' || *end == '\t') ++end;
    if (*end != '\0') return false;
    if (!std::isfinite(v)) return false;

    out = v;
    return true;
}

bool validateTimestepInput(const std::string& text) {
    if (text.empty()) return true;
    double ignored = 0.0;
    return parseTimestep(text, ignored);
}

} // namespace statusind
