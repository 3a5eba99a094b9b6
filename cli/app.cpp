// statusind Application Implementation
// Headless host setup, trajectory playback and the interactive console

#include "app.h"

#include <statusind/statusind.h>
#include <statusind/recording_host.h>
#include <statusind/state_json.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace statusind::cli {

bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos) {
        return false;
    }
    int width = std::atoi(s.substr(0, x).c_str());
    int height = std::atoi(s.substr(x + 1).c_str());
    if (width <= 0 || height <= 0) {
        return false;
    }
    w = width;
    h = height;
    return true;
}

// -----------------------------------------------------------------------------
// Setup
// -----------------------------------------------------------------------------

static ViewportMetrics viewportFromConfig(const PlayConfig& config) {
    ViewportMetrics metrics;
    metrics.pixelWidth = config.viewportWidth;
    metrics.pixelHeight = config.viewportHeight;
    metrics.scaleFactor = config.scale;
    metrics.nearClip = config.nearClip;
    metrics.projection = config.orthographic ? Projection::Orthographic : Projection::Perspective;
    return metrics;
}

static void setupHost(RecordingHost& host, const PlayConfig& config) {
    host.setViewport(viewportFromConfig(config));

    Background background;
    background.color = config.background;
    background.gradient = config.gradient;
    background.gradientBottom = config.gradientBottom;
    host.setBackground(background);

    host.setFrameCount(config.frames);
}

static void setupIndicator(StatusIndicator& indicator, const PlayConfig& config) {
    IndicatorState& state = indicator.state();

    TimeUnit unit;
    if (parseTimeUnit(config.unit, unit)) {
        state.setUnit(unit);
    } else {
        std::cerr << "[statusind] Warning: unknown unit '" << config.unit << "', using "
                  << timeUnitName(state.unit()) << "\n";
    }
    state.setTimestep(config.timestep);
    state.setHeader(config.header);
    indicator.setDebug(config.debug);
}

static size_t primitiveCount(const RecordingHost& host, const StatusIndicator& indicator) {
    auto handle = indicator.drawableHandle();
    if (!handle) return 0;
    const RecordingDrawable* drawable = host.recording(*handle);
    return drawable ? drawable->primitiveCount() : 0;
}

static nlohmann::json snapshot(const RecordingHost& host, const StatusIndicator& indicator) {
    nlohmann::json j = toJson(indicator);
    j["frame"] = host.currentFrameIndex();
    j["frames"] = host.totalFrameCount();
    j["primitives"] = primitiveCount(host, indicator);
    return j;
}

// -----------------------------------------------------------------------------
// Playback
// -----------------------------------------------------------------------------

int runPlay(const PlayConfig& config, std::ostream& out) {
    RecordingHost host;
    setupHost(host, config);

    StatusIndicator indicator(host);
    setupIndicator(indicator, config);
    indicator.toggle(true);

    int failedFrames = 0;
    const int lastFrame = config.frames > 0 ? config.frames - 1 : 0;
    for (int frame = 0; frame <= lastFrame; ++frame) {
        host.setFrame(frame);

        const RenderState& rs = indicator.renderState();
        if (rs.hasError()) {
            ++failedFrames;
            if (!config.json) {
                out << "frame " << frame << ": " << rs.errorMessage << "\n";
            }
        } else if (!config.json) {
            out << "frame " << frame << ": " << rs.timeLabel << "\n";
        }
    }

    if (config.json) {
        out << snapshot(host, indicator).dump(2) << "\n";
    }

    host.requestQuit();
    return failedFrames == 0 ? 0 : 1;
}

// -----------------------------------------------------------------------------
// Console
// -----------------------------------------------------------------------------

static void printReplHelp(std::ostream& out) {
    out << "Commands:\n";
    out << "  " << COMMAND_NAME << " [options]   Configure the overlay (no options: usage)\n";
    out << "  frame <n>                  Move the host to frame n\n";
    out << "  frames <n>                 Set the trajectory length\n";
    out << "  resize <W>x<H>             Resize the viewport\n";
    out << "  scale <s>                  Set the view scale\n";
    out << "  projection ortho|persp     Switch projection\n";
    out << "  background r,g,b           Set the background color\n";
    out << "  reset-colors               Resample the background for the text color\n";
    out << "  status [--json]            Print the indicator state\n";
    out << "  help                       Show this help\n";
    out << "  quit                       Send quit to the host and exit\n";
}

static void printStatus(const RecordingHost& host, const StatusIndicator& indicator,
                        std::ostream& out) {
    const IndicatorConfig& config = indicator.config();
    const RenderState& rs = indicator.renderState();

    out << "enabled:  " << (config.enabled ? "on" : "off")
        << (indicator.isAttached() ? " (attached)" : "") << "\n";
    out << "frame:    " << host.currentFrameIndex() << " / " << host.totalFrameCount() << "\n";
    out << "timestep: " << config.timestep << " " << timeUnitName(config.unit) << "\n";
    out << "header:   " << config.header << "\n";
    out << "label:    " << rs.timeLabel << "\n";
    out << "progress: " << rs.percentage << "\n";
    if (rs.hasError()) {
        out << "error:    " << rs.errorMessage << "\n";
    }
    out << "drawn:    " << primitiveCount(host, indicator) << " primitives\n";
}

int runRepl(const PlayConfig& config, std::istream& in, std::ostream& out) {
    RecordingHost host;
    setupHost(host, config);

    StatusIndicator indicator(host);
    setupIndicator(indicator, config);

    std::string line;
    while (std::getline(in, line)) {
        std::vector<std::string> args = splitCommandLine(line);
        if (args.empty()) {
            continue;
        }

        const std::string cmd = args[0];
        args.erase(args.begin());

        if (cmd == COMMAND_NAME) {
            CommandResult result = runCommand(indicator, args);
            if (!result.ok) {
                std::cerr << result.message << "\n";
            } else if (!result.message.empty()) {
                out << result.message;
            }
        } else if (cmd == "frame" && args.size() == 1) {
            host.setFrame(std::atoi(args[0].c_str()));
        } else if (cmd == "frames" && args.size() == 1) {
            host.setFrameCount(std::atoi(args[0].c_str()));
        } else if (cmd == "resize" && args.size() == 1) {
            ViewportMetrics metrics = host.activeViewport();
            if (parseSize(args[0], metrics.pixelWidth, metrics.pixelHeight)) {
                host.setViewport(metrics);
            } else {
                std::cerr << "Error: expected <W>x<H>, got '" << args[0] << "'\n";
            }
        } else if (cmd == "scale" && args.size() == 1) {
            float s = std::strtof(args[0].c_str(), nullptr);
            if (s > 0.0f) {
                ViewportMetrics metrics = host.activeViewport();
                metrics.scaleFactor = s;
                host.setViewport(metrics);
            } else {
                std::cerr << "Error: scale must be > 0\n";
            }
        } else if (cmd == "projection" && args.size() == 1) {
            ViewportMetrics metrics = host.activeViewport();
            if (args[0] == "ortho") {
                metrics.projection = Projection::Orthographic;
            } else if (args[0] == "persp") {
                metrics.projection = Projection::Perspective;
            } else {
                std::cerr << "Error: expected ortho or persp\n";
                continue;
            }
            host.setViewport(metrics);
        } else if (cmd == "background" && args.size() == 1) {
            Background background = host.background();
            if (Color::parse(args[0], background.color)) {
                background.gradient = false;
                host.setBackground(background);
            } else {
                std::cerr << "Error: expected r,g,b\n";
            }
        } else if (cmd == "reset-colors") {
            indicator.resetColors();
            indicator.redraw();
        } else if (cmd == "status") {
            if (!args.empty() && args[0] == "--json") {
                out << snapshot(host, indicator).dump(2) << "\n";
            } else {
                printStatus(host, indicator, out);
            }
        } else if (cmd == "help") {
            printReplHelp(out);
        } else if (cmd == "quit" || cmd == "exit") {
            host.requestQuit();
            return 0;
        } else {
            std::cerr << "Error: unknown command '" << cmd << "' (try help)\n";
        }
    }

    host.requestQuit();
    return 0;
}

} // namespace statusind::cli
