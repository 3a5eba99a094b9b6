// statusind Application
// Drives a RecordingHost through a trajectory (play) or from console input (repl)

#pragma once

#include <statusind/color.h>
#include <statusind/types.h>
#include <iosfwd>
#include <string>

namespace statusind::cli {

// Configuration passed from command-line arguments
struct PlayConfig {
    int frames = 101;
    double timestep = 0.001;
    std::string unit = "ps";
    std::string header;

    int viewportWidth = 800;
    int viewportHeight = 600;
    float scale = 1.0f;
    float nearClip = 0.5f;
    bool orthographic = false;

    Color background = Color::Black;
    bool gradient = false;
    Color gradientBottom = Color::Black;

    bool json = false;
    bool debug = false;
};

// Parse "WxH" into width and height
// Returns false (and leaves the outputs untouched) on malformed input
bool parseSize(const std::string& s, int& w, int& h);

// Enable the overlay and step through every frame, printing the time label
// Returns exit code (0 = success)
int runPlay(const PlayConfig& config, std::ostream& out);

// Read console lines and apply them until "quit" or end of input
// Returns exit code (0 = success)
int runRepl(const PlayConfig& config, std::istream& in, std::ostream& out);

} // namespace statusind::cli
