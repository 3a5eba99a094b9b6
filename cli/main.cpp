// statusind - Entry Point
// Parses command-line arguments and runs playback or the console

#include "app.h"
#include <statusind/statusind.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

using statusind::Color;
using statusind::cli::PlayConfig;

// Options shared by 'play' and 'repl'
static void addCommonOptions(CLI::App* cmd, PlayConfig& config, std::string& size,
                             std::string& background, std::string& gradientBottom) {
    cmd->add_option("-f,--frames", config.frames, "Number of frames in the trajectory")
       ->check(CLI::NonNegativeNumber);
    cmd->add_option("-t,--timestep", config.timestep, "Time per frame");
    cmd->add_option("-u,--unit", config.unit, "Time unit: fs, ps, ns")
       ->check(CLI::IsMember({"fs", "ps", "ns"}));
    cmd->add_option("--header", config.header, "Header text");
    cmd->add_option("-s,--size", size, "Viewport size WxH")->default_val("800x600");
    cmd->add_option("--scale", config.scale, "View scale factor")->check(CLI::PositiveNumber);
    cmd->add_option("--near", config.nearClip, "Near clip distance");
    cmd->add_flag("--ortho", config.orthographic, "Use an orthographic projection");
    cmd->add_option("--background", background, "Background color r,g,b (0-1)");
    cmd->add_option("--gradient", gradientBottom, "Bottom color r,g,b of a background gradient");
    cmd->add_flag("--debug", config.debug, "Print debug messages");
}

// Apply the string-valued options once parsing succeeded
// Returns 0 on success, otherwise an exit code
static int finishConfig(PlayConfig& config, const std::string& size,
                        const std::string& background, const std::string& gradientBottom) {
    if (!statusind::cli::parseSize(size, config.viewportWidth, config.viewportHeight)) {
        std::cerr << "Error: --size expects <W>x<H>, got '" << size << "'\n";
        return 2;
    }
    if (!background.empty() && !Color::parse(background, config.background)) {
        std::cerr << "Error: --background expects r,g,b, got '" << background << "'\n";
        return 2;
    }
    if (!gradientBottom.empty()) {
        if (!Color::parse(gradientBottom, config.gradientBottom)) {
            std::cerr << "Error: --gradient expects r,g,b, got '" << gradientBottom << "'\n";
            return 2;
        }
        config.gradient = true;
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"statusind - progress bar and time label overlay"};
    app.set_version_flag("-v,--version", std::string(statusind::VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    PlayConfig playConfig;
    std::string playSize, playBackground, playGradient;
    auto* playCmd = app.add_subcommand("play", "Step through every frame and print the time label");
    addCommonOptions(playCmd, playConfig, playSize, playBackground, playGradient);
    playCmd->add_flag("--json", playConfig.json, "Print the final state as JSON");

    PlayConfig replConfig;
    std::string replSize, replBackground, replGradient;
    auto* replCmd = app.add_subcommand("repl", "Read overlay and host commands from stdin");
    addCommonOptions(replCmd, replConfig, replSize, replBackground, replGradient);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (playCmd->parsed()) {
        int rc = finishConfig(playConfig, playSize, playBackground, playGradient);
        if (rc != 0) return rc;
        return statusind::cli::runPlay(playConfig, std::cout);
    }

    if (replCmd->parsed()) {
        int rc = finishConfig(replConfig, replSize, replBackground, replGradient);
        if (rc != 0) return rc;
        std::cout << "statusind " << statusind::VERSION << " - type 'help' for commands\n";
        return statusind::cli::runRepl(replConfig, std::cin, std::cout);
    }

    return 0;
}
