// statusindicator command
// Parses the option list with CLI11 and applies it to a StatusIndicator

#include <statusind/command.h>
#include <statusind/status_indicator.h>
#include <CLI/CLI.hpp>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace statusind {

std::string commandUsage() {
    std::ostringstream ss;
    ss << "usage: " << COMMAND_NAME
       << " --progress [on|off] --timestep [timestep] --unit [fs|ps|ns] --header [string]\n";
    ss << "Options may also be written with a single dash (-progress on).\n";
    ss << "Displays a dynamic progress indicator for the top molecule.\n";
    ss << "Timestep per frame is given in the selected unit (ps by default). Defaults to "
       << DEFAULT_TIMESTEP << ".\n";
    return ss.str();
}

std::vector<std::string> splitCommandLine(const std::string& line) {
    std::vector<std::string> args;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            hasToken = true;
        } else if (!inQuotes && (c == ' ' || c == '\t')) {
            if (hasToken) {
                args.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current += c;
            hasToken = true;
        }
    }
    if (hasToken) {
        args.push_back(current);
    }
    return args;
}

// Rewrite "-progress" style option names to "--progress". Only tokens in
// option position are touched, so a value such as "-1" passes through.
static std::vector<std::string> normalizeOptionNames(const std::vector<std::string>& args) {
    static const char* const names[] = {"progress", "timestep", "header", "unit", "debug", "help"};

    std::vector<std::string> out;
    bool expectValue = false;
    for (const std::string& arg : args) {
        if (expectValue) {
            out.push_back(arg);
            expectValue = false;
            continue;
        }

        std::string name = arg;
        if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-') {
            for (const char* known : names) {
                if (arg.compare(1, std::string::npos, known) == 0) {
                    name = "-" + arg;
                    break;
                }
            }
        }
        expectValue = name.size() > 2 && name.compare(0, 2, "--") == 0 && name != "--help" &&
                      name.find('=') == std::string::npos;
        out.push_back(name);
    }
    return out;
}

CommandResult runCommand(StatusIndicator& indicator, const std::vector<std::string>& args) {
    if (args.empty()) {
        return {true, commandUsage()};
    }

    CLI::App app{"Displays a dynamic progress indicator for the top molecule.", COMMAND_NAME};
    app.set_help_flag("-h,--help", "Show this help");

    std::string progress;
    std::string timestep;
    std::string header;
    std::string unit;
    std::string debug;

    auto* progressOpt = app.add_option("--progress", progress, "Draw the progress bar")
                            ->check(CLI::IsMember({"on", "off"}));
    auto* timestepOpt = app.add_option("--timestep", timestep, "Time per frame");
    auto* headerOpt = app.add_option("--header", header, "Text shown at the top of the view");
    auto* unitOpt = app.add_option("--unit", unit, "Time unit")
                        ->check(CLI::IsMember({"fs", "ps", "ns"}));
    auto* debugOpt = app.add_option("--debug", debug, "Print debug messages")
                         ->check(CLI::IsMember({"on", "off"}));

    // CLI11 consumes the vector from the back
    const std::vector<std::string> normalized = normalizeOptionNames(args);
    std::vector<std::string> reversed(normalized.rbegin(), normalized.rend());

    try {
        app.parse(reversed);
    } catch (const CLI::CallForHelp&) {
        return {true, app.help()};
    } catch (const CLI::ParseError& e) {
        return {false, std::string("Warning: ") + COMMAND_NAME + " " + e.what()};
    }

    IndicatorState& state = indicator.state();

    if (unitOpt->count() > 0) {
        TimeUnit parsed;
        if (parseTimeUnit(unit, parsed)) {
            state.setUnit(parsed);
        }
    }

    if (timestepOpt->count() > 0) {
        double value = 0.0;
        if (parseTimestep(timestep, value)) {
            char buf[64];
            snprintf(buf, sizeof(buf), "%g", value);
            std::cout << "Setting timestep to " << buf << " " << timeUnitName(state.unit()) << "\n";
            state.setTimestep(value);
        } else {
            std::cerr << "[" << COMMAND_NAME << "] Warning: timestep '" << timestep
                      << "' is not a number, ignored\n";
        }
    }

    if (headerOpt->count() > 0) {
        state.setHeader(header);
    }

    if (debugOpt->count() > 0) {
        indicator.setDebug(debug == "on");
    }

    if (progressOpt->count() > 0) {
        indicator.toggle(progress == "on");
    }

    return {};
}

} // namespace statusind
