#pragma once

// statusindicator command
// Handles: statusindicator --progress on|off --timestep <t> --header <text> --unit fs|ps|ns

#include <string>
#include <vector>

namespace statusind {

class StatusIndicator;

/// Name the command is registered under in the host's console
constexpr const char* COMMAND_NAME = "statusindicator";

// Outcome of one command invocation. Failures never change the indicator.
struct CommandResult {
    bool ok = true;
    std::string message;  // usage/help text on success, error text on failure
};

// Apply a statusindicator command to an indicator
// args excludes the command name. No arguments prints usage.
// Options are applied in the order unit, timestep, header, debug, progress.
CommandResult runCommand(StatusIndicator& indicator, const std::vector<std::string>& args);

// Split a console line into arguments, honoring double quotes
std::vector<std::string> splitCommandLine(const std::string& line);

// Usage text printed for an empty invocation
std::string commandUsage();

} // namespace statusind
