#pragma once

// statusind - Main header
// Progress bar and time label overlay for a host 3D viewport

#include <statusind/types.h>
#include <statusind/color.h>
#include <statusind/signal.h>
#include <statusind/host.h>
#include <statusind/overlay_layout.h>
#include <statusind/indicator_state.h>
#include <statusind/overlay_renderer.h>
#include <statusind/status_indicator.h>
#include <statusind/command.h>

namespace statusind {

// Version info
constexpr const char* VERSION = "1.1.0";

} // namespace statusind
