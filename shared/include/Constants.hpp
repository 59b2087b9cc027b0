// shared/include/Constants.hpp
#pragma once

#include <cstdint>

namespace Simdraw {

constexpr const char* VERSION_STRING = "1.0.0";

// Angle constants in radians. Not named PI: raylib defines PI as a macro.
namespace Angles {
    constexpr float HALF_TURN = 3.14159265358979323846f;
    constexpr float FULL_TURN = 2.0f * HALF_TURN;
    constexpr float QUARTER_TURN = 0.5f * HALF_TURN;

    // Slack on the inclusive end of an angle walk
    constexpr float WALK_EPSILON = 1e-4f;
}

// System limits
namespace Limits {
    // Performance limits
    constexpr uint32_t MAX_FPS = 300;
    constexpr uint32_t MIN_FPS = 10;

    // Window limits
    constexpr uint32_t MIN_WINDOW_WIDTH = 320;
    constexpr uint32_t MIN_WINDOW_HEIGHT = 240;

    // Tessellation limits
    constexpr uint32_t MAX_CURVE_SEGMENTS = 8192;
    constexpr int MIN_POLYGON_SIDES = 3;
    constexpr uint32_t MAX_GRID_LINES = 16384;
    constexpr float MIN_GRID_SPACING = 1.0f;
}

// Default values
namespace Defaults {
    constexpr uint32_t WINDOW_WIDTH = 1280;
    constexpr uint32_t WINDOW_HEIGHT = 720;
    constexpr uint32_t TARGET_FPS = 30;
    constexpr const char* WINDOW_TITLE = "Simdraw Viewer";
    constexpr const char* LOG_FILE = "simdraw.log";

    // Curve tessellation
    constexpr float CHORD_LENGTH = 32.0f;
    constexpr float MAX_ANGLE_STEP = Angles::HALF_TURN / 16.0f;
    constexpr float MIN_RADIUS = 0.01f;

    constexpr float GRID_SPACING = 50.0f;

    // Background worker
    constexpr uint32_t STATS_INTERVAL_MS = 1000;
}

} // namespace Simdraw
