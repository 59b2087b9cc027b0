// shared/src/Types.cpp
#include <Types.hpp>

namespace Simdraw {

// Named colors
const Color Color::White{1.0f, 1.0f, 1.0f, 1.0f};
const Color Color::Black{0.0f, 0.0f, 0.0f, 1.0f};
const Color Color::Red{1.0f, 0.0f, 0.0f, 1.0f};
const Color Color::Green{0.0f, 1.0f, 0.0f, 1.0f};
const Color Color::Blue{0.0f, 0.0f, 1.0f, 1.0f};
const Color Color::Gray{0.5f, 0.5f, 0.5f, 1.0f};
const Color Color::Transparent{0.0f, 0.0f, 0.0f, 0.0f};

Color Color::fromRGBA8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
}

ColorSequence Color::fill(size_t vertex_count) const {
    ColorSequence colors;
    colors.reserve(vertex_count * 4);

    for (size_t i = 0; i < vertex_count; ++i) {
        colors.insert(colors.end(), {r, g, b, a});
    }

    return colors;
}

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorCode::CONFIGURATION_CONFLICT: return "CONFIGURATION_CONFLICT";
        case ErrorCode::MALFORMED_DRAW_CALL: return "MALFORMED_DRAW_CALL";
        case ErrorCode::SURFACE_NOT_READY: return "SURFACE_NOT_READY";
        default: return "UNKNOWN";
    }
}

} // namespace Simdraw
