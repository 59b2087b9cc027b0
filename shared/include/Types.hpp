// shared/include/Types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Simdraw {

// Forward declarations
class DrawSurface;
class PrimitiveRenderer;
class RaylibSurface;
class Viewer;

// Basic geometric types
struct Point {
    float x, y;

    Point() : x(0), y(0) {}
    Point(float x_, float y_) : x(x_), y(y_) {}

    Point operator+(const Point& other) const { return {x + other.x, y + other.y}; }
    Point operator-(const Point& other) const { return {x - other.x, y - other.y}; }

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Flat sequences handed to the rendering collaborator:
// vertices are [x1, y1, x2, y2, ...], colors are [r1, g1, b1, a1, r2, ...]
using VertexSequence = std::vector<float>;
using ColorSequence = std::vector<float>;

struct Color {
    float r, g, b, a;

    Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}
    Color(float r_, float g_, float b_, float a_ = 1.0f) : r(r_), g(g_), b(b_), a(a_) {}

    static Color fromRGBA8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

    // Repeat this color once per vertex
    ColorSequence fill(size_t vertex_count) const;

    // Named colors (not ALL_CAPS: raylib defines those as macros)
    static const Color White;
    static const Color Black;
    static const Color Red;
    static const Color Green;
    static const Color Blue;
    static const Color Gray;
    static const Color Transparent;
};

// Error codes
enum class ErrorCode : uint32_t {
    SUCCESS = 0,
    INVALID_PARAMETER = 1,
    CONFIGURATION_CONFLICT = 2,
    MALFORMED_DRAW_CALL = 3,
    SURFACE_NOT_READY = 4
};

const char* errorCodeToString(ErrorCode code);

/**
 * @brief Raised for caller errors in shape requests (conflicting or invalid parameters)
 */
class GeometryError : public std::runtime_error {
public:
    GeometryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace Simdraw
