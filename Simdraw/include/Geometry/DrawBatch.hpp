// Simdraw/include/Geometry/DrawBatch.hpp
#pragma once

#include <Types.hpp>
#include <cstdint>
#include <utility>

namespace Simdraw {

// How the rendering collaborator connects the vertices of a batch
enum class PrimitiveKind : uint8_t {
    POINTS,
    LINES,
    LINE_LOOP,
    TRIANGLE_FAN,
    QUADS,
    POLYGON
};

const char* primitiveKindToString(PrimitiveKind kind);

/**
 * @brief A vertex sequence ready for a single draw call
 *
 * The color sequence is optional; when present it must carry exactly one
 * RGBA quadruple per vertex.
 */
struct DrawBatch {
    PrimitiveKind kind = PrimitiveKind::POINTS;
    VertexSequence vertices;
    ColorSequence colors;

    DrawBatch() = default;
    DrawBatch(PrimitiveKind kind_, VertexSequence vertices_, ColorSequence colors_ = ColorSequence())
        : kind(kind_), vertices(std::move(vertices_)), colors(std::move(colors_)) {}

    size_t vertexCount() const { return vertices.size() / 2; }
    bool hasColors() const { return !colors.empty(); }
    bool isEmpty() const { return vertices.empty(); }

    Point vertex(size_t index) const { return {vertices[index * 2], vertices[index * 2 + 1]}; }

    // MALFORMED_DRAW_CALL when the arities disagree, SUCCESS otherwise
    ErrorCode validate() const;
};

} // namespace Simdraw
