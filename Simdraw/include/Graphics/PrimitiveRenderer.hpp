// Simdraw/include/Graphics/PrimitiveRenderer.hpp
#pragma once

#include <Types.hpp>
#include <Geometry/DrawBatch.hpp>
#include <Geometry/ShapeTessellator.hpp>
#include <Graphics/DrawSurface.hpp>
#include <cstdint>

namespace Simdraw {

/**
 * @brief Shape-level drawing on top of an injected DrawSurface
 *
 * Each call tessellates its shape, validates the batch and submits it. The
 * renderer keeps no geometry between calls.
 */
class PrimitiveRenderer {
public:
    struct Stats {
        uint64_t batches_submitted = 0;
        uint64_t batches_rejected = 0;
        uint64_t vertices_submitted = 0;
        uint64_t points_rendered = 0;
        uint64_t lines_rendered = 0;
        uint64_t shapes_rendered = 0;
    };

public:
    explicit PrimitiveRenderer(DrawSurface& surface,
                               const TessellationSettings& settings = TessellationSettings());

    // Point primitives
    ErrorCode drawPoints(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());

    // Line primitives
    ErrorCode drawLine(const Point& start, const Point& end, const ColorSequence& colors = ColorSequence());
    ErrorCode drawLineLoop(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());

    // Rectangle primitives
    ErrorCode drawRectangle(const Point& corner1, const Point& corner2, bool filled = true);
    ErrorCode drawBox(const Point& position, float width, float height);

    // Curves
    ErrorCode drawEllipse(const Point& corner1, const Point& corner2, bool filled = true,
                          const EllipseOptions& options = EllipseOptions());
    ErrorCode drawCircle(const Point& center, float radius, bool filled = true,
                         const EllipseOptions& options = EllipseOptions());

    // Polygon primitives
    ErrorCode drawNgon(const Point& center, float radius, int sides,
                       float start_angle = 0.0f, bool filled = true);
    ErrorCode drawPolygon(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());
    ErrorCode drawQuad(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());

    // Grid at the configured spacing
    ErrorCode drawGrid(const Point& origin, float width, float height);

    // Validate and forward an already built batch
    ErrorCode submit(const DrawBatch& batch);

    // Configuration
    void setSettings(const TessellationSettings& settings) { m_settings = settings; }
    const TessellationSettings& getSettings() const { return m_settings; }
    DrawSurface& getSurface() { return m_surface; }

    // Statistics
    const Stats& getStats() const { return m_stats; }
    void resetStats();

private:
    DrawSurface& m_surface;
    TessellationSettings m_settings;
    Stats m_stats;
};

} // namespace Simdraw
