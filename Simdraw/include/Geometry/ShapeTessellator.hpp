// Simdraw/include/Geometry/ShapeTessellator.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <Geometry/DrawBatch.hpp>
#include <cstdint>
#include <vector>

namespace Simdraw {

/**
 * @brief Curve density settings shared by every ellipse request
 */
struct TessellationSettings {
    float chord_length = Defaults::CHORD_LENGTH;      // target segment length
    float max_angle_step = Defaults::MAX_ANGLE_STEP;  // ceiling per segment
    float min_radius = Defaults::MIN_RADIUS;          // floor for degenerate shapes
    float grid_spacing = Defaults::GRID_SPACING;
    uint32_t max_segments = Limits::MAX_CURVE_SEGMENTS;
};

/**
 * @brief Per-request overrides for ellipse tessellation
 *
 * Zero means "not set". Setting both angle_step and arc_step is a
 * configuration conflict.
 */
struct EllipseOptions {
    float angle_step = 0.0f;  // explicit angular delta in radians
    float arc_step = 0.0f;    // explicit target chord length
    bool dashed = false;      // emit every other step only
};

/**
 * @brief Expands shape requests into vertex sequences
 *
 * Every function is pure and returns a freshly allocated sequence. Caller
 * errors throw GeometryError; degenerate sizes never do.
 */
namespace ShapeTessellator {
    /**
     * @brief Angular step used to walk an ellipse with the given radii
     *
     * An explicit angle step wins. Otherwise the step is the angle subtending
     * the target chord on the average radius (floored at min_radius), capped at
     * max_angle_step. The result never drops below 2*pi / max_segments.
     */
    float ellipseAngleStep(float xrad, float yrad,
                           const EllipseOptions& options = EllipseOptions(),
                           const TessellationSettings& settings = TessellationSettings());

    // Points on the ellipse inscribed in the box (x1,y1)-(x2,y2), angle 0 to 2*pi inclusive
    std::vector<Point> iterateEllipse(float x1, float y1, float x2, float y2,
                                      const EllipseOptions& options = EllipseOptions(),
                                      const TessellationSettings& settings = TessellationSettings());

    // sides + 1 points from start_angle to start_angle + 2*pi inclusive
    std::vector<Point> iterateNgon(float x, float y, float radius, int sides, float start_angle = 0.0f);

    VertexSequence flatten(const std::vector<Point>& points);

    // Curves
    DrawBatch ellipse(float x1, float y1, float x2, float y2,
                      const EllipseOptions& options = EllipseOptions(),
                      const TessellationSettings& settings = TessellationSettings());
    DrawBatch ellipseOutline(float x1, float y1, float x2, float y2,
                             const EllipseOptions& options = EllipseOptions(),
                             const TessellationSettings& settings = TessellationSettings());
    DrawBatch circle(float x, float y, float radius,
                     const EllipseOptions& options = EllipseOptions(),
                     const TessellationSettings& settings = TessellationSettings());
    DrawBatch circleOutline(float x, float y, float radius,
                            const EllipseOptions& options = EllipseOptions(),
                            const TessellationSettings& settings = TessellationSettings());

    // Regular polygons
    DrawBatch ngon(float x, float y, float radius, int sides, float start_angle = 0.0f);
    DrawBatch ngonOutline(float x, float y, float radius, int sides, float start_angle = 0.0f);

    // Straight-edged primitives
    DrawBatch line(float x1, float y1, float x2, float y2, const ColorSequence& colors = ColorSequence());
    DrawBatch lineLoop(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());
    DrawBatch rect(float x1, float y1, float x2, float y2);
    DrawBatch rectOutline(float x1, float y1, float x2, float y2);
    DrawBatch boxOutline(float x, float y, float width, float height);
    DrawBatch points(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());
    DrawBatch polygon(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());
    DrawBatch quad(const VertexSequence& vertices, const ColorSequence& colors = ColorSequence());

    /**
     * @brief Axis-aligned grid lines covering the given area
     *
     * Lines are snapped to multiples of spacing at or below the origin, so the
     * same world lines are produced however the area is panned. Vertical lines
     * run from the snapped y for `height`; horizontal lines run from the
     * requested x for `width`.
     */
    DrawBatch grid(float x, float y, float width, float height,
                   float spacing = Defaults::GRID_SPACING);
}

} // namespace Simdraw
