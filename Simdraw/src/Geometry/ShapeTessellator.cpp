// Simdraw/src/Geometry/ShapeTessellator.cpp
#include <Geometry/ShapeTessellator.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace Simdraw {

namespace ShapeTessellator {

namespace {

bool isPositiveFinite(float value) {
    return std::isfinite(value) && value > 0.0f;
}

// Largest multiple of spacing at or below value
float snapDown(float value, float spacing) {
    return std::floor(value / spacing) * spacing;
}

} // namespace

float ellipseAngleStep(float xrad, float yrad, const EllipseOptions& options,
                       const TessellationSettings& settings) {
    if (options.angle_step != 0.0f && options.arc_step != 0.0f) {
        throw GeometryError(ErrorCode::CONFIGURATION_CONFLICT,
                            "Can only set one of angle step and arc step");
    }

    float min_step = Angles::FULL_TURN / static_cast<float>(std::max<uint32_t>(settings.max_segments, 1));

    if (options.angle_step != 0.0f) {
        if (!isPositiveFinite(options.angle_step)) {
            throw GeometryError(ErrorCode::INVALID_PARAMETER,
                                "Angle step must be positive, got " + std::to_string(options.angle_step));
        }
        return std::max(options.angle_step, min_step);
    }

    float step = (options.arc_step != 0.0f) ? options.arc_step : settings.chord_length;
    if (!isPositiveFinite(step)) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER,
                            "Arc step must be positive, got " + std::to_string(step));
    }

    // Average radius, floored so zero-size shapes don't divide by zero
    float rad = (xrad + yrad) / 2.0f;
    if (!(rad > settings.min_radius)) {
        rad = settings.min_radius;
    }

    float ratio = std::clamp(step / rad / 2.0f, -1.0f, 1.0f);
    float da = std::min(2.0f * std::asin(ratio), settings.max_angle_step);

    if (!(da >= min_step)) {
        da = min_step;
    }

    return da;
}

std::vector<Point> iterateEllipse(float x1, float y1, float x2, float y2,
                                  const EllipseOptions& options,
                                  const TessellationSettings& settings) {
    float xrad = std::abs((x2 - x1) / 2.0f);
    float yrad = std::abs((y2 - y1) / 2.0f);
    float x = (x1 + x2) / 2.0f;
    float y = (y1 + y2) / 2.0f;

    float da = ellipseAngleStep(xrad, yrad, options, settings);
    float advance = options.dashed ? 2.0f * da : da;

    std::vector<Point> points;
    points.reserve(static_cast<size_t>(Angles::FULL_TURN / advance) + 2);

    // Angles are derived from the index so the closing vertex doesn't depend on
    // accumulated rounding
    for (uint32_t i = 0;; ++i) {
        float a = static_cast<float>(i) * advance;
        if (a > Angles::FULL_TURN + Angles::WALK_EPSILON) {
            break;
        }
        points.emplace_back(x + std::cos(a) * xrad, y + std::sin(a) * yrad);
    }

    return points;
}

std::vector<Point> iterateNgon(float x, float y, float radius, int sides, float start_angle) {
    if (sides < Limits::MIN_POLYGON_SIDES) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER,
                            "Polygon needs at least 3 sides, got " + std::to_string(sides));
    }
    if (sides > static_cast<int>(Limits::MAX_CURVE_SEGMENTS)) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER,
                            "Polygon has too many sides: " + std::to_string(sides));
    }

    float da = Angles::FULL_TURN / static_cast<float>(sides);

    std::vector<Point> points;
    points.reserve(static_cast<size_t>(sides) + 1);

    for (int i = 0; i <= sides; ++i) {
        float a = start_angle + static_cast<float>(i) * da;
        points.emplace_back(x + std::cos(a) * radius, y + std::sin(a) * radius);
    }

    return points;
}

VertexSequence flatten(const std::vector<Point>& points) {
    VertexSequence vertices;
    vertices.reserve(points.size() * 2);

    for (const Point& point : points) {
        vertices.push_back(point.x);
        vertices.push_back(point.y);
    }

    return vertices;
}

DrawBatch ellipse(float x1, float y1, float x2, float y2,
                  const EllipseOptions& options, const TessellationSettings& settings) {
    // Fan pivots on the first rim vertex, not the center
    return {PrimitiveKind::TRIANGLE_FAN, flatten(iterateEllipse(x1, y1, x2, y2, options, settings))};
}

DrawBatch ellipseOutline(float x1, float y1, float x2, float y2,
                         const EllipseOptions& options, const TessellationSettings& settings) {
    return {PrimitiveKind::LINE_LOOP, flatten(iterateEllipse(x1, y1, x2, y2, options, settings))};
}

DrawBatch circle(float x, float y, float radius,
                 const EllipseOptions& options, const TessellationSettings& settings) {
    return ellipse(x - radius, y - radius, x + radius, y + radius, options, settings);
}

DrawBatch circleOutline(float x, float y, float radius,
                        const EllipseOptions& options, const TessellationSettings& settings) {
    return ellipseOutline(x - radius, y - radius, x + radius, y + radius, options, settings);
}

DrawBatch ngon(float x, float y, float radius, int sides, float start_angle) {
    return {PrimitiveKind::TRIANGLE_FAN, flatten(iterateNgon(x, y, radius, sides, start_angle))};
}

DrawBatch ngonOutline(float x, float y, float radius, int sides, float start_angle) {
    return {PrimitiveKind::LINE_LOOP, flatten(iterateNgon(x, y, radius, sides, start_angle))};
}

DrawBatch line(float x1, float y1, float x2, float y2, const ColorSequence& colors) {
    return {PrimitiveKind::LINES, {x1, y1, x2, y2}, colors};
}

DrawBatch lineLoop(const VertexSequence& vertices, const ColorSequence& colors) {
    return {PrimitiveKind::LINE_LOOP, vertices, colors};
}

DrawBatch rect(float x1, float y1, float x2, float y2) {
    return {PrimitiveKind::QUADS, {x1, y1, x1, y2, x2, y2, x2, y1}};
}

DrawBatch rectOutline(float x1, float y1, float x2, float y2) {
    if (x1 > x2) {
        std::swap(x1, x2);
    }
    if (y1 > y2) {
        std::swap(y1, y2);
    }

    return {PrimitiveKind::LINE_LOOP, {x1, y1, x1, y2, x2, y2, x2, y1}};
}

DrawBatch boxOutline(float x, float y, float width, float height) {
    return {PrimitiveKind::LINE_LOOP, {
        x, y,
        x + width, y,
        x + width, y + height,
        x, y + height
    }};
}

DrawBatch points(const VertexSequence& vertices, const ColorSequence& colors) {
    return {PrimitiveKind::POINTS, vertices, colors};
}

DrawBatch polygon(const VertexSequence& vertices, const ColorSequence& colors) {
    return {PrimitiveKind::POLYGON, vertices, colors};
}

DrawBatch quad(const VertexSequence& vertices, const ColorSequence& colors) {
    return {PrimitiveKind::QUADS, vertices, colors};
}

DrawBatch grid(float x, float y, float width, float height, float spacing) {
    if (!isPositiveFinite(spacing)) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER,
                            "Grid spacing must be positive, got " + std::to_string(spacing));
    }
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) || !std::isfinite(height)) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER, "Grid area must be finite");
    }

    float x_start = x;
    float x_end = x + width;
    float y_end = y + height;
    float x0 = snapDown(x, spacing);
    float y0 = snapDown(y, spacing);

    double columns = std::max(0.0, std::ceil((static_cast<double>(x_end) - x0) / spacing));
    double rows = std::max(0.0, std::ceil((static_cast<double>(y_end) - y0) / spacing));
    if (columns + rows > Limits::MAX_GRID_LINES) {
        throw GeometryError(ErrorCode::INVALID_PARAMETER,
                            "Grid needs too many lines at spacing " + std::to_string(spacing));
    }

    VertexSequence vertices;
    vertices.reserve(static_cast<size_t>(columns + rows) * 4);

    for (uint64_t i = 0;; ++i) {
        float lx = x0 + static_cast<float>(i) * spacing;
        if (!(lx < x_end)) {
            break;
        }
        vertices.insert(vertices.end(), {lx, y0, lx, y0 + height});
    }

    for (uint64_t i = 0;; ++i) {
        float ly = y0 + static_cast<float>(i) * spacing;
        if (!(ly < y_end)) {
            break;
        }
        vertices.insert(vertices.end(), {x_start, ly, x_start + width, ly});
    }

    return {PrimitiveKind::LINES, std::move(vertices)};
}

} // namespace ShapeTessellator

} // namespace Simdraw
