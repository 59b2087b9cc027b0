// Simdraw/src/Graphics/PrimitiveRenderer.cpp
#include <Graphics/PrimitiveRenderer.hpp>
#include <Utils/Logger.hpp>

namespace Simdraw {

PrimitiveRenderer::PrimitiveRenderer(DrawSurface& surface, const TessellationSettings& settings)
    : m_surface(surface), m_settings(settings) {
    Logger::debug("PrimitiveRenderer created");
}

ErrorCode PrimitiveRenderer::drawPoints(const VertexSequence& vertices, const ColorSequence& colors) {
    DrawBatch batch = ShapeTessellator::points(vertices, colors);
    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.points_rendered += batch.vertexCount();
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawLine(const Point& start, const Point& end, const ColorSequence& colors) {
    ErrorCode result = submit(ShapeTessellator::line(start.x, start.y, end.x, end.y, colors));
    if (result == ErrorCode::SUCCESS) {
        m_stats.lines_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawLineLoop(const VertexSequence& vertices, const ColorSequence& colors) {
    DrawBatch batch = ShapeTessellator::lineLoop(vertices, colors);
    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.lines_rendered += batch.vertexCount();
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawRectangle(const Point& corner1, const Point& corner2, bool filled) {
    DrawBatch batch = filled
        ? ShapeTessellator::rect(corner1.x, corner1.y, corner2.x, corner2.y)
        : ShapeTessellator::rectOutline(corner1.x, corner1.y, corner2.x, corner2.y);

    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawBox(const Point& position, float width, float height) {
    ErrorCode result = submit(ShapeTessellator::boxOutline(position.x, position.y, width, height));
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawEllipse(const Point& corner1, const Point& corner2, bool filled,
                                         const EllipseOptions& options) {
    DrawBatch batch = filled
        ? ShapeTessellator::ellipse(corner1.x, corner1.y, corner2.x, corner2.y, options, m_settings)
        : ShapeTessellator::ellipseOutline(corner1.x, corner1.y, corner2.x, corner2.y, options, m_settings);

    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawCircle(const Point& center, float radius, bool filled,
                                        const EllipseOptions& options) {
    return drawEllipse({center.x - radius, center.y - radius},
                       {center.x + radius, center.y + radius}, filled, options);
}

ErrorCode PrimitiveRenderer::drawNgon(const Point& center, float radius, int sides,
                                      float start_angle, bool filled) {
    DrawBatch batch = filled
        ? ShapeTessellator::ngon(center.x, center.y, radius, sides, start_angle)
        : ShapeTessellator::ngonOutline(center.x, center.y, radius, sides, start_angle);

    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawPolygon(const VertexSequence& vertices, const ColorSequence& colors) {
    ErrorCode result = submit(ShapeTessellator::polygon(vertices, colors));
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawQuad(const VertexSequence& vertices, const ColorSequence& colors) {
    ErrorCode result = submit(ShapeTessellator::quad(vertices, colors));
    if (result == ErrorCode::SUCCESS) {
        m_stats.shapes_rendered++;
    }
    return result;
}

ErrorCode PrimitiveRenderer::drawGrid(const Point& origin, float width, float height) {
    DrawBatch batch = ShapeTessellator::grid(origin.x, origin.y, width, height, m_settings.grid_spacing);
    ErrorCode result = submit(batch);
    if (result == ErrorCode::SUCCESS) {
        m_stats.lines_rendered += batch.vertexCount() / 2;
    }
    return result;
}

ErrorCode PrimitiveRenderer::submit(const DrawBatch& batch) {
    ErrorCode result = batch.validate();

    if (result == ErrorCode::SUCCESS) {
        result = m_surface.submit(batch);
    }

    if (result != ErrorCode::SUCCESS) {
        Logger::error("Rejected {} batch of {} vertices with {} color components: {}",
                      primitiveKindToString(batch.kind), batch.vertices.size() / 2,
                      batch.colors.size(), errorCodeToString(result));
        m_stats.batches_rejected++;
        return result;
    }

    m_stats.batches_submitted++;
    m_stats.vertices_submitted += batch.vertexCount();
    return result;
}

void PrimitiveRenderer::resetStats() {
    m_stats = Stats{};
    Logger::debug("PrimitiveRenderer statistics reset");
}

} // namespace Simdraw
