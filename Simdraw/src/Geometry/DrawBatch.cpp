// Simdraw/src/Geometry/DrawBatch.cpp
#include <Geometry/DrawBatch.hpp>

namespace Simdraw {

const char* primitiveKindToString(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::POINTS: return "POINTS";
        case PrimitiveKind::LINES: return "LINES";
        case PrimitiveKind::LINE_LOOP: return "LINE_LOOP";
        case PrimitiveKind::TRIANGLE_FAN: return "TRIANGLE_FAN";
        case PrimitiveKind::QUADS: return "QUADS";
        case PrimitiveKind::POLYGON: return "POLYGON";
        default: return "UNKNOWN";
    }
}

ErrorCode DrawBatch::validate() const {
    if (vertices.size() % 2 != 0) {
        return ErrorCode::MALFORMED_DRAW_CALL;
    }

    if (hasColors() && colors.size() != vertexCount() * 4) {
        return ErrorCode::MALFORMED_DRAW_CALL;
    }

    switch (kind) {
        case PrimitiveKind::LINES:
            if (vertexCount() % 2 != 0) {
                return ErrorCode::MALFORMED_DRAW_CALL;
            }
            break;
        case PrimitiveKind::QUADS:
            if (vertexCount() % 4 != 0) {
                return ErrorCode::MALFORMED_DRAW_CALL;
            }
            break;
        default:
            break;
    }

    return ErrorCode::SUCCESS;
}

} // namespace Simdraw
