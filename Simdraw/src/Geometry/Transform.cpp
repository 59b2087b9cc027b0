// Simdraw/src/Geometry/Transform.cpp
#include <Geometry/Transform.hpp>
#include <Constants.hpp>
#include <cmath>

namespace Simdraw {

namespace Transform {

Point rotate(const Point& point, float angle) {
    float c = std::cos(angle);
    float s = std::sin(angle);

    return {
        c * point.x - s * point.y,
        s * point.x + c * point.y
    };
}

Point rotateAround(const Point& pivot, const Point& point, float angle) {
    return rotate(point - pivot, angle) + pivot;
}

float wrapAngle(float angle) {
    if (angle >= Angles::FULL_TURN) {
        angle -= Angles::FULL_TURN;
    } else if (angle < 0.0f) {
        angle += Angles::FULL_TURN;
    }
    return angle;
}

float distanceSq(const Point& p1, const Point& p2) {
    float dx = p1.x - p2.x;
    float dy = p1.y - p2.y;
    return dx * dx + dy * dy;
}

float distance(const Point& p1, const Point& p2) {
    return std::sqrt(distanceSq(p1, p2));
}

} // namespace Transform

} // namespace Simdraw
