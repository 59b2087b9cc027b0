// Simdraw/include/Geometry/Transform.hpp
#pragma once

#include <Types.hpp>

namespace Simdraw {

/**
 * @brief Point and angle arithmetic used to place and orient objects
 *
 * All functions are pure. Angles are radians, positive is counter-clockwise.
 * Non-finite inputs propagate to non-finite outputs.
 */
namespace Transform {
    // Rotation about the origin
    Point rotate(const Point& point, float angle);

    // Rotation about an arbitrary pivot
    Point rotateAround(const Point& pivot, const Point& point, float angle);

    /**
     * @brief Bring an angle back into [0, 2*pi) by a single turn
     *
     * Only one revolution is corrected: 2*pi + 0.1 becomes 0.1, but 4*pi + 0.1
     * becomes 2*pi + 0.1 and -2*pi - 0.1 becomes -0.1.
     */
    float wrapAngle(float angle);

    // Distances; a missing endpoint is the origin
    float distanceSq(const Point& p1 = Point(), const Point& p2 = Point());
    float distance(const Point& p1 = Point(), const Point& p2 = Point());
}

} // namespace Simdraw
