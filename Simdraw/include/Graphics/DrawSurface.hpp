// Simdraw/include/Graphics/DrawSurface.hpp
#pragma once

#include <Types.hpp>
#include <Geometry/DrawBatch.hpp>

namespace Simdraw {

/**
 * @brief Rendering collaborator that turns a batch into drawn output
 *
 * Passed explicitly to whatever draws; there is no ambient current surface.
 * Implementations return MALFORMED_DRAW_CALL for batches that fail
 * DrawBatch::validate() and draw nothing for them.
 */
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual ErrorCode submit(const DrawBatch& batch) = 0;
};

} // namespace Simdraw
