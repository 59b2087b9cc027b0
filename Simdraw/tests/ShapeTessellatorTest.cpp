#include <gtest/gtest.h>
#include <Geometry/ShapeTessellator.hpp>
#include <Geometry/Transform.hpp>
#include <Constants.hpp>
#include <cmath>
#include <functional>
#include <limits>
#include <set>

using namespace Simdraw;

namespace {

ErrorCode codeOf(const std::function<void()>& call) {
    try {
        call();
    } catch (const GeometryError& e) {
        return e.code();
    }
    return ErrorCode::SUCCESS;
}

} // namespace

// Angle step

TEST(ShapeTessellatorTest, SmallCircleIsCappedAtMaxAngleStep) {
    float da = ShapeTessellator::ellipseAngleStep(10.0f, 10.0f);
    EXPECT_FLOAT_EQ(da, Angles::HALF_TURN / 16.0f);
}

TEST(ShapeTessellatorTest, LargeCircleUsesChordLength) {
    float da = ShapeTessellator::ellipseAngleStep(1000.0f, 1000.0f);
    EXPECT_NEAR(da, 2.0f * std::asin(32.0f / 1000.0f / 2.0f), 1e-6f);
}

TEST(ShapeTessellatorTest, ExplicitAngleStepWins) {
    EllipseOptions options;
    options.angle_step = 0.25f;
    EXPECT_FLOAT_EQ(ShapeTessellator::ellipseAngleStep(500.0f, 500.0f, options), 0.25f);
}

TEST(ShapeTessellatorTest, AngleStepNeverBelowSegmentCap) {
    EllipseOptions options;
    options.arc_step = 0.001f;
    float da = ShapeTessellator::ellipseAngleStep(10000.0f, 10000.0f, options);
    EXPECT_FLOAT_EQ(da, Angles::FULL_TURN / static_cast<float>(Limits::MAX_CURVE_SEGMENTS));
}

TEST(ShapeTessellatorTest, BothStepsIsConfigurationConflict) {
    const float values[] = {0.5f, -0.5f, 32.0f, 1e-6f, -100.0f};
    for (float angle : values) {
        for (float arc : values) {
            EllipseOptions options;
            options.angle_step = angle;
            options.arc_step = arc;
            EXPECT_EQ(codeOf([&] { ShapeTessellator::iterateEllipse(0, 0, 10, 10, options); }),
                      ErrorCode::CONFIGURATION_CONFLICT)
                << "angle " << angle << " arc " << arc;
        }
    }
}

TEST(ShapeTessellatorTest, ConflictErrorIsAGeometryError) {
    EllipseOptions options;
    options.angle_step = 0.1f;
    options.arc_step = 4.0f;
    EXPECT_THROW(ShapeTessellator::ellipse(0, 0, 10, 10, options), GeometryError);
}

TEST(ShapeTessellatorTest, NegativeOrNonFiniteStepIsInvalid) {
    EllipseOptions negative_angle;
    negative_angle.angle_step = -0.1f;
    EXPECT_EQ(codeOf([&] { ShapeTessellator::iterateEllipse(0, 0, 10, 10, negative_angle); }),
              ErrorCode::INVALID_PARAMETER);

    EllipseOptions nan_arc;
    nan_arc.arc_step = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(codeOf([&] { ShapeTessellator::iterateEllipse(0, 0, 10, 10, nan_arc); }),
              ErrorCode::INVALID_PARAMETER);
}

// Ellipse walk

TEST(ShapeTessellatorTest, CirclePointsLieOnRadius) {
    auto points = ShapeTessellator::iterateEllipse(-50.0f, 10.0f, 50.0f, 110.0f);
    ASSERT_FALSE(points.empty());

    for (const Point& p : points) {
        EXPECT_NEAR(Transform::distance(p, {0.0f, 60.0f}), 50.0f, 1e-3f);
    }
}

TEST(ShapeTessellatorTest, SmallCirclePointCount) {
    auto points = ShapeTessellator::iterateEllipse(-10.0f, -10.0f, 10.0f, 10.0f);
    // pi/16 steps from 0 to 2*pi inclusive
    EXPECT_EQ(points.size(), 33u);
    EXPECT_NEAR(points.front().x, 10.0f, 1e-5f);
    EXPECT_NEAR(points.front().y, 0.0f, 1e-5f);
    EXPECT_NEAR(points.back().x, points.front().x, 1e-4f);
    EXPECT_NEAR(points.back().y, points.front().y, 1e-4f);
}

TEST(ShapeTessellatorTest, DashedEmitsEveryOtherStep) {
    EllipseOptions options;
    options.dashed = true;
    auto points = ShapeTessellator::iterateEllipse(-10.0f, -10.0f, 10.0f, 10.0f, options);
    EXPECT_EQ(points.size(), 17u);
}

TEST(ShapeTessellatorTest, ExplicitQuarterTurnStep) {
    EllipseOptions options;
    options.angle_step = Angles::QUARTER_TURN;
    auto points = ShapeTessellator::iterateEllipse(-1.0f, -1.0f, 1.0f, 1.0f, options);

    ASSERT_EQ(points.size(), 5u);
    EXPECT_NEAR(points[1].x, 0.0f, 1e-5f);
    EXPECT_NEAR(points[1].y, 1.0f, 1e-5f);
    EXPECT_NEAR(points[2].x, -1.0f, 1e-5f);
}

TEST(ShapeTessellatorTest, ArcStepSetsChordLength) {
    EllipseOptions options;
    options.arc_step = 8.0f;
    auto points = ShapeTessellator::iterateEllipse(-100.0f, -100.0f, 100.0f, 100.0f, options);

    ASSERT_GT(points.size(), 2u);
    EXPECT_NEAR(Transform::distance(points[0], points[1]), 8.0f, 1e-3f);
}

TEST(ShapeTessellatorTest, LargeCircleChordsMatchDefault) {
    auto points = ShapeTessellator::iterateEllipse(-1000.0f, -1000.0f, 1000.0f, 1000.0f);

    EXPECT_EQ(points.size(), 197u);
    EXPECT_NEAR(Transform::distance(points[10], points[11]), 32.0f, 1e-2f);
}

TEST(ShapeTessellatorTest, EllipsePointsSatisfyEquation) {
    auto points = ShapeTessellator::iterateEllipse(0.0f, 0.0f, 40.0f, 20.0f);
    ASSERT_FALSE(points.empty());

    EXPECT_NEAR(points.front().x, 40.0f, 1e-4f);
    EXPECT_NEAR(points.front().y, 10.0f, 1e-4f);

    for (const Point& p : points) {
        float nx = (p.x - 20.0f) / 20.0f;
        float ny = (p.y - 10.0f) / 10.0f;
        EXPECT_NEAR(nx * nx + ny * ny, 1.0f, 1e-4f);
    }
}

TEST(ShapeTessellatorTest, CornersInAnyOrder) {
    auto a = ShapeTessellator::iterateEllipse(0.0f, 0.0f, 40.0f, 20.0f);
    auto b = ShapeTessellator::iterateEllipse(40.0f, 20.0f, 0.0f, 0.0f);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_FLOAT_EQ(a[i].x, b[i].x);
        EXPECT_FLOAT_EQ(a[i].y, b[i].y);
    }
}

TEST(ShapeTessellatorTest, ZeroSizeEllipseCollapsesToCenter) {
    auto points = ShapeTessellator::iterateEllipse(5.0f, 7.0f, 5.0f, 7.0f);

    EXPECT_EQ(points.size(), 33u);
    for (const Point& p : points) {
        EXPECT_FLOAT_EQ(p.x, 5.0f);
        EXPECT_FLOAT_EQ(p.y, 7.0f);
    }
}

TEST(ShapeTessellatorTest, CustomSettingsChangeDensity) {
    TessellationSettings settings;
    settings.max_angle_step = Angles::QUARTER_TURN;
    auto points = ShapeTessellator::iterateEllipse(-10.0f, -10.0f, 10.0f, 10.0f,
                                                   EllipseOptions(), settings);
    EXPECT_EQ(points.size(), 5u);
}

// Regular polygons

TEST(ShapeTessellatorTest, HexagonVertices) {
    auto points = ShapeTessellator::iterateNgon(0.0f, 0.0f, 10.0f, 6, 0.0f);

    ASSERT_EQ(points.size(), 7u);
    EXPECT_NEAR(points[0].x, 10.0f, 1e-5f);
    EXPECT_NEAR(points[0].y, 0.0f, 1e-5f);

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_NEAR(Transform::distance(points[i]), 10.0f, 1e-4f);

        // 60 degree spacing gives sides equal to the radius
        EXPECT_NEAR(Transform::distance(points[i], points[i + 1]), 10.0f, 1e-4f);

        float expected = static_cast<float>(i) * Angles::FULL_TURN / 6.0f;
        EXPECT_NEAR(points[i].x, 10.0f * std::cos(expected), 1e-4f);
        EXPECT_NEAR(points[i].y, 10.0f * std::sin(expected), 1e-4f);
    }

    EXPECT_NEAR(points[6].x, points[0].x, 1e-4f);
    EXPECT_NEAR(points[6].y, points[0].y, 1e-4f);
}

TEST(ShapeTessellatorTest, SquareAtQuarterOffset) {
    auto points = ShapeTessellator::iterateNgon(0.0f, 0.0f, 1.0f, 4, Angles::QUARTER_TURN / 2.0f);
    ASSERT_EQ(points.size(), 5u);

    const float h = std::sqrt(0.5f);
    const Point expected[] = {{h, h}, {-h, h}, {-h, -h}, {h, -h}};
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_NEAR(points[i].x, expected[i].x, 1e-3f);
        EXPECT_NEAR(points[i].y, expected[i].y, 1e-3f);
    }
}

TEST(ShapeTessellatorTest, NgonAndCircleAgreeOnRadius) {
    auto ngon = ShapeTessellator::iterateNgon(3.0f, -2.0f, 25.0f, 64, 0.0f);
    for (const Point& p : ngon) {
        EXPECT_NEAR(Transform::distance(p, {3.0f, -2.0f}), 25.0f, 1e-3f);
    }
}

TEST(ShapeTessellatorTest, NgonNeedsThreeSides) {
    EXPECT_EQ(codeOf([] { ShapeTessellator::iterateNgon(0, 0, 1, 2); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::iterateNgon(0, 0, 1, 0); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::iterateNgon(0, 0, 1, -5); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(ShapeTessellator::iterateNgon(0, 0, 1, 3).size(), 4u);
}

TEST(ShapeTessellatorTest, NgonRejectsTooManySides) {
    const int limit = static_cast<int>(Limits::MAX_CURVE_SEGMENTS);
    EXPECT_EQ(ShapeTessellator::iterateNgon(0, 0, 1, limit).size(), static_cast<size_t>(limit) + 1);
    EXPECT_EQ(codeOf([&] { ShapeTessellator::iterateNgon(0, 0, 1, limit + 1); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::iterateNgon(0, 0, 1, 2000000000); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::iterateNgon(0, 0, 1, std::numeric_limits<int>::max()); }),
              ErrorCode::INVALID_PARAMETER);
}

TEST(ShapeTessellatorTest, ZeroRadiusNgonCollapses) {
    auto points = ShapeTessellator::iterateNgon(4.0f, 4.0f, 0.0f, 5);
    ASSERT_EQ(points.size(), 6u);
    for (const Point& p : points) {
        EXPECT_FLOAT_EQ(p.x, 4.0f);
        EXPECT_FLOAT_EQ(p.y, 4.0f);
    }
}

// Batches

TEST(ShapeTessellatorTest, FilledShapesAreFans) {
    DrawBatch circle = ShapeTessellator::circle(0.0f, 0.0f, 10.0f);
    EXPECT_EQ(circle.kind, PrimitiveKind::TRIANGLE_FAN);
    EXPECT_EQ(circle.vertexCount(), 33u);

    // The fan pivots on the first rim vertex, not the center
    EXPECT_NEAR(circle.vertices[0], 10.0f, 1e-5f);
    EXPECT_NEAR(circle.vertices[1], 0.0f, 1e-5f);

    DrawBatch hexagon = ShapeTessellator::ngon(0.0f, 0.0f, 10.0f, 6);
    EXPECT_EQ(hexagon.kind, PrimitiveKind::TRIANGLE_FAN);
    EXPECT_EQ(hexagon.vertexCount(), 7u);
}

TEST(ShapeTessellatorTest, OutlinesAreLineLoops) {
    EXPECT_EQ(ShapeTessellator::circleOutline(0, 0, 10).kind, PrimitiveKind::LINE_LOOP);
    EXPECT_EQ(ShapeTessellator::ellipseOutline(0, 0, 20, 10).kind, PrimitiveKind::LINE_LOOP);
    EXPECT_EQ(ShapeTessellator::ngonOutline(0, 0, 10, 5).kind, PrimitiveKind::LINE_LOOP);
}

TEST(ShapeTessellatorTest, FlattenInterleavesCoordinates) {
    VertexSequence flat = ShapeTessellator::flatten({{1.0f, 2.0f}, {3.0f, 4.0f}});
    EXPECT_EQ(flat, (VertexSequence{1.0f, 2.0f, 3.0f, 4.0f}));
}

TEST(ShapeTessellatorTest, RectIsSingleQuad) {
    DrawBatch rect = ShapeTessellator::rect(0.0f, 0.0f, 10.0f, 5.0f);
    EXPECT_EQ(rect.kind, PrimitiveKind::QUADS);
    EXPECT_EQ(rect.vertices, (VertexSequence{0, 0, 0, 5, 10, 5, 10, 0}));
    EXPECT_EQ(rect.validate(), ErrorCode::SUCCESS);
}

TEST(ShapeTessellatorTest, RectOutlineNormalizesCorners) {
    DrawBatch outline = ShapeTessellator::rectOutline(10.0f, 5.0f, 0.0f, 0.0f);
    EXPECT_EQ(outline.kind, PrimitiveKind::LINE_LOOP);
    EXPECT_EQ(outline.vertices, (VertexSequence{0, 0, 0, 5, 10, 5, 10, 0}));
}

TEST(ShapeTessellatorTest, BoxOutlineFromPositionAndSize) {
    DrawBatch box = ShapeTessellator::boxOutline(1.0f, 2.0f, 3.0f, 4.0f);
    EXPECT_EQ(box.kind, PrimitiveKind::LINE_LOOP);
    EXPECT_EQ(box.vertices, (VertexSequence{1, 2, 4, 2, 4, 6, 1, 6}));
}

TEST(ShapeTessellatorTest, LineKeepsColors) {
    ColorSequence colors = Color::Red.fill(2);
    DrawBatch line = ShapeTessellator::line(0.0f, 0.0f, 5.0f, 5.0f, colors);
    EXPECT_EQ(line.kind, PrimitiveKind::LINES);
    EXPECT_EQ(line.colors, colors);
    EXPECT_EQ(line.validate(), ErrorCode::SUCCESS);
}

// Grid

TEST(ShapeTessellatorTest, GridSnapsBelowOrigin) {
    DrawBatch grid = ShapeTessellator::grid(5.0f, 5.0f, 100.0f, 100.0f, 50.0f);
    EXPECT_EQ(grid.kind, PrimitiveKind::LINES);
    ASSERT_EQ(grid.vertexCount(), 12u);

    std::set<float> vertical;
    std::set<float> horizontal;
    for (size_t i = 0; i < grid.vertexCount(); i += 2) {
        Point a = grid.vertex(i);
        Point b = grid.vertex(i + 1);
        if (a.x == b.x) {
            vertical.insert(a.x);
        } else {
            EXPECT_EQ(a.y, b.y);
            horizontal.insert(a.y);
        }
    }

    EXPECT_EQ(vertical, (std::set<float>{0.0f, 50.0f, 100.0f}));
    EXPECT_EQ(horizontal, (std::set<float>{0.0f, 50.0f, 100.0f}));
}

TEST(ShapeTessellatorTest, GridLineExtents) {
    DrawBatch grid = ShapeTessellator::grid(5.0f, 5.0f, 100.0f, 100.0f, 50.0f);
    ASSERT_EQ(grid.vertexCount(), 12u);

    // First vertical line starts at the snapped y and spans the height
    EXPECT_EQ(grid.vertex(0), Point(0.0f, 0.0f));
    EXPECT_EQ(grid.vertex(1), Point(0.0f, 100.0f));

    // First horizontal line starts at the requested x and spans the width
    EXPECT_EQ(grid.vertex(6), Point(5.0f, 0.0f));
    EXPECT_EQ(grid.vertex(7), Point(105.0f, 0.0f));
}

TEST(ShapeTessellatorTest, GridRejectsExcessiveLineCount) {
    EXPECT_EQ(codeOf([] { ShapeTessellator::grid(0, 0, 1e6f, 1e6f, 1e-3f); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::grid(0, 0, 1280, 720, 1e-4f); }), ErrorCode::INVALID_PARAMETER);

    // A dense grid under the limit is still produced
    DrawBatch dense = ShapeTessellator::grid(0, 0, 1280, 720, 1.0f);
    EXPECT_EQ(dense.vertexCount(), 2u * (1280u + 720u));
}

TEST(ShapeTessellatorTest, GridSnapsNegativeOriginDownward) {
    DrawBatch grid = ShapeTessellator::grid(-5.0f, -5.0f, 100.0f, 100.0f, 50.0f);

    std::set<float> vertical;
    for (size_t i = 0; i < grid.vertexCount(); i += 2) {
        Point a = grid.vertex(i);
        if (a.x == grid.vertex(i + 1).x) {
            vertical.insert(a.x);
        }
    }
    EXPECT_EQ(vertical, (std::set<float>{-50.0f, 0.0f, 50.0f}));
}

TEST(ShapeTessellatorTest, GridLinesStayPutWhilePanning) {
    DrawBatch a = ShapeTessellator::grid(10.0f, 0.0f, 200.0f, 100.0f, 50.0f);
    DrawBatch b = ShapeTessellator::grid(30.0f, 0.0f, 200.0f, 100.0f, 50.0f);
    EXPECT_EQ(a.vertex(0).x, b.vertex(0).x);
}

TEST(ShapeTessellatorTest, GridRejectsBadSpacing) {
    EXPECT_EQ(codeOf([] { ShapeTessellator::grid(0, 0, 100, 100, 0.0f); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] { ShapeTessellator::grid(0, 0, 100, 100, -10.0f); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf([] {
        ShapeTessellator::grid(std::numeric_limits<float>::infinity(), 0, 100, 100, 10.0f);
    }), ErrorCode::INVALID_PARAMETER);
}

TEST(ShapeTessellatorTest, EmptyGridArea) {
    DrawBatch grid = ShapeTessellator::grid(0.0f, 0.0f, 0.0f, 0.0f, 50.0f);
    EXPECT_TRUE(grid.isEmpty());
    EXPECT_EQ(grid.validate(), ErrorCode::SUCCESS);
}
