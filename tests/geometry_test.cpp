#include <gtest/gtest.h>

#include "Geometry/Geometry.h"

namespace {

Rectangle display_rect(double x, double y, double w, double h)
{
    return { x, y, w, h, CoordinateSpace::Display };
}

} // namespace

TEST(CoordinateTransformTest, FitLetterboxesTallCanvas) {
    const auto t = CoordinateTransform::fit({ 1920, 1080 }, { 1280, 1280 });

    EXPECT_DOUBLE_EQ(t.scale_x(), 1280.0 / 1920.0);
    EXPECT_DOUBLE_EQ(t.scale_y(), t.scale_x());
    EXPECT_NEAR(t.offset_x(), 0.0, 1e-9);
    EXPECT_NEAR(t.offset_y(), 280.0, 1e-9);

    const Rectangle image = t.image_bounds();
    EXPECT_NEAR(image.width, 1280.0, 1e-9);
    EXPECT_NEAR(image.height, 720.0, 1e-9);
}

TEST(CoordinateTransformTest, RejectsEmptySizesAndBadScale) {
    EXPECT_THROW(CoordinateTransform::fit({ 0, 1080 }, { 640, 480 }), std::invalid_argument);
    EXPECT_THROW(CoordinateTransform::fit({ 1920, 1080 }, { 640, 0 }), std::invalid_argument);
    EXPECT_THROW(CoordinateTransform({ 640, 480 }, { 640, 480 }, 0.0, 1.0, 0.0, 0.0),
                 std::invalid_argument);
}

TEST(CoordinateMappingTest, SourceDisplayRoundTrip) {
    const auto t = CoordinateTransform::fit({ 1920, 1080 }, { 1280, 720 });

    const Rectangle d   = display_rect(128.0, 72.0, 640.0, 360.0);
    const Rectangle src = to_source(t, d);
    EXPECT_EQ(src.space, CoordinateSpace::Source);
    EXPECT_NEAR(src.x, 192.0, 1e-9);
    EXPECT_NEAR(src.y, 108.0, 1e-9);
    EXPECT_NEAR(src.width, 960.0, 1e-9);
    EXPECT_NEAR(src.height, 540.0, 1e-9);

    const Rectangle back = to_display(t, src);
    EXPECT_NEAR(back.x, d.x, 1e-9);
    EXPECT_NEAR(back.y, d.y, 1e-9);
    EXPECT_NEAR(back.width, d.width, 1e-9);
    EXPECT_NEAR(back.height, d.height, 1e-9);
}

TEST(CoordinateMappingTest, ToSourceTrimsToFrame) {
    const auto t = CoordinateTransform::fit({ 640, 360 }, { 640, 480 });  // 60 px bars

    // Reaches into the top bar and past the right edge.
    const Rectangle src = to_source(t, display_rect(600.0, 20.0, 100.0, 100.0));
    EXPECT_DOUBLE_EQ(src.x, 600.0);
    EXPECT_DOUBLE_EQ(src.y, 0.0);
    EXPECT_DOUBLE_EQ(src.width, 40.0);
    EXPECT_DOUBLE_EQ(src.height, 60.0);
}

TEST(ClampToBoundsTest, TranslatesInsideAndIsIdempotent) {
    const Rectangle bounds = display_rect(0.0, 0.0, 640.0, 480.0);

    const Rectangle once  = clamp_to_bounds(display_rect(600.0, -30.0, 100.0, 50.0), bounds);
    const Rectangle twice = clamp_to_bounds(once, bounds);

    EXPECT_DOUBLE_EQ(once.x, 540.0);
    EXPECT_DOUBLE_EQ(once.y, 0.0);
    EXPECT_DOUBLE_EQ(once.width, 100.0);
    EXPECT_DOUBLE_EQ(once.height, 50.0);

    EXPECT_DOUBLE_EQ(twice.x, once.x);
    EXPECT_DOUBLE_EQ(twice.y, once.y);
    EXPECT_DOUBLE_EQ(twice.width, once.width);
    EXPECT_DOUBLE_EQ(twice.height, once.height);
}

TEST(ClampToBoundsTest, OversizedRectShrinksToBounds) {
    const Rectangle bounds = display_rect(10.0, 20.0, 300.0, 200.0);
    const Rectangle r      = clamp_to_bounds(display_rect(-50.0, 0.0, 500.0, 100.0), bounds);

    EXPECT_DOUBLE_EQ(r.x, 10.0);
    EXPECT_DOUBLE_EQ(r.width, 300.0);
    EXPECT_DOUBLE_EQ(r.y, 20.0);
    EXPECT_DOUBLE_EQ(r.height, 100.0);
}

TEST(SquareLockTest, GrowsAwayFromAnchor) {
    const Rectangle tl = apply_square_lock(display_rect(0.0, 0.0, 300.0, 120.0), Corner::TopLeft);
    EXPECT_DOUBLE_EQ(tl.x, 0.0);
    EXPECT_DOUBLE_EQ(tl.y, 0.0);
    EXPECT_DOUBLE_EQ(tl.width, 300.0);
    EXPECT_DOUBLE_EQ(tl.height, 300.0);

    // Anchored bottom-right: the square extends up and to the left.
    const Rectangle br = apply_square_lock(display_rect(100.0, 400.0, 50.0, 80.0),
                                           Corner::BottomRight);
    EXPECT_DOUBLE_EQ(br.right(), 150.0);
    EXPECT_DOUBLE_EQ(br.bottom(), 480.0);
    EXPECT_DOUBLE_EQ(br.width, 80.0);
    EXPECT_DOUBLE_EQ(br.height, 80.0);
}

TEST(SquareLockTest, FitSquareKeepsAnchorAndShape) {
    const Rectangle bounds = display_rect(0.0, 0.0, 640.0, 480.0);
    const Rectangle fitted = fit_square_in_bounds(display_rect(400.0, 100.0, 300.0, 300.0),
                                                  Corner::TopLeft, bounds);
    EXPECT_DOUBLE_EQ(fitted.x, 400.0);
    EXPECT_DOUBLE_EQ(fitted.y, 100.0);
    EXPECT_DOUBLE_EQ(fitted.width, 240.0);
    EXPECT_DOUBLE_EQ(fitted.height, 240.0);
}

TEST(HitTestTest, CornerWinsOverEdgeOnSmallRect) {
    // 12 px wide: the top edge midpoint is 6 px from each top corner.
    const Rectangle r = display_rect(100.0, 100.0, 12.0, 12.0);
    EXPECT_EQ(hit_test_handle(r, { 104.0, 100.0 }, 10.0), HandleId::TopLeft);
    EXPECT_EQ(hit_test_handle(r, { 109.0, 101.0 }, 10.0), HandleId::TopRight);
}

TEST(HitTestTest, EdgesBodyAndMiss) {
    const Rectangle r = display_rect(100.0, 100.0, 200.0, 100.0);

    EXPECT_EQ(hit_test_handle(r, { 200.0, 95.0 },  10.0), HandleId::Top);
    EXPECT_EQ(hit_test_handle(r, { 305.0, 150.0 }, 10.0), HandleId::Right);
    EXPECT_EQ(hit_test_handle(r, { 200.0, 150.0 }, 10.0), HandleId::Move);
    EXPECT_EQ(hit_test_handle(r, { 50.0,  50.0 },  10.0), HandleId::None);
    EXPECT_EQ(hit_test_handle(r, { 88.0,  88.0 },  10.0), HandleId::None);
    EXPECT_EQ(hit_test_handle(r, { 91.0,  91.0 },  10.0), HandleId::TopLeft);
}

TEST(HitTestTest, ZeroAreaRectNeverHits) {
    const Rectangle point_rect = display_rect(50.0, 50.0, 0.0, 0.0);
    EXPECT_EQ(hit_test_handle(point_rect, { 50.0, 50.0 }, 10.0), HandleId::None);

    const Rectangle line_rect = display_rect(50.0, 50.0, 100.0, 0.0);
    EXPECT_EQ(hit_test_handle(line_rect, { 100.0, 50.0 }, 10.0), HandleId::None);
}

TEST(HandleHelpersTest, OppositeCorner) {
    EXPECT_EQ(opposite_corner(HandleId::TopLeft), Corner::BottomRight);
    EXPECT_EQ(opposite_corner(HandleId::BottomLeft), Corner::TopRight);
    EXPECT_THROW(opposite_corner(HandleId::Top), std::invalid_argument);
    EXPECT_TRUE(is_corner(HandleId::TopRight));
    EXPECT_FALSE(is_corner(HandleId::Move));
    EXPECT_TRUE(is_edge(HandleId::Left));
}

TEST(PixelRectTest, RoundsAndClampsToFrame) {
    const Rectangle src{ 10.4, 19.6, 100.2, 50.5, CoordinateSpace::Source };
    EXPECT_EQ(to_pixel_rect(src, { 1920, 1080 }), cv::Rect(10, 20, 101, 50));

    const Rectangle past{ 1900.0, 1000.0, 40.0, 100.0, CoordinateSpace::Source };
    EXPECT_EQ(to_pixel_rect(past, { 1920, 1080 }), cv::Rect(1900, 1000, 20, 80));
}
