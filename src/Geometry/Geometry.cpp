#include "Geometry/Geometry.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

// ─────────────────────────────────────────────────────────────────────────────
// Handle helpers
// ─────────────────────────────────────────────────────────────────────────────

bool is_corner(HandleId handle)
{
    switch (handle) {
        case HandleId::TopLeft:
        case HandleId::TopRight:
        case HandleId::BottomLeft:
        case HandleId::BottomRight:
            return true;
        default:
            return false;
    }
}

bool is_edge(HandleId handle)
{
    switch (handle) {
        case HandleId::Top:
        case HandleId::Right:
        case HandleId::Bottom:
        case HandleId::Left:
            return true;
        default:
            return false;
    }
}

Corner opposite_corner(HandleId corner_handle)
{
    switch (corner_handle) {
        case HandleId::TopLeft:     return Corner::BottomRight;
        case HandleId::TopRight:    return Corner::BottomLeft;
        case HandleId::BottomLeft:  return Corner::TopRight;
        case HandleId::BottomRight: return Corner::TopLeft;
        default:
            throw std::invalid_argument("opposite_corner: not a corner handle");
    }
}

cv::Point2d corner_point(const Rectangle& rect, Corner corner)
{
    switch (corner) {
        case Corner::TopLeft:     return { rect.x,       rect.y };
        case Corner::TopRight:    return { rect.right(), rect.y };
        case Corner::BottomLeft:  return { rect.x,       rect.bottom() };
        case Corner::BottomRight: return { rect.right(), rect.bottom() };
    }
    return { rect.x, rect.y };
}

static bool anchor_on_left(Corner c)
{
    return c == Corner::TopLeft || c == Corner::BottomLeft;
}

static bool anchor_on_top(Corner c)
{
    return c == Corner::TopLeft || c == Corner::TopRight;
}

// Square of the given side growing away from anchor point p.
static Rectangle square_from_anchor(cv::Point2d p, Corner anchor, double side,
                                    CoordinateSpace space)
{
    Rectangle r;
    r.width  = side;
    r.height = side;
    r.x      = anchor_on_left(anchor) ? p.x : p.x - side;
    r.y      = anchor_on_top(anchor)  ? p.y : p.y - side;
    r.space  = space;
    return r;
}

// ─────────────────────────────────────────────────────────────────────────────
// CoordinateTransform
// ─────────────────────────────────────────────────────────────────────────────

CoordinateTransform::CoordinateTransform(cv::Size source_size,
                                         cv::Size display_size,
                                         double   scale_x,
                                         double   scale_y,
                                         double   offset_x,
                                         double   offset_y)
    : source_size_(source_size)
    , display_size_(display_size)
    , scale_x_(scale_x)
    , scale_y_(scale_y)
    , offset_x_(offset_x)
    , offset_y_(offset_y)
{
    if (source_size.width <= 0 || source_size.height <= 0) {
        throw std::invalid_argument("CoordinateTransform: empty source size");
    }
    if (!(scale_x > 0.0) || !(scale_y > 0.0)) {
        throw std::invalid_argument("CoordinateTransform: scale must be positive");
    }
}

CoordinateTransform CoordinateTransform::fit(cv::Size source_size, cv::Size canvas_size)
{
    if (source_size.width <= 0 || source_size.height <= 0 ||
        canvas_size.width <= 0 || canvas_size.height <= 0) {
        throw std::invalid_argument("CoordinateTransform::fit: empty size");
    }

    const double scale = std::min(
        static_cast<double>(canvas_size.width)  / source_size.width,
        static_cast<double>(canvas_size.height) / source_size.height);

    const double offset_x = (canvas_size.width  - source_size.width  * scale) / 2.0;
    const double offset_y = (canvas_size.height - source_size.height * scale) / 2.0;

    return { source_size, canvas_size, scale, scale, offset_x, offset_y };
}

Rectangle CoordinateTransform::image_bounds() const
{
    return { offset_x_,
             offset_y_,
             source_size_.width  * scale_x_,
             source_size_.height * scale_y_,
             CoordinateSpace::Display };
}

Rectangle CoordinateTransform::source_bounds() const
{
    return { 0.0, 0.0,
             static_cast<double>(source_size_.width),
             static_cast<double>(source_size_.height),
             CoordinateSpace::Source };
}

// ─────────────────────────────────────────────────────────────────────────────
// Mapping
// ─────────────────────────────────────────────────────────────────────────────

Rectangle to_source(const CoordinateTransform& t, const Rectangle& display_rect)
{
    const double src_w = t.source_size().width;
    const double src_h = t.source_size().height;

    const double x0 = std::clamp((display_rect.x        - t.offset_x()) / t.scale_x(), 0.0, src_w);
    const double x1 = std::clamp((display_rect.right()  - t.offset_x()) / t.scale_x(), 0.0, src_w);
    const double y0 = std::clamp((display_rect.y        - t.offset_y()) / t.scale_y(), 0.0, src_h);
    const double y1 = std::clamp((display_rect.bottom() - t.offset_y()) / t.scale_y(), 0.0, src_h);

    return { x0, y0, x1 - x0, y1 - y0, CoordinateSpace::Source };
}

Rectangle to_display(const CoordinateTransform& t, const Rectangle& source_rect)
{
    return { source_rect.x * t.scale_x() + t.offset_x(),
             source_rect.y * t.scale_y() + t.offset_y(),
             source_rect.width  * t.scale_x(),
             source_rect.height * t.scale_y(),
             CoordinateSpace::Display };
}

// ─────────────────────────────────────────────────────────────────────────────
// Constraints
// ─────────────────────────────────────────────────────────────────────────────

Rectangle clamp_to_bounds(const Rectangle& rect, const Rectangle& bounds)
{
    Rectangle out = rect;

    if (out.width >= bounds.width) {
        out.width = bounds.width;
        out.x     = bounds.x;
    } else {
        out.x = std::clamp(out.x, bounds.x, bounds.right() - out.width);
    }

    if (out.height >= bounds.height) {
        out.height = bounds.height;
        out.y      = bounds.y;
    } else {
        out.y = std::clamp(out.y, bounds.y, bounds.bottom() - out.height);
    }

    return out;
}

Rectangle apply_square_lock(const Rectangle& rect, Corner anchor)
{
    const double side = std::max(rect.width, rect.height);
    return square_from_anchor(corner_point(rect, anchor), anchor, side, rect.space);
}

Rectangle fit_square_in_bounds(const Rectangle& square, Corner anchor, const Rectangle& bounds)
{
    const cv::Point2d p = corner_point(square, anchor);

    const double avail_x = anchor_on_left(anchor) ? bounds.right()  - p.x : p.x - bounds.x;
    const double avail_y = anchor_on_top(anchor)  ? bounds.bottom() - p.y : p.y - bounds.y;

    const double side = std::max(0.0, std::min({ square.width, avail_x, avail_y }));
    if (side == square.width) {
        return square;
    }
    return square_from_anchor(p, anchor, side, square.space);
}

// ─────────────────────────────────────────────────────────────────────────────
// Hit testing
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct HandleSite {
    HandleId    id;
    cv::Point2d centre;
};

// Chebyshev distance, since handles are drawn as squares.
double handle_distance(cv::Point2d a, cv::Point2d b)
{
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

HandleId nearest_within(const HandleSite* sites, int count,
                        cv::Point2d point, double radius)
{
    HandleId best      = HandleId::None;
    double   best_dist = radius;
    for (int i = 0; i < count; ++i) {
        const double d = handle_distance(sites[i].centre, point);
        if (d <= best_dist) {
            best      = sites[i].id;
            best_dist = d;
        }
    }
    return best;
}

} // namespace

HandleId hit_test_handle(const Rectangle& rect, cv::Point2d point, double handle_radius)
{
    // All handles collapse onto the same line or point; make the caller start
    // a fresh selection instead of resizing nothing.
    if (rect.empty()) {
        return HandleId::None;
    }

    const double cx = rect.x + rect.width  / 2.0;
    const double cy = rect.y + rect.height / 2.0;

    const HandleSite corners[] = {
        { HandleId::TopLeft,     { rect.x,       rect.y } },
        { HandleId::TopRight,    { rect.right(), rect.y } },
        { HandleId::BottomLeft,  { rect.x,       rect.bottom() } },
        { HandleId::BottomRight, { rect.right(), rect.bottom() } },
    };
    const HandleSite edges[] = {
        { HandleId::Top,    { cx,           rect.y } },
        { HandleId::Bottom, { cx,           rect.bottom() } },
        { HandleId::Left,   { rect.x,       cy } },
        { HandleId::Right,  { rect.right(), cy } },
    };

    HandleId hit = nearest_within(corners, 4, point, handle_radius);
    if (hit != HandleId::None) {
        return hit;
    }
    hit = nearest_within(edges, 4, point, handle_radius);
    if (hit != HandleId::None) {
        return hit;
    }

    if (point.x > rect.x && point.x < rect.right() &&
        point.y > rect.y && point.y < rect.bottom()) {
        return HandleId::Move;
    }
    return HandleId::None;
}

// ─────────────────────────────────────────────────────────────────────────────
// Small utilities
// ─────────────────────────────────────────────────────────────────────────────

Rectangle rect_from_points(cv::Point2d a, cv::Point2d b, CoordinateSpace space)
{
    return { std::min(a.x, b.x),
             std::min(a.y, b.y),
             std::abs(b.x - a.x),
             std::abs(b.y - a.y),
             space };
}

Corner anchor_corner(cv::Point2d anchor, cv::Point2d pointer)
{
    const bool left = pointer.x >= anchor.x;
    const bool top  = pointer.y >= anchor.y;
    if (left) {
        return top ? Corner::TopLeft : Corner::BottomLeft;
    }
    return top ? Corner::TopRight : Corner::BottomRight;
}

cv::Point2d clamp_point(cv::Point2d point, const Rectangle& bounds)
{
    return { std::clamp(point.x, bounds.x, bounds.right()),
             std::clamp(point.y, bounds.y, bounds.bottom()) };
}

cv::Rect to_pixel_rect(const Rectangle& source_rect, cv::Size source_size)
{
    const auto snap = [](double v, int hi) {
        return std::clamp(static_cast<int>(std::lround(v)), 0, hi);
    };

    const int x0 = snap(source_rect.x,        source_size.width);
    const int y0 = snap(source_rect.y,        source_size.height);
    const int x1 = snap(source_rect.right(),  source_size.width);
    const int y1 = snap(source_rect.bottom(), source_size.height);

    return { x0, y0, x1 - x0, y1 - y0 };
}
