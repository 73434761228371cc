#pragma once

#include "interfaces.h"

#include <opencv2/core.hpp>

// ─────────────────────────────────────────────────────────────────────────────
// Geometry engine
//
// Pure coordinate math shared by the selection state machine, the preview
// renderer and the crop window. Nothing in here holds state or touches I/O.
// ─────────────────────────────────────────────────────────────────────────────

// Resize handles of a selection, plus the body (Move) and "nothing hit".
enum class HandleId {
    None,
    TopLeft,
    Top,
    TopRight,
    Right,
    BottomRight,
    Bottom,
    BottomLeft,
    Left,
    Move,
};

enum class Corner {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

bool is_corner(HandleId handle);
bool is_edge(HandleId handle);

// Corner diagonally across from the given corner handle.
Corner opposite_corner(HandleId corner_handle);

cv::Point2d corner_point(const Rectangle& rect, Corner corner);

// ─────────────────────────────────────────────────────────────────────────────
// CoordinateTransform
//
// display = source * scale + offset
//
// Immutable: when the canvas or the source resolution changes, build a new one.
// ─────────────────────────────────────────────────────────────────────────────

class CoordinateTransform {
public:
    CoordinateTransform(cv::Size source_size,
                        cv::Size display_size,
                        double   scale_x,
                        double   scale_y,
                        double   offset_x,
                        double   offset_y);

    // Uniform scale that fits the whole source inside the canvas, centred,
    // with letterbox bars on the short axis.
    static CoordinateTransform fit(cv::Size source_size, cv::Size canvas_size);

    cv::Size source_size()  const { return source_size_; }
    cv::Size display_size() const { return display_size_; }
    double   scale_x()      const { return scale_x_; }
    double   scale_y()      const { return scale_y_; }
    double   offset_x()     const { return offset_x_; }
    double   offset_y()     const { return offset_y_; }

    // Display-space rectangle covered by the video image (canvas minus bars).
    Rectangle image_bounds() const;

    // Whole source frame, in source space.
    Rectangle source_bounds() const;

private:
    cv::Size source_size_;
    cv::Size display_size_;
    double   scale_x_;
    double   scale_y_;
    double   offset_x_;
    double   offset_y_;
};

// Display → source. Edges are clamped to [0, src_w] × [0, src_h].
Rectangle to_source(const CoordinateTransform& transform, const Rectangle& display_rect);

// Source → display. Used for rendering.
Rectangle to_display(const CoordinateTransform& transform, const Rectangle& source_rect);

// Translate rect so it lies fully inside bounds. A dimension larger than the
// bounds is shrunk to exactly the bounds. Idempotent.
Rectangle clamp_to_bounds(const Rectangle& rect, const Rectangle& bounds);

// width = height = max(width, height), keeping the anchor corner where it is.
// The anchor decides which way the square grows.
Rectangle apply_square_lock(const Rectangle& rect, Corner anchor);

// Shrink a square (keeping its anchor corner) until it fits inside bounds.
// Rectangles already inside bounds come back unchanged.
Rectangle fit_square_in_bounds(const Rectangle& square, Corner anchor, const Rectangle& bounds);

// Which handle of rect lies under point. Handles are squares of half-size
// handle_radius centred on the corners and edge midpoints; corners win over
// edges. Inside the body but off every handle is Move. A zero-area rect never
// reports a handle.
HandleId hit_test_handle(const Rectangle& rect, cv::Point2d point, double handle_radius);

// Normalized rectangle spanned by two points.
Rectangle rect_from_points(cv::Point2d a, cv::Point2d b, CoordinateSpace space);

// Corner of the rectangle spanned by anchor/pointer that the anchor sits on.
Corner anchor_corner(cv::Point2d anchor, cv::Point2d pointer);

// Clamp a point into bounds.
cv::Point2d clamp_point(cv::Point2d point, const Rectangle& bounds);

// Round a source rectangle to whole pixels that fit a frame of source_size.
cv::Rect to_pixel_rect(const Rectangle& source_rect, cv::Size source_size);
