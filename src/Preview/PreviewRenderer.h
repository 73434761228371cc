#pragma once

#include "Geometry/Geometry.h"
#include "Selection/SelectionStateMachine.h"

#include <opencv2/core.hpp>

#include <optional>

// ─────────────────────────────────────────────────────────────────────────────
// PreviewRenderer
//
// Letterboxes one sampled video frame into the preview canvas and draws the
// current selection on top: thin outline, dark corner handles, slightly
// lighter edge handles, and a one-line status readout in source pixels.
// ─────────────────────────────────────────────────────────────────────────────

struct PreviewStyle {
    cv::Scalar background       { 0, 0, 0 };
    cv::Scalar outline          { 255, 255, 255 };
    int        outline_thickness = 1;
    int        handle_size       = 6;
    cv::Scalar corner_handle    { 40, 40, 40 };
    cv::Scalar edge_handle      { 60, 60, 60 };
    cv::Scalar status_text      { 51, 255, 51 };
    bool       show_status       = true;
};

class PreviewRenderer {
public:
    explicit PreviewRenderer(PreviewStyle style = {});

    // Scale the frame into the canvas described by transform. Must be called
    // again whenever the transform is rebuilt.
    void    set_frame(const cv::Mat& frame, const CoordinateTransform& transform);

    // Fresh canvas with the selection overlay. Empty Mat before set_frame().
    cv::Mat render(const SelectionSession& session) const;

    const PreviewStyle& style() const { return style_; }

private:
    PreviewStyle                       style_;
    cv::Mat                            base_;
    std::optional<CoordinateTransform> transform_;

    void draw_handles(cv::Mat& canvas, const Rectangle& rect) const;
    void draw_status(cv::Mat& canvas, const SelectionSession& session) const;
};
