#include "Preview/PreviewRenderer.h"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <sstream>

namespace {

cv::Point to_pixel(cv::Point2d p)
{
    return { static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)) };
}

} // namespace

PreviewRenderer::PreviewRenderer(PreviewStyle style)
    : style_(style)
{
}

void PreviewRenderer::set_frame(const cv::Mat& frame, const CoordinateTransform& transform)
{
    transform_ = transform;

    const cv::Size canvas_size = transform.display_size();
    base_ = cv::Mat(canvas_size, CV_8UC3, style_.background);

    if (frame.empty()) {
        return;
    }

    const Rectangle image = transform.image_bounds();
    cv::Rect dst(static_cast<int>(std::lround(image.x)),
                 static_cast<int>(std::lround(image.y)),
                 static_cast<int>(std::lround(image.width)),
                 static_cast<int>(std::lround(image.height)));
    dst &= cv::Rect(0, 0, canvas_size.width, canvas_size.height);
    if (dst.area() == 0) {
        return;
    }

    cv::Mat scaled;
    cv::resize(frame, scaled, dst.size(), 0, 0, cv::INTER_AREA);
    scaled.copyTo(base_(dst));
}

cv::Mat PreviewRenderer::render(const SelectionSession& session) const
{
    if (base_.empty()) {
        return {};
    }

    cv::Mat canvas = base_.clone();

    if (!session.rect.empty()) {
        const Rectangle& r = session.rect;
        cv::rectangle(canvas,
                      to_pixel({ r.x, r.y }),
                      to_pixel({ r.right(), r.bottom() }),
                      style_.outline,
                      style_.outline_thickness);
        draw_handles(canvas, r);
    }

    if (style_.show_status) {
        draw_status(canvas, session);
    }
    return canvas;
}

void PreviewRenderer::draw_handles(cv::Mat& canvas, const Rectangle& r) const
{
    const int half = style_.handle_size / 2;

    const auto handle = [&](cv::Point2d centre, const cv::Scalar& colour) {
        const cv::Point c = to_pixel(centre);
        cv::rectangle(canvas,
                      { c.x - half, c.y - half },
                      { c.x + half, c.y + half },
                      colour,
                      cv::FILLED);
    };

    const double cx = r.x + r.width  / 2.0;
    const double cy = r.y + r.height / 2.0;

    handle({ r.x,       r.y },        style_.corner_handle);
    handle({ r.right(), r.y },        style_.corner_handle);
    handle({ r.x,       r.bottom() }, style_.corner_handle);
    handle({ r.right(), r.bottom() }, style_.corner_handle);

    handle({ cx,        r.y },        style_.edge_handle);
    handle({ cx,        r.bottom() }, style_.edge_handle);
    handle({ r.x,       cy },         style_.edge_handle);
    handle({ r.right(), cy },         style_.edge_handle);
}

void PreviewRenderer::draw_status(cv::Mat& canvas, const SelectionSession& session) const
{
    std::ostringstream oss;
    if (session.rect.empty() || !transform_) {
        oss << "ROI: not selected";
    } else {
        const cv::Rect roi = to_pixel_rect(to_source(*transform_, session.rect),
                                           transform_->source_size());
        oss << "ROI: (" << roi.x << ", " << roi.y << ") "
            << roi.width << "x" << roi.height;
    }
    if (session.square_mode) {
        oss << "  [SQUARE]";
    }

    cv::putText(canvas, oss.str(), { 8, canvas.rows - 8 },
                cv::FONT_HERSHEY_PLAIN, 1.0, style_.status_text, 1, cv::LINE_AA);
}
