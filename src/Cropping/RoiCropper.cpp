#include "Cropping/RoiCropper.h"

#include <stdexcept>

cv::Rect RoiCropper::compute_roi(const cv::Rect& roi, int src_w, int src_h) const
{
    // Clamp so the rect stays inside [0, src_w) × [0, src_h).
    return roi & cv::Rect(0, 0, src_w, src_h);
}

CroppedFrame RoiCropper::crop(const RawFrame& frame, const cv::Rect& roi)
{
    const cv::Rect clamped = compute_roi(roi, frame.data.cols, frame.data.rows);

    // Output size is fixed for the whole video; a frame the ROI does not fit
    // cannot produce a valid output frame.
    if (clamped != roi) {
        throw std::out_of_range("ROI does not fit inside the frame");
    }

    CroppedFrame cf;
    cf.data    = frame.data(roi).clone();
    cf.src_roi = roi;
    cf.pts_ns  = frame.pts_ns;
    cf.index   = frame.index;
    return cf;
}
