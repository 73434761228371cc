#pragma once

#include "interfaces.h"

// Fixed-ROI cropper: the same source rectangle is cut out of every frame.
class RoiCropper : public IFrameCropper {
public:
    cv::Rect compute_roi(const cv::Rect& roi,
                         int src_w, int src_h) const override;

    CroppedFrame crop(const RawFrame& frame,
                      const cv::Rect& roi) override;
};
