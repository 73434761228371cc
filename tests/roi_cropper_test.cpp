#include <gtest/gtest.h>

#include "Cropping/RoiCropper.h"

TEST(RoiCropperTest, ComputeRoiClampsToFrame) {
    RoiCropper cropper;
    EXPECT_EQ(cropper.compute_roi({ 100, 100, 400, 300 }, 1920, 1080), cv::Rect(100, 100, 400, 300));
    EXPECT_EQ(cropper.compute_roi({ 1800, 1000, 400, 300 }, 1920, 1080), cv::Rect(1800, 1000, 120, 80));
}

TEST(RoiCropperTest, CropCopiesRegionAndKeepsTiming) {
    RawFrame frame;
    frame.data = cv::Mat(1080, 1920, CV_8UC3, cv::Scalar(0, 0, 0));
    frame.data.at<cv::Vec3b>(100, 100) = cv::Vec3b(9, 8, 7);
    frame.index  = 42;
    frame.pts_ns = 1'400'000'000;

    RoiCropper         cropper;
    const CroppedFrame out = cropper.crop(frame, { 100, 100, 400, 300 });

    EXPECT_EQ(out.data.size(), cv::Size(400, 300));
    EXPECT_EQ(out.data.at<cv::Vec3b>(0, 0), cv::Vec3b(9, 8, 7));
    EXPECT_EQ(out.index, 42u);
    EXPECT_EQ(out.pts_ns, 1'400'000'000);
    EXPECT_EQ(out.src_roi, cv::Rect(100, 100, 400, 300));

    // Owns its pixels.
    frame.data.setTo(cv::Scalar(255, 255, 255));
    EXPECT_EQ(out.data.at<cv::Vec3b>(0, 0), cv::Vec3b(9, 8, 7));
}

TEST(RoiCropperTest, CropRejectsRoiOutsideFrame) {
    RawFrame frame;
    frame.data = cv::Mat(480, 640, CV_8UC3);

    RoiCropper cropper;
    EXPECT_THROW(cropper.crop(frame, { 600, 0, 100, 100 }), std::out_of_range);
}
