#include <gtest/gtest.h>

#include "Preview/CropWindow.h"
#include "Preview/PreviewRenderer.h"

#include <atomic>

TEST(PreviewRendererTest, RenderBeforeFrameIsEmpty) {
    PreviewRenderer renderer;
    EXPECT_TRUE(renderer.render(SelectionSession{}).empty());
}

TEST(PreviewRendererTest, LetterboxesFrameIntoCanvas) {
    const cv::Mat frame(1080, 1920, CV_8UC3, cv::Scalar(200, 100, 50));
    const auto    t = CoordinateTransform::fit(frame.size(), { 1280, 1280 });

    PreviewStyle style;
    style.show_status = false;
    PreviewRenderer renderer(style);
    renderer.set_frame(frame, t);

    const cv::Mat canvas = renderer.render(SelectionSession{});
    ASSERT_EQ(canvas.size(), cv::Size(1280, 1280));
    EXPECT_EQ(canvas.type(), CV_8UC3);

    EXPECT_EQ(canvas.at<cv::Vec3b>(100, 640), cv::Vec3b(0, 0, 0));        // top bar
    EXPECT_EQ(canvas.at<cv::Vec3b>(640, 640), cv::Vec3b(200, 100, 50));   // image
    EXPECT_EQ(canvas.at<cv::Vec3b>(1200, 640), cv::Vec3b(0, 0, 0));       // bottom bar
}

TEST(PreviewRendererTest, DrawsOutlineAndHandles) {
    const cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(128, 128, 128));
    const auto    t = CoordinateTransform::fit(frame.size(), frame.size());

    PreviewStyle style;
    style.show_status = false;
    PreviewRenderer renderer(style);
    renderer.set_frame(frame, t);

    SelectionSession s;
    s.rect = { 100.0, 100.0, 200.0, 100.0, CoordinateSpace::Display };
    const cv::Mat canvas = renderer.render(s);

    // Corner handle centred on (100, 100), edge handle on the top midpoint.
    EXPECT_EQ(canvas.at<cv::Vec3b>(100, 100), cv::Vec3b(40, 40, 40));
    EXPECT_EQ(canvas.at<cv::Vec3b>(100, 200), cv::Vec3b(60, 60, 60));
    // Outline between handles.
    EXPECT_EQ(canvas.at<cv::Vec3b>(100, 150), cv::Vec3b(255, 255, 255));
    // Untouched inside.
    EXPECT_EQ(canvas.at<cv::Vec3b>(150, 150), cv::Vec3b(128, 128, 128));
}

TEST(PreviewRendererTest, RenderLeavesBaseUntouched) {
    const cv::Mat frame(240, 320, CV_8UC3, cv::Scalar(10, 20, 30));
    PreviewStyle  style;
    style.show_status = false;
    PreviewRenderer renderer(style);
    renderer.set_frame(frame, CoordinateTransform::fit(frame.size(), frame.size()));

    SelectionSession s;
    s.rect = { 20.0, 20.0, 100.0, 100.0, CoordinateSpace::Display };
    renderer.render(s);

    const cv::Mat clean = renderer.render(SelectionSession{});
    EXPECT_EQ(clean.at<cv::Vec3b>(20, 20), cv::Vec3b(10, 20, 30));
}

TEST(CropWindowTest, CanvasShrinksOnlyLargeFrames) {
    EXPECT_EQ(CropWindow::canvas_for({ 640, 480 }, { 1280, 720 }), cv::Size(640, 480));
    EXPECT_EQ(CropWindow::canvas_for({ 3840, 2160 }, { 1280, 720 }), cv::Size(1280, 720));
}

TEST(CropWindowTest, RaisedCancelFlagSkipsTheWindow) {
    const cv::Mat     frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
    std::atomic<bool> cancel{ true };

    // Returns before any HighGUI call, so no display is needed.
    CropWindow window;
    EXPECT_FALSE(window.run(frame, &cancel).has_value());
}
