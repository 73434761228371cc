#include <gtest/gtest.h>

#include "VideoOutputStream/GstreamerFileOutput.h"

#include <string>

namespace {

VideoSinkConfig sink_config(int width, int height, const std::string& encoder = "x264")
{
    VideoSinkConfig config;
    config.path    = "/tmp/out.mp4";
    config.encoder = encoder;
    config.width   = width;
    config.height  = height;
    config.fps_num = 30000;
    config.fps_den = 1001;
    return config;
}

bool appears_before(const std::string& text, const std::string& first, const std::string& second)
{
    const auto a = text.find(first);
    const auto b = text.find(second);
    return a != std::string::npos && b != std::string::npos && a < b;
}

} // namespace

TEST(GstreamerFileOutputTest, OddSizeIsEncodedFourFourFour) {
    const std::string launch = GstreamerFileOutput::build_pipeline(sink_config(401, 301));

    EXPECT_NE(launch.find("width=401,height=301"), std::string::npos);
    EXPECT_NE(launch.find("framerate=30000/1001"), std::string::npos);
    EXPECT_TRUE(appears_before(launch, "videoconvert", "video/x-raw,format=Y444"));
    EXPECT_TRUE(appears_before(launch, "video/x-raw,format=Y444", "x264enc"));
    EXPECT_TRUE(appears_before(launch, "h264parse", "mp4mux"));
}

TEST(GstreamerFileOutputTest, HevcAlsoGetsFourFourFour) {
    const std::string launch = GstreamerFileOutput::build_pipeline(sink_config(99, 57, "h265"));

    EXPECT_TRUE(appears_before(launch, "video/x-raw,format=Y444", "x265enc"));
    EXPECT_TRUE(appears_before(launch, "h265parse", "mp4mux"));
    EXPECT_EQ(launch.find("x264enc"), std::string::npos);
}

TEST(GstreamerFileOutputTest, AppsrcNeverBlocksTheCaller) {
    const std::string launch = GstreamerFileOutput::build_pipeline(sink_config(400, 300));

    EXPECT_NE(launch.find("block=false"), std::string::npos);
    EXPECT_EQ(launch.find("block=true"), std::string::npos);
}

TEST(GstreamerFileOutputTest, OutputIsAlwaysMp4) {
    VideoSinkConfig config = sink_config(64, 64);
    config.path            = "/tmp/out.mkv";

    const std::string launch = GstreamerFileOutput::build_pipeline(config);
    EXPECT_NE(launch.find("mp4mux"), std::string::npos);
    EXPECT_EQ(launch.find("matroskamux"), std::string::npos);
}

TEST(GstreamerFileOutputTest, EncoderNames) {
    for (const char* name : { "x264", "h264", "x265", "h265" }) {
        EXPECT_TRUE(GstreamerFileOutput::supports_encoder(name)) << name;
    }
    EXPECT_FALSE(GstreamerFileOutput::supports_encoder("vp8"));
    EXPECT_FALSE(GstreamerFileOutput::supports_encoder("vp9"));
    EXPECT_FALSE(GstreamerFileOutput::supports_encoder(""));
}

TEST(GstreamerFileOutputTest, InitRejectsUnknownEncoderBeforeTouchingGstreamer) {
    GstreamerFileOutput output;
    EXPECT_FALSE(output.init(sink_config(64, 64, "vp8")));
    EXPECT_FALSE(output.is_open());
}
