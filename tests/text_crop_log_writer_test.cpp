#include <gtest/gtest.h>

#include "Logging/TextCropLogWriter.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

OperationRecord sample_record(const std::string& output_path)
{
    OperationRecord r;
    r.timestamp      = std::chrono::system_clock::now();
    r.source_path    = "/videos/clip.mov";
    r.output_path    = output_path;
    r.crop_rect      = { 100, 100, 400, 300 };
    r.source_size    = { 1920, 1080 };
    r.output_size    = { 400, 300 };
    r.fps_num        = 30;
    r.fps_den        = 1;
    r.frames_written = 90;
    return r;
}

} // namespace

TEST(TextCropLogWriterTest, LogPathSitsBesideOutput) {
    EXPECT_EQ(TextCropLogWriter::log_path_for("/videos/clip_cropped.mp4"),
              "/videos/clip_cropped_crop.txt");
    EXPECT_EQ(TextCropLogWriter::log_path_for("out.MP4"), "out_crop.txt");
}

TEST(TextCropLogWriterTest, FormatListsRegionAndStream) {
    const std::string text = TextCropLogWriter::format(sample_record("/videos/clip_cropped.mp4"));

    EXPECT_EQ(text.rfind("crpr:: operation log\n", 0), 0u);
    EXPECT_NE(text.find("timestamp:: "), std::string::npos);
    EXPECT_NE(text.find("status:: cropped successfully"), std::string::npos);
    EXPECT_NE(text.find("roi crop: (100, 100, 400, 300)"), std::string::npos);
    EXPECT_NE(text.find("position: (100, 100)"), std::string::npos);
    EXPECT_NE(text.find("dimensions: 400 x 300 px"), std::string::npos);
    EXPECT_NE(text.find("aspect ratio: 1.333"), std::string::npos);
    EXPECT_NE(text.find("source: /videos/clip.mov"), std::string::npos);
    EXPECT_NE(text.find("source resolution: 1920x1080"), std::string::npos);
    EXPECT_NE(text.find("frame rate: 30/1"), std::string::npos);
    EXPECT_NE(text.find("frames: 90"), std::string::npos);
}

TEST(TextCropLogWriterTest, WriteCreatesSidecarFile) {
    const fs::path dir = fs::temp_directory_path() / "crpr_log_writer_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    const std::string output = (dir / "clip_cropped.mp4").string();
    TextCropLogWriter writer;
    ASSERT_TRUE(writer.write(sample_record(output)));

    const std::string log_path = (dir / "clip_cropped_crop.txt").string();
    std::ifstream     in(log_path);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("dimensions: 400 x 300 px"), std::string::npos);

    in.close();
    fs::remove_all(dir);
}

TEST(TextCropLogWriterTest, WriteFailsForMissingDirectory) {
    TextCropLogWriter writer;
    EXPECT_FALSE(writer.write(sample_record("/nonexistent-crpr-dir/sub/out.mp4")));
}
