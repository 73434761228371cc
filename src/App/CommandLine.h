#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Command line configuration
//
// Usage:
//   crpr <input_video> [output_file] [options]
//
// Arguments:
//   input_video   - .mp4, .avi or .mov (required)
//   output_file   - .mp4; defaults to <input stem>_cropped.mp4 beside the input
//
// Options:
//   --square              start with square mode on
//   --rect x,y,w,h        skip the window and crop this source rectangle
//   --encoder NAME        x264 (default), h264, x265, h265
//   --canvas WxH          largest preview canvas (default 1280x720)
//   --min-size N          smallest width/height accepted on commit (display px,
//                         default 0)
//   --handle-radius N     handle grab distance (display px, default 10)
//   -h, --help
// ─────────────────────────────────────────────────────────────────────────────

struct AppConfig {
    std::string             input_path;
    std::string             output_path;            // resolved, never empty after parsing
    std::string             encoder       = "x264";
    bool                    square_mode   = false;
    std::optional<cv::Rect> rect;                   // headless crop when set
    cv::Size                max_canvas    { 1280, 720 };
    double                  min_size      = 0.0;
    double                  handle_radius = 10.0;
    bool                    show_help     = false;
};

// Throws std::invalid_argument with a user-facing message on bad input.
AppConfig parse_command_line(int argc, const char* const argv[]);

// <dir>/<stem>_cropped.mp4
std::string default_output_path(const std::string& input_path);

std::string usage(const std::string& program);
