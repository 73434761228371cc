#include "interfaces.h"
#include "CropErrors.h"
#include "App/CommandLine.h"
#include "App/ErrorReport.h"
#include "Cropping/CropPipeline.h"
#include "Logging/TextCropLogWriter.h"
#include "Preview/CropWindow.h"
#include "VideoInputStream/GstreamerCapture.h"
#include "VideoOutputStream/GstreamerFileOutput.h"

#include <gst/gst.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Graceful cancellation on Ctrl-C
// ─────────────────────────────────────────────────────────────────────────────

static std::atomic<bool> g_shutdown{ false };

static void signal_handler(int /*sig*/)
{
    g_shutdown.store(true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Sample the first frame and let the user pick a region on it.
// ─────────────────────────────────────────────────────────────────────────────

static std::optional<cv::Rect> select_region(const AppConfig& cfg)
{
    GstreamerCapture preview;
    if (!preview.start(cfg.input_path)) {
        throw SourceUnreadable("Cannot open video source: " + cfg.input_path);
    }
    std::optional<RawFrame> first = preview.pull_frame();
    preview.stop();
    if (!first) {
        throw SourceUnreadable("Could not read a frame from: " + cfg.input_path);
    }

    CropWindowConfig window_cfg;
    window_cfg.max_canvas              = cfg.max_canvas;
    window_cfg.square_mode             = cfg.square_mode;
    window_cfg.selection.handle_radius = cfg.handle_radius;
    window_cfg.selection.min_commit_size = cfg.min_size;

    CropWindow window(window_cfg);
    return window.run(first->data, &g_shutdown);
}

// ─────────────────────────────────────────────────────────────────────────────
// main
//
// Examples:
//   ./crpr input.mp4
//   ./crpr input.mov output.mp4 --square
//   ./crpr input.avi output.mp4 --rect 100,100,400,300
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[])
{
    // ── GStreamer global init ────────────────────────────────────────────────
    gst_init(&argc, &argv);

    // ── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Configuration ────────────────────────────────────────────────────────
    AppConfig cfg;
    try {
        cfg = parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[crpr] " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    std::cout << "Video source  : " << cfg.input_path  << "\n"
              << "Output file   : " << cfg.output_path << "\n"
              << "Encoder       : " << cfg.encoder     << "\n";

    try {
        // Nothing is opened for a container we cannot handle.
        if (!CropPipeline::is_supported_input(cfg.input_path)) {
            throw UnsupportedFormat("Unsupported input format: " + cfg.input_path);
        }
        if (!CropPipeline::is_supported_output(cfg.output_path)) {
            throw UnsupportedFormat("Unsupported output format: " + cfg.output_path);
        }

        // ── Selection ────────────────────────────────────────────────────────
        std::optional<cv::Rect> roi = cfg.rect;
        if (!roi) {
            roi = select_region(cfg);
        }
        if (g_shutdown.load()) {
            std::cerr << "[crpr] Interrupted, nothing written.\n";
            return 1;
        }
        if (!roi) {
            std::cout << "Nothing to crop.\n";
            return 0;
        }

        const CropSpec spec(*roi, cfg.input_path, cfg.output_path, cfg.encoder);

        // ── Crop ─────────────────────────────────────────────────────────────
        CropPipeline pipeline(
            [] { return std::make_unique<GstreamerCapture>(); },
            [] { return std::make_unique<GstreamerFileOutput>(); },
            std::make_shared<TextCropLogWriter>());

        const OperationRecord record = pipeline.run_async(spec, &g_shutdown).get();

        std::cout << "Done. " << record.frames_written << " frames, "
                  << record.output_size.width << "x" << record.output_size.height
                  << " → " << record.output_path << "\n";
        return 0;

    } catch (const std::exception& e) {
        // CropError, cv::Exception, and anything from the background task.
        return report_failure(e, std::cerr);
    }
}
