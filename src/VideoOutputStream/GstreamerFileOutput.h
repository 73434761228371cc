#pragma once

#include "interfaces.h"

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>
#include <gst/video/video.h>

#include <atomic>
#include <cstdint>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// GstreamerFileOutput
//
// Implementation of IVideoOutputStream using GStreamer to write video files.
// Uses appsrc to push frames into a GStreamer encoding pipeline.
//
//   appsrc ! videoconvert ! Y444 ! <encoder> ! <parser> ! mp4mux ! filesink
//
// Encoders: x264 (default), h264, x265, h265. Frames are encoded 4:4:4 so any
// width and height is accepted.
//
// appsrc holds at most a few frames; write_frame() waits for room while
// watching the bus, so an encoder that fails or stalls is reported instead of
// blocking the caller. Timestamps are derived from the frame index and the
// configured frame rate.
// ─────────────────────────────────────────────────────────────────────────────

class GstreamerFileOutput : public IVideoOutputStream {
public:
    GstreamerFileOutput() = default;
    ~GstreamerFileOutput() override { close(); }

    GstreamerFileOutput(const GstreamerFileOutput&)            = delete;
    GstreamerFileOutput& operator=(const GstreamerFileOutput&) = delete;

    // ── IVideoOutputStream ───────────────────────────────────────────────────

    bool init(const VideoSinkConfig& config) override;
    bool write_frame(const CroppedFrame& frame) override;
    bool close() override;
    bool is_open() const override;

    // Encode launch string for the given settings; the destination is set on
    // the element named "sink".
    static std::string build_pipeline(const VideoSinkConfig& config);

    // True for the names accepted in VideoSinkConfig::encoder.
    static bool supports_encoder(const std::string& encoder);

private:
    // ── GStreamer objects ────────────────────────────────────────────────────
    GstElement* pipeline_  = nullptr;
    GstElement* appsrc_    = nullptr;
    GstBus*     bus_       = nullptr;

    std::atomic<bool> is_open_{ false };
    std::atomic<bool> error_{ false };

    // Video parameters
    VideoSinkConfig config_;
    GstVideoInfo    vinfo_{};

    std::uint64_t frame_count_ = 0;

    // ── Helpers ──────────────────────────────────────────────────────────────
    bool create_pipeline();
    bool wait_for_room();
    bool finalize();
    void check_bus_messages();
    void release();
};
