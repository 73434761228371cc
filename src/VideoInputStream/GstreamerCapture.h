#pragma once

#include "interfaces.h"

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <atomic>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// GstreamerCapture
//
// Reads every frame of a video file, in order, using the pull model.
//
// Pipeline:
//   filesrc ! decodebin ! videoconvert ! video/x-raw,format=BGR ! appsink
//
// Design:
//   - start() prerolls the pipeline (PAUSED) so the caps, frame rate and
//     duration are known before the first pull_frame()
//   - the appsink never drops (drop=FALSE): a crop has to see every frame
//   - the preroll sample is handed out again as the first pulled sample
//   - row stride is taken from the caps, so odd widths come out intact
// ─────────────────────────────────────────────────────────────────────────────

class GstreamerCapture : public IVideoInputStream {
public:
    GstreamerCapture() = default;
    ~GstreamerCapture() override { stop(); }

    GstreamerCapture(const GstreamerCapture&)            = delete;
    GstreamerCapture& operator=(const GstreamerCapture&) = delete;

    // ── IVideoInputStream ────────────────────────────────────────────────────

    bool start(const std::string& path) override;
    void stop() override;

    VideoInfo info() const override { return info_; }

    std::optional<RawFrame> pull_frame() override;

    bool failed() const override { return failed_.load(); }

    // Decode launch string; the file is set on the element named "src".
    static std::string build_pipeline();

private:
    // ── GStreamer objects ────────────────────────────────────────────────────
    GstElement* pipeline_  = nullptr;
    GstElement* appsink_   = nullptr;
    GstBus*     bus_       = nullptr;

    std::atomic<bool> running_{ false };
    std::atomic<bool> failed_{ false };

    VideoInfo   info_;
    std::size_t next_index_ = 0;

    // ── Helpers ──────────────────────────────────────────────────────────────
    bool     create_pipeline(const std::string& path);
    bool     preroll();
    RawFrame sample_to_frame(GstSample* sample) const;
    void     check_bus_messages();
};
