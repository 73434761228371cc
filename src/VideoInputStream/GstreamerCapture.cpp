#include "VideoInputStream/GstreamerCapture.h"

#include <gst/video/video.h>

#include <iostream>
#include <stdexcept>

namespace {

constexpr GstClockTime kPrerollTimeout = 10 * GST_SECOND;

template <typename T>
void drop_ref(T*& object)
{
    if (object) {
        gst_object_unref(object);
        object = nullptr;
    }
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

// The file location is set as a property on "src" afterwards, so paths with
// spaces or quotes never go through the launch-string parser.
std::string GstreamerCapture::build_pipeline()
{
    return "filesrc name=src ! decodebin ! videoconvert ! "
           "video/x-raw,format=BGR ! appsink name=sink";
}

bool GstreamerCapture::start(const std::string& path)
{
    if (pipeline_) {
        std::cerr << "[GstreamerCapture] start() while open, call stop() first.\n";
        return false;
    }

    failed_.store(false);
    info_       = VideoInfo{};
    next_index_ = 0;

    if (!create_pipeline(path) || !preroll()) {
        std::cerr << "[GstreamerCapture] Could not read video from: " << path << "\n";
        stop();
        return false;
    }

    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        check_bus_messages();
        std::cerr << "[GstreamerCapture] Decoder refused to start for: " << path << "\n";
        stop();
        return false;
    }
    running_.store(true);

    std::cout << "[GstreamerCapture] Opened " << path << " ("
              << info_.width << "x" << info_.height << " @ "
              << info_.fps_num << "/" << info_.fps_den << " fps, ~"
              << info_.frame_count << " frames)\n";
    return true;
}

void GstreamerCapture::stop()
{
    const bool was_running = running_.exchange(false);

    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
    }
    drop_ref(bus_);
    drop_ref(appsink_);
    drop_ref(pipeline_);

    if (was_running) {
        std::cout << "[GstreamerCapture] Closed after " << next_index_ << " frames.\n";
    }
}

std::optional<RawFrame> GstreamerCapture::pull_frame()
{
    // Errors only. An EOS message can arrive while the appsink still holds
    // queued frames; pull_sample() reports the real end of stream.
    check_bus_messages();
    if (!running_.load()) {
        return std::nullopt;
    }

    // Blocks until a frame is available, EOS, or an error.
    GstSample* sample = gst_app_sink_pull_sample(GST_APP_SINK(appsink_));
    if (!sample) {
        check_bus_messages();
        if (!gst_app_sink_is_eos(GST_APP_SINK(appsink_))) {
            std::cerr << "[GstreamerCapture] Stream stopped before EOS.\n";
            failed_.store(true);
        }
        running_.store(false);
        return std::nullopt;
    }

    std::optional<RawFrame> frame;
    try {
        frame        = sample_to_frame(sample);
        frame->index = next_index_++;
    } catch (const std::exception& e) {
        std::cerr << "[GstreamerCapture] Frame " << next_index_ << " unusable: "
                  << e.what() << "\n";
        failed_.store(true);
        running_.store(false);
        frame.reset();
    }
    gst_sample_unref(sample);
    return frame;
}

// ─────────────────────────────────────────────────────────────────────────────
// Private helpers
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerCapture::create_pipeline(const std::string& path)
{
    GError* error = nullptr;
    pipeline_ = gst_parse_launch(build_pipeline().c_str(), &error);
    if (error) {
        std::cerr << "[GstreamerCapture] Cannot build decoder: " << error->message << "\n";
        g_error_free(error);
        return false;
    }

    GstElement* filesrc = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
    appsink_            = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
    if (!filesrc || !appsink_) {
        std::cerr << "[GstreamerCapture] Pipeline lacks the 'src'/'sink' elements.\n";
        drop_ref(filesrc);
        return false;
    }
    g_object_set(G_OBJECT(filesrc), "location", path.c_str(), nullptr);
    gst_object_unref(filesrc);

    //   drop=FALSE  → upstream blocks instead of losing frames
    //   sync=FALSE  → decode as fast as possible, no clock
    //   pull model, so no new-sample signals
    g_object_set(G_OBJECT(appsink_),
                 "emit-signals", FALSE,
                 "max-buffers",  8,
                 "drop",         FALSE,
                 "sync",         FALSE,
                 nullptr);

    bus_ = gst_element_get_bus(pipeline_);
    return true;
}

bool GstreamerCapture::preroll()
{
    if (gst_element_set_state(pipeline_, GST_STATE_PAUSED) == GST_STATE_CHANGE_FAILURE) {
        check_bus_messages();
        return false;
    }

    // Wait for decodebin to find a video stream and deliver the first frame.
    const GstStateChangeReturn settled =
        gst_element_get_state(pipeline_, nullptr, nullptr, kPrerollTimeout);
    if (settled == GST_STATE_CHANGE_FAILURE || settled == GST_STATE_CHANGE_ASYNC) {
        check_bus_messages();
        return false;
    }

    GstSample* first = gst_app_sink_try_pull_preroll(GST_APP_SINK(appsink_), kPrerollTimeout);
    if (!first) {
        std::cerr << "[GstreamerCapture] No video frame in stream.\n";
        return false;
    }

    GstVideoInfo vinfo;
    const bool caps_ok = gst_video_info_from_caps(&vinfo, gst_sample_get_caps(first));
    gst_sample_unref(first);

    if (!caps_ok || GST_VIDEO_INFO_WIDTH(&vinfo) <= 0 || GST_VIDEO_INFO_HEIGHT(&vinfo) <= 0) {
        std::cerr << "[GstreamerCapture] Decoder reported no usable frame size.\n";
        return false;
    }

    info_.width   = GST_VIDEO_INFO_WIDTH(&vinfo);
    info_.height  = GST_VIDEO_INFO_HEIGHT(&vinfo);
    info_.fps_num = GST_VIDEO_INFO_FPS_N(&vinfo);
    info_.fps_den = GST_VIDEO_INFO_FPS_D(&vinfo);

    if (info_.fps_num <= 0 || info_.fps_den <= 0) {
        std::cerr << "[GstreamerCapture] Variable or unknown frame rate, assuming 30/1.\n";
        info_.fps_num = 30;
        info_.fps_den = 1;
    }

    gint64 duration = 0;
    if (gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &duration) && duration > 0) {
        info_.frame_count = static_cast<std::int64_t>(
            gst_util_uint64_scale_round(static_cast<guint64>(duration),
                                        static_cast<guint64>(info_.fps_num),
                                        static_cast<guint64>(info_.fps_den) * GST_SECOND));
    }
    return true;
}

RawFrame GstreamerCapture::sample_to_frame(GstSample* sample) const
{
    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstCaps*   caps   = gst_sample_get_caps(sample);

    GstVideoInfo vinfo;
    if (!buffer || !caps || !gst_video_info_from_caps(&vinfo, caps)) {
        throw std::runtime_error("sample has no video caps");
    }

    GstVideoFrame vframe;
    if (!gst_video_frame_map(&vframe, &vinfo, buffer, GST_MAP_READ)) {
        throw std::runtime_error("cannot map buffer");
    }

    // BGR was requested in the caps filter, so the plane is CV_8UC3.
    // Rows may be padded.
    const cv::Mat view(GST_VIDEO_FRAME_HEIGHT(&vframe),
                       GST_VIDEO_FRAME_WIDTH(&vframe),
                       CV_8UC3,
                       GST_VIDEO_FRAME_PLANE_DATA(&vframe, 0),
                       static_cast<std::size_t>(GST_VIDEO_FRAME_PLANE_STRIDE(&vframe, 0)));

    RawFrame frame;
    try {
        frame.data = view.clone();         // own the pixels before unmapping
    } catch (const cv::Exception&) {
        gst_video_frame_unmap(&vframe);
        throw;
    }
    gst_video_frame_unmap(&vframe);

    frame.pts_ns = GST_BUFFER_PTS_IS_VALID(buffer)
                       ? static_cast<std::int64_t>(GST_BUFFER_PTS(buffer))
                       : 0;
    return frame;
}

void GstreamerCapture::check_bus_messages()
{
    if (!bus_) {
        return;
    }

    // Non-blocking: returns nullptr immediately if nothing is queued.
    while (GstMessage* msg = gst_bus_pop_filtered(bus_, GST_MESSAGE_ERROR)) {
        GError* err   = nullptr;
        gchar*  debug = nullptr;
        gst_message_parse_error(msg, &err, &debug);
        std::cerr << "[GstreamerCapture] Error from "
                  << GST_OBJECT_NAME(GST_MESSAGE_SRC(msg)) << ": " << err->message << "\n";
        if (debug) {
            std::cerr << "[GstreamerCapture]   " << debug << "\n";
        }
        g_clear_error(&err);
        g_free(debug);
        gst_message_unref(msg);

        failed_.store(true);
        running_.store(false);
    }
}
