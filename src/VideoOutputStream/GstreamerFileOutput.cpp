#include "VideoOutputStream/GstreamerFileOutput.h"

#include <algorithm>
#include <array>
#include <iostream>
#include <sstream>

namespace {

constexpr GstClockTime kFinalizeTimeout = 60 * GST_SECOND;
constexpr GstClockTime kRoomPoll        = 10 * GST_MSECOND;
constexpr GstClockTime kStallTimeout    = 30 * GST_SECOND;
constexpr guint64      kQueuedFrames    = 4;

const std::array<const char*, 4> kEncoders = { "x264", "h264", "x265", "h265" };

// Encoder plus the parser mp4mux needs after it. Both encoders are fed 4:4:4
// so odd widths and heights survive; 4:2:0 needs even dimensions.
const char* encoder_chain(const std::string& encoder)
{
    if (encoder == "x265" || encoder == "h265") {
        return "video/x-raw,format=Y444 ! x265enc speed-preset=medium ! h265parse";
    }
    return "video/x-raw,format=Y444 ! x264enc speed-preset=medium ! h264parse";
}

template <typename T>
void drop_ref(T*& object)
{
    if (object) {
        gst_object_unref(object);
        object = nullptr;
    }
}

// Logs an ERROR or WARNING message. Returns true for errors.
bool report_message(GstMessage* msg)
{
    GError* err        = nullptr;
    gchar*  debug_info = nullptr;
    bool    is_error   = false;

    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        gst_message_parse_error(msg, &err, &debug_info);
        std::cerr << "[GstreamerFileOutput] Error from "
                  << GST_OBJECT_NAME(GST_MESSAGE_SRC(msg)) << ": " << err->message << "\n";
        is_error = true;
    } else if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_WARNING) {
        gst_message_parse_warning(msg, &err, &debug_info);
        std::cerr << "[GstreamerFileOutput] Warning: " << err->message << "\n";
    }
    if (is_error && debug_info) {
        std::cerr << "[GstreamerFileOutput]   " << debug_info << "\n";
    }

    g_clear_error(&err);
    g_free(debug_info);
    return is_error;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Pipeline description
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerFileOutput::supports_encoder(const std::string& encoder)
{
    return std::find(kEncoders.begin(), kEncoders.end(), encoder) != kEncoders.end();
}

std::string GstreamerFileOutput::build_pipeline(const VideoSinkConfig& config)
{
    std::ostringstream oss;
    oss << "appsrc name=src format=time is-live=false block=false "
        << "caps=video/x-raw,format=BGR"
        << ",width="     << config.width
        << ",height="    << config.height
        << ",framerate=" << config.fps_num << "/" << config.fps_den
        << " ! videoconvert"
        << " ! " << encoder_chain(config.encoder)
        << " ! mp4mux"
        << " ! filesink name=sink";
    return oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// IVideoOutputStream
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerFileOutput::init(const VideoSinkConfig& config)
{
    if (pipeline_) {
        std::cerr << "[GstreamerFileOutput] init() called twice.\n";
        return false;
    }
    if (!supports_encoder(config.encoder)) {
        std::cerr << "[GstreamerFileOutput] Unknown encoder '" << config.encoder << "'\n";
        return false;
    }
    if (config.path.empty() || config.width <= 0 || config.height <= 0 ||
        config.fps_num <= 0 || config.fps_den <= 0) {
        std::cerr << "[GstreamerFileOutput] Bad sink settings: '" << config.path << "' "
                  << config.width << "x" << config.height << " @ "
                  << config.fps_num << "/" << config.fps_den << "\n";
        return false;
    }

    config_      = config;
    frame_count_ = 0;
    error_.store(false);

    gst_video_info_set_format(&vinfo_, GST_VIDEO_FORMAT_BGR,
                              static_cast<guint>(config_.width),
                              static_cast<guint>(config_.height));
    GST_VIDEO_INFO_FPS_N(&vinfo_) = config_.fps_num;
    GST_VIDEO_INFO_FPS_D(&vinfo_) = config_.fps_den;

    if (!create_pipeline()) {
        release();
        return false;
    }

    // filesink opens the destination during this transition, so an
    // unwritable path is caught here.
    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        check_bus_messages();
        std::cerr << "[GstreamerFileOutput] Cannot start encoder for " << config_.path << "\n";
        release();
        return false;
    }

    is_open_.store(true);
    std::cout << "[GstreamerFileOutput] Encoding " << config_.width << "x" << config_.height
              << " @ " << config_.fps_num << "/" << config_.fps_den
              << " to " << config_.path << "\n";
    return true;
}

bool GstreamerFileOutput::write_frame(const CroppedFrame& frame)
{
    check_bus_messages();
    if (!is_open_.load()) {
        return false;
    }

    if (frame.data.type() != CV_8UC3 ||
        frame.data.cols != config_.width || frame.data.rows != config_.height) {
        std::cerr << "[GstreamerFileOutput] Frame " << frame.index << " is "
                  << frame.data.cols << "x" << frame.data.rows << ", sink expects BGR "
                  << config_.width << "x" << config_.height << "\n";
        return false;
    }

    GstBuffer* buffer = gst_buffer_new_allocate(nullptr, GST_VIDEO_INFO_SIZE(&vinfo_), nullptr);
    if (!buffer) {
        std::cerr << "[GstreamerFileOutput] Out of memory for frame " << frame.index << "\n";
        return false;
    }

    // The GStreamer layout may pad rows, so copy through a strided view.
    GstVideoFrame vframe;
    if (!gst_video_frame_map(&vframe, &vinfo_, buffer, GST_MAP_WRITE)) {
        std::cerr << "[GstreamerFileOutput] Cannot map buffer for frame " << frame.index << "\n";
        gst_buffer_unref(buffer);
        return false;
    }
    cv::Mat dst(config_.height, config_.width, CV_8UC3,
                GST_VIDEO_FRAME_PLANE_DATA(&vframe, 0),
                static_cast<std::size_t>(GST_VIDEO_FRAME_PLANE_STRIDE(&vframe, 0)));
    frame.data.copyTo(dst);
    gst_video_frame_unmap(&vframe);

    // Output frame N sits at N / fps regardless of the source timestamps.
    const guint64 second_units = static_cast<guint64>(config_.fps_den) * GST_SECOND;
    const guint64 fps_num      = static_cast<guint64>(config_.fps_num);
    GST_BUFFER_PTS(buffer)      = gst_util_uint64_scale(frame_count_, second_units, fps_num);
    GST_BUFFER_DURATION(buffer) = gst_util_uint64_scale(1, second_units, fps_num);

    if (!wait_for_room()) {
        gst_buffer_unref(buffer);
        return false;
    }

    // push_buffer takes ownership of buffer.
    const GstFlowReturn flow = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buffer);
    if (flow != GST_FLOW_OK) {
        std::cerr << "[GstreamerFileOutput] Encoder refused frame " << frame.index
                  << " (" << gst_flow_get_name(flow) << ")\n";
        error_.store(true);
        is_open_.store(false);
        return false;
    }

    if (++frame_count_ % 30 == 0) {
        std::cout << "[GstreamerFileOutput] Encoded " << frame_count_ << " frames\n";
    }
    return true;
}

bool GstreamerFileOutput::close()
{
    if (!pipeline_) {
        return false;
    }
    is_open_.store(false);

    const bool ok = !error_.load() && finalize();
    release();

    std::cout << "[GstreamerFileOutput] Closed " << config_.path << " after "
              << frame_count_ << " frames" << (ok ? "" : " (incomplete)") << "\n";
    return ok;
}

bool GstreamerFileOutput::is_open() const
{
    return is_open_.load();
}

// ─────────────────────────────────────────────────────────────────────────────
// Private helpers
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerFileOutput::create_pipeline()
{
    const std::string description = build_pipeline(config_);
    std::cout << "[GstreamerFileOutput] " << description << "\n";

    GError* error = nullptr;
    pipeline_ = gst_parse_launch(description.c_str(), &error);
    if (error) {
        std::cerr << "[GstreamerFileOutput] Cannot build encoder: " << error->message << "\n";
        g_error_free(error);
        return false;
    }

    GstElement* filesink = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
    appsrc_              = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
    if (!filesink || !appsrc_) {
        std::cerr << "[GstreamerFileOutput] Pipeline lacks the 'src'/'sink' elements.\n";
        if (filesink) {
            gst_object_unref(filesink);
        }
        return false;
    }

    // Set as a property so the path never goes through the launch parser.
    g_object_set(G_OBJECT(filesink), "location", config_.path.c_str(), nullptr);
    gst_object_unref(filesink);

    // block=false plus wait_for_room() keeps at most a few frames queued
    // without ever parking the caller inside push_buffer.
    gst_app_src_set_max_bytes(GST_APP_SRC(appsrc_), kQueuedFrames * GST_VIDEO_INFO_SIZE(&vinfo_));

    bus_ = gst_element_get_bus(pipeline_);
    return true;
}

// Waits until the appsrc queue is below max-bytes. Fails on an error message
// or when the encoder has not taken a frame for kStallTimeout.
bool GstreamerFileOutput::wait_for_room()
{
    GstAppSrc*    src    = GST_APP_SRC(appsrc_);
    const guint64 limit  = gst_app_src_get_max_bytes(src);
    GstClockTime  waited = 0;

    while (gst_app_src_get_current_level_bytes(src) >= limit) {
        if (GstMessage* msg = gst_bus_timed_pop_filtered(bus_, kRoomPoll, GST_MESSAGE_ERROR)) {
            report_message(msg);
            gst_message_unref(msg);
            error_.store(true);
            is_open_.store(false);
            return false;
        }
        waited += kRoomPoll;
        if (waited >= kStallTimeout) {
            std::cerr << "[GstreamerFileOutput] Encoder stalled for "
                      << GST_TIME_AS_SECONDS(kStallTimeout) << "s, giving up.\n";
            error_.store(true);
            is_open_.store(false);
            return false;
        }
    }
    return true;
}

// Push EOS and wait until the muxer has written its index.
bool GstreamerFileOutput::finalize()
{
    gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));

    const auto wanted = static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR);
    GstMessage* msg   = gst_bus_timed_pop_filtered(bus_, kFinalizeTimeout, wanted);
    if (!msg) {
        std::cerr << "[GstreamerFileOutput] No EOS after "
                  << GST_TIME_AS_SECONDS(kFinalizeTimeout) << "s, file left unfinished.\n";
        return false;
    }

    const bool ok = GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS || !report_message(msg);
    gst_message_unref(msg);
    return ok;
}

void GstreamerFileOutput::check_bus_messages()
{
    if (!bus_) {
        return;
    }

    const auto wanted = static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_WARNING);
    while (GstMessage* msg = gst_bus_pop_filtered(bus_, wanted)) {
        if (report_message(msg)) {
            error_.store(true);
            is_open_.store(false);
        }
        gst_message_unref(msg);
    }
}

void GstreamerFileOutput::release()
{
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
    }
    drop_ref(bus_);
    drop_ref(appsrc_);
    drop_ref(pipeline_);
}
