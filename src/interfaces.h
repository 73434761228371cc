#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// ─────────────────────────────────────────────
// Types & Aliases
// ─────────────────────────────────────────────

// Which pixel grid a rectangle is expressed in.
//   Display – the preview canvas (scaled / letterboxed)
//   Source  – native pixels of the video frames
enum class CoordinateSpace {
    Display,
    Source,
};

// Axis-aligned rectangle. Width and height are never negative; a zero-area
// rectangle means "no selection".
struct Rectangle {
    double          x      = 0.0;
    double          y      = 0.0;
    double          width  = 0.0;
    double          height = 0.0;
    CoordinateSpace space  = CoordinateSpace::Display;

    double right()  const { return x + width; }
    double bottom() const { return y + height; }
    double area()   const { return width * height; }
    bool   empty()  const { return width <= 0.0 || height <= 0.0; }

    cv::Rect2d to_cv() const { return { x, y, width, height }; }
};

// Stream properties reported by a video source.
struct VideoInfo {
    int          width      = 0;
    int          height     = 0;
    int          fps_num    = 0;
    int          fps_den    = 1;
    std::int64_t frame_count = 0;     // estimated from the container, 0 if unknown

    double fps() const
    {
        return fps_den > 0 ? static_cast<double>(fps_num) / fps_den : 0.0;
    }
};

// Decoded frame coming off the input stream. Owns its data.
struct RawFrame {
    cv::Mat       data;                // BGR, CV_8UC3
    std::int64_t  pts_ns = 0;
    std::size_t   index  = 0;          // position in source order
};

// Final deliverable: cropped region, same index as the frame it came from
struct CroppedFrame {
    cv::Mat       data;
    cv::Rect      src_roi;             // the ROI used in the source frame
    std::int64_t  pts_ns = 0;
    std::size_t   index  = 0;
};

// Finalized crop request. Immutable once constructed; passed by value from the
// interactive session to the crop pipeline.
class CropSpec {
public:
    // Throws InvalidSelection if rect has zero area.
    CropSpec(cv::Rect           rect,
             std::string        source_path,
             std::string        output_path,
             std::string        encoder = "x264");

    const cv::Rect&    rect()        const { return rect_; }
    const std::string& source_path() const { return source_path_; }
    const std::string& output_path() const { return output_path_; }
    const std::string& encoder()     const { return encoder_; }

private:
    cv::Rect    rect_;
    std::string source_path_;
    std::string output_path_;
    std::string encoder_;
};

// One completed crop. Written once, never updated.
struct OperationRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string   source_path;
    std::string   output_path;
    cv::Rect      crop_rect;           // source coordinates
    cv::Size      source_size;
    cv::Size      output_size;
    int           fps_num        = 0;
    int           fps_den        = 1;
    std::int64_t  frames_written = 0;
};

// ─────────────────────────────────────────────
// I. Video Input Stream Interface
// ─────────────────────────────────────────────

// Sequential frame reader for a video file. Implementations must deliver every
// decoded frame, in order, without dropping any.

class IVideoInputStream {
public:
    virtual ~IVideoInputStream() = default;

    // Open the file and preroll far enough to know its properties.
    // Returns false if the file cannot be opened or holds no video.
    virtual bool            start(const std::string& path) = 0;

    // Stop and tear down the stream.
    virtual void            stop() = 0;

    // Properties of the opened stream. Only valid after start() succeeded.
    virtual VideoInfo       info() const = 0;

    // Pull the next frame. Blocks until one is available. Returns nullopt at
    // end of stream or on error; failed() tells the two apart.
    virtual std::optional<RawFrame> pull_frame() = 0;

    // True once a decode or bus error has been seen.
    virtual bool            failed() const = 0;
};

// ─────────────────────────────────────────────
// II. Video Output Stream Interface
// ─────────────────────────────────────────────

struct VideoSinkConfig {
    std::string path;
    std::string encoder = "x264";      // x264, h264, x265, h265
    int         width   = 0;
    int         height  = 0;
    int         fps_num = 30;
    int         fps_den = 1;
};

class IVideoOutputStream {
public:
    virtual ~IVideoOutputStream() = default;

    // Create the destination and get ready to accept frames.
    // Returns false on failure.
    virtual bool            init(const VideoSinkConfig& config) = 0;

    // Append a frame. Returns false on error.
    virtual bool            write_frame(const CroppedFrame& frame) = 0;

    // Flush any buffers and close the stream.
    // Returns false if the file could not be finalized.
    virtual bool            close() = 0;

    // False once a write error occurred or after close().
    virtual bool            is_open() const = 0;
};

// ─────────────────────────────────────────────
// III. Cropping Interface
// ─────────────────────────────────────────────

// Extracts a fixed source-space ROI from each frame.

class IFrameCropper {
public:
    virtual ~IFrameCropper() = default;

    // Clamp roi so it lies inside a src_w × src_h frame.
    // Pure utility, holds no state.
    virtual cv::Rect        compute_roi(const cv::Rect& roi,
                                        int src_w,
                                        int src_h) const = 0;

    // Perform the actual crop. The result owns its pixels.
    virtual CroppedFrame    crop(const RawFrame& frame,
                                 const cv::Rect& roi) = 0;
};

// ─────────────────────────────────────────────
// IV. Operation Log Interface
// ─────────────────────────────────────────────

class ICropLogWriter {
public:
    virtual ~ICropLogWriter() = default;

    // Persist one record. Returns false if nothing could be written.
    virtual bool            write(const OperationRecord& record) = 0;
};
