#include "Cropping/CropPipeline.h"
#include "Cropping/RoiCropper.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string absolute_path(const std::string& path)
{
    std::error_code ec;
    const fs::path abs = fs::absolute(path, ec);
    return ec ? path : abs.lexically_normal().string();
}

// Either the same directory entry (hard links, symlinks) or the same path
// once made absolute.
bool same_file(const std::string& a, const std::string& b)
{
    std::error_code ec;
    if (fs::equivalent(a, b, ec)) {
        return true;
    }
    return absolute_path(a) == absolute_path(b);
}

// Deletes the output file on scope exit unless release() was called. Declared
// before the sink so the sink is closed (fd released) before the delete.
class PartialOutputGuard {
public:
    explicit PartialOutputGuard(std::string path) : path_(std::move(path)) {}

    ~PartialOutputGuard()
    {
        if (!armed_) {
            return;
        }
        std::error_code ec;
        if (fs::remove(path_, ec)) {
            std::cerr << "[CropPipeline] Removed partial output: " << path_ << "\n";
        } else if (ec) {
            std::cerr << "[CropPipeline] Could not remove partial output "
                      << path_ << ": " << ec.message() << "\n";
        }
    }

    PartialOutputGuard(const PartialOutputGuard&)            = delete;
    PartialOutputGuard& operator=(const PartialOutputGuard&) = delete;

    void release() { armed_ = false; }

private:
    std::string path_;
    bool        armed_ = true;
};

} // namespace

CropPipeline::CropPipeline(InputStreamFactory              make_input,
                           OutputStreamFactory             make_output,
                           std::shared_ptr<ICropLogWriter> log_writer)
    : make_input_(std::move(make_input))
    , make_output_(std::move(make_output))
    , log_writer_(std::move(log_writer))
{
}

// ─────────────────────────────────────────────────────────────────────────────
// Format checks
// ─────────────────────────────────────────────────────────────────────────────

bool CropPipeline::is_supported_input(const std::string& path)
{
    static const std::array<const char*, 3> kInputs = { ".mp4", ".avi", ".mov" };
    const std::string ext = lower_extension(path);
    return std::find(kInputs.begin(), kInputs.end(), ext) != kInputs.end();
}

bool CropPipeline::is_supported_output(const std::string& path)
{
    return lower_extension(path) == ".mp4";
}

void CropPipeline::validate_formats(const CropSpec& spec)
{
    if (!is_supported_input(spec.source_path())) {
        throw UnsupportedFormat("Unsupported input format: " + spec.source_path() +
                                " (expected .mp4, .avi or .mov)");
    }
    if (!is_supported_output(spec.output_path())) {
        throw UnsupportedFormat("Unsupported output format: " + spec.output_path() +
                                " (expected .mp4)");
    }
    if (same_file(spec.source_path(), spec.output_path())) {
        throw OutputWriteError("Output would overwrite the source video: " +
                               spec.output_path());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Run
// ─────────────────────────────────────────────────────────────────────────────

OperationRecord CropPipeline::run(const CropSpec& spec, const std::atomic<bool>* cancel) const
{
    validate_formats(spec);

    const cv::Rect& roi = spec.rect();
    std::cout << "[CropPipeline] " << spec.source_path() << " -> " << spec.output_path()
              << "  ROI " << roi << "\n";

    // ── Open source ──────────────────────────────────────────────────────────
    std::unique_ptr<IVideoInputStream> input = make_input_ ? make_input_() : nullptr;
    if (!input || !input->start(spec.source_path())) {
        throw SourceUnreadable("Cannot open video source: " + spec.source_path());
    }

    const VideoInfo info = input->info();

    std::optional<RawFrame> frame = input->pull_frame();
    if (!frame) {
        throw SourceUnreadable(input->failed()
                                   ? "Cannot decode first frame of: " + spec.source_path()
                                   : "Video source has no frames: " + spec.source_path());
    }

    const cv::Size source_size = frame->data.size();
    if ((roi & cv::Rect(cv::Point(0, 0), source_size)) != roi) {
        std::ostringstream oss;
        oss << "Crop rectangle " << roi << " does not fit the "
            << source_size.width << "x" << source_size.height << " source";
        throw InvalidSelection(oss.str());
    }

    // ── Open sink ────────────────────────────────────────────────────────────
    // A file that was already there is only replaced once the sink has
    // started; if init fails it is left alone.
    std::error_code    exists_ec;
    const bool         output_existed = fs::exists(spec.output_path(), exists_ec);
    PartialOutputGuard guard(spec.output_path());

    std::unique_ptr<IVideoOutputStream> output = make_output_ ? make_output_() : nullptr;

    VideoSinkConfig sink_config;
    sink_config.path    = spec.output_path();
    sink_config.encoder = spec.encoder();
    sink_config.width   = roi.width;
    sink_config.height  = roi.height;
    sink_config.fps_num = info.fps_num;
    sink_config.fps_den = info.fps_den;

    if (!output || !output->init(sink_config)) {
        if (output_existed) {
            guard.release();
        }
        throw OutputWriteError("Cannot create output file: " + spec.output_path());
    }

    // ── Frame loop ───────────────────────────────────────────────────────────
    RoiCropper   cropper;
    std::int64_t written = 0;

    while (frame) {
        if (cancel && cancel->load()) {
            throw CropCancelled("Cancelled after " + std::to_string(written) + " frames");
        }

        if (frame->data.size() != source_size) {
            throw SourceUnreadable("Frame " + std::to_string(frame->index) +
                                   " changed resolution mid-stream");
        }

        if (!output->write_frame(cropper.crop(*frame, roi))) {
            throw OutputWriteError("Failed to write frame " + std::to_string(written) +
                                   " to " + spec.output_path());
        }
        ++written;

        if (written % 30 == 0) {
            std::cout << "[CropPipeline] Processed " << written;
            if (info.frame_count > 0) {
                std::cout << " / ~" << info.frame_count;
            }
            std::cout << " frames\n";
        }

        frame = input->pull_frame();
    }

    if (input->failed()) {
        throw SourceUnreadable("Decode error after " + std::to_string(written) +
                               " frames of " + spec.source_path());
    }
    input->stop();

    if (!output->close()) {
        throw OutputWriteError("Failed to finalize output file: " + spec.output_path());
    }
    guard.release();

    if (info.frame_count > 0 && info.frame_count != written) {
        std::cout << "[CropPipeline] Container reported ~" << info.frame_count
                  << " frames, decoded " << written << ".\n";
    }

    // ── Record ───────────────────────────────────────────────────────────────
    OperationRecord record;
    record.timestamp      = std::chrono::system_clock::now();
    record.source_path    = absolute_path(spec.source_path());
    record.output_path    = absolute_path(spec.output_path());
    record.crop_rect      = roi;
    record.source_size    = source_size;
    record.output_size    = roi.size();
    record.fps_num        = info.fps_num;
    record.fps_den        = info.fps_den;
    record.frames_written = written;

    std::cout << "[CropPipeline] Done. " << written << " frames written to "
              << record.output_path << "\n";

    if (log_writer_ && !log_writer_->write(record)) {
        std::cerr << "[CropPipeline] Failed to write operation log for "
                  << record.output_path << "\n";
    }

    return record;
}

std::future<OperationRecord> CropPipeline::run_async(CropSpec spec,
                                                     const std::atomic<bool>* cancel) const
{
    return std::async(std::launch::async,
                      [self = *this, spec = std::move(spec), cancel]() {
                          return self.run(spec, cancel);
                      });
}
