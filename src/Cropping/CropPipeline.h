#pragma once

#include "interfaces.h"
#include "CropErrors.h"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// CropPipeline
//
// Applies one committed crop rectangle to every frame of a video:
//
//   open source → read size / fps → open sink at ROI size → for each frame:
//   cut ROI, write → close both → OperationRecord → log writer
//
// Frames are handled strictly in source order; output frame N is source
// frame N. Any failure after the output was created deletes it again, so a
// failed run leaves no file behind. Errors are thrown as CropError subclasses
// (see CropErrors.h).
//
// The video collaborators are created through factories so that tests can
// substitute in-memory streams.
// ─────────────────────────────────────────────────────────────────────────────

using InputStreamFactory  = std::function<std::unique_ptr<IVideoInputStream>()>;
using OutputStreamFactory = std::function<std::unique_ptr<IVideoOutputStream>()>;

class CropPipeline {
public:
    CropPipeline(InputStreamFactory              make_input,
                 OutputStreamFactory             make_output,
                 std::shared_ptr<ICropLogWriter> log_writer = nullptr);

    // Blocking. cancel, if given, is polled between frames.
    OperationRecord run(const CropSpec& spec,
                        const std::atomic<bool>* cancel = nullptr) const;

    // Runs on a background task. The pipeline is copied into the task; cancel
    // must outlive the returned future.
    std::future<OperationRecord> run_async(CropSpec spec,
                                           const std::atomic<bool>* cancel = nullptr) const;

    // Throws UnsupportedFormat unless the input is .mp4/.avi/.mov and the
    // output is .mp4 (case-insensitive), and OutputWriteError when both paths
    // name the same file.
    static void validate_formats(const CropSpec& spec);

    static bool is_supported_input(const std::string& path);
    static bool is_supported_output(const std::string& path);

private:
    InputStreamFactory              make_input_;
    OutputStreamFactory             make_output_;
    std::shared_ptr<ICropLogWriter> log_writer_;
};
