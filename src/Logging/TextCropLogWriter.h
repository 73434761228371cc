#pragma once

#include "interfaces.h"

#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// TextCropLogWriter
//
// Writes one human-readable sidecar per completed crop, next to the output:
//   /videos/clip_cropped.mp4  →  /videos/clip_cropped_crop.txt
// An existing sidecar for the same output is replaced.
// ─────────────────────────────────────────────────────────────────────────────

class TextCropLogWriter : public ICropLogWriter {
public:
    bool write(const OperationRecord& record) override;

    static std::string log_path_for(const std::string& output_path);

    // Text written for a record. Exposed for tests.
    static std::string format(const OperationRecord& record);
};
