#pragma once

#include <stdexcept>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Crop errors
//
// Everything the crop pipeline can surface to its caller. Each error names the
// stage that failed so the front end can tell the user where it stopped.
// ─────────────────────────────────────────────────────────────────────────────

enum class CropStage {
    Validate,       // before anything is opened
    SourceOpen,
    Crop,
    Write,
};

inline const char* to_string(CropStage stage)
{
    switch (stage) {
        case CropStage::Validate:   return "validate";
        case CropStage::SourceOpen: return "source open";
        case CropStage::Crop:       return "crop";
        case CropStage::Write:      return "write";
    }
    return "unknown";
}

class CropError : public std::runtime_error {
public:
    CropError(CropStage stage, const std::string& what)
        : std::runtime_error(what), stage_(stage) {}

    CropStage stage() const { return stage_; }

private:
    CropStage stage_;
};

// Input or output container is not one we handle.
class UnsupportedFormat : public CropError {
public:
    explicit UnsupportedFormat(const std::string& what)
        : CropError(CropStage::Validate, what) {}
};

// Input cannot be opened, has no frames, or fails to decode.
class SourceUnreadable : public CropError {
public:
    explicit SourceUnreadable(const std::string& what)
        : CropError(CropStage::SourceOpen, what) {}
};

// Zero-area rectangle, or one that does not fit the source frame.
class InvalidSelection : public CropError {
public:
    explicit InvalidSelection(const std::string& what)
        : CropError(CropStage::Crop, what) {}
};

// Destination cannot be created, or a write / finalize failed.
class OutputWriteError : public CropError {
public:
    explicit OutputWriteError(const std::string& what)
        : CropError(CropStage::Write, what) {}
};

// Cancellation flag raised while frames were being written.
class CropCancelled : public CropError {
public:
    explicit CropCancelled(const std::string& what)
        : CropError(CropStage::Crop, what) {}
};
