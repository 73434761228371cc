#pragma once

#include "Preview/PreviewRenderer.h"
#include "Selection/SelectionStateMachine.h"

#include <opencv2/core.hpp>

#include <atomic>
#include <optional>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// CropWindow
//
// Interactive selection on one sampled frame, hosted in an OpenCV HighGUI
// window. Mouse and keyboard input is turned into SelectionEvents and fed to
// the state machine; the window redraws whenever the session changes.
//
// Controls:
//   drag           – new selection / move / resize via handles
//   Shift + drag   – keep the selection square
//   s              – toggle persistent square mode
//   r              – reset the selection
//   c, Enter       – commit
//   Esc, q         – cancel (closing the window cancels too)
// ─────────────────────────────────────────────────────────────────────────────

struct CropWindowConfig {
    std::string     window_name = "crpr";
    cv::Size        max_canvas  { 1280, 720 };  // larger frames are scaled down
    SelectionConfig selection;
    bool            square_mode = false;        // initial state of the toggle
    PreviewStyle    style;
};

class CropWindow {
public:
    explicit CropWindow(CropWindowConfig config = {});
    ~CropWindow() { close(); }

    CropWindow(const CropWindow&)            = delete;
    CropWindow& operator=(const CropWindow&) = delete;

    // Blocks until the user commits, cancels or closes the window, or until
    // cancel (if given) is raised, which counts as closing the window.
    // Returns the committed selection in source pixels, nullopt otherwise.
    std::optional<cv::Rect> run(const cv::Mat& frame,
                                const std::atomic<bool>* cancel = nullptr);

    // Canvas used for a frame of the given size: the frame itself if it fits
    // max_canvas, otherwise max_canvas.
    static cv::Size canvas_for(cv::Size frame_size, cv::Size max_canvas);

private:
    CropWindowConfig                     config_;
    std::optional<SelectionStateMachine> machine_;
    SelectionSession                     session_;
    PreviewRenderer                      renderer_;
    std::optional<Rectangle>             committed_;
    bool                                 window_open_ = false;
    bool                                 dirty_       = true;

    static void on_mouse(int event, int x, int y, int flags, void* userdata);

    void handle_mouse(int event, int x, int y, int flags);
    void handle_key(int key);
    void dispatch(const SelectionEvent& event);
    bool window_visible() const;
    void close();
};
