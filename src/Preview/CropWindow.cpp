#include "Preview/CropWindow.h"

#include <opencv2/highgui.hpp>

#include <iostream>
#include <utility>

namespace {

constexpr int kKeyEnter  = 13;
constexpr int kKeyEscape = 27;
constexpr int kPollMs    = 15;

} // namespace

CropWindow::CropWindow(CropWindowConfig config)
    : config_(std::move(config))
    , renderer_(config_.style)
{
}

cv::Size CropWindow::canvas_for(cv::Size frame_size, cv::Size max_canvas)
{
    if (frame_size.width <= max_canvas.width && frame_size.height <= max_canvas.height) {
        return frame_size;
    }
    return max_canvas;
}

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

std::optional<cv::Rect> CropWindow::run(const cv::Mat& frame, const std::atomic<bool>* cancel)
{
    if (frame.empty()) {
        std::cerr << "[CropWindow] No frame to show.\n";
        return std::nullopt;
    }
    if (cancel && cancel->load()) {
        std::cout << "[CropWindow] Interrupted before the window opened.\n";
        return std::nullopt;
    }

    // ── Fresh session for this video ─────────────────────────────────────────
    const CoordinateTransform transform = CoordinateTransform::fit(
        frame.size(), canvas_for(frame.size(), config_.max_canvas));

    machine_.emplace(transform, config_.selection);
    session_             = SelectionSession{};
    session_.square_mode = config_.square_mode;
    committed_.reset();
    renderer_.set_frame(frame, transform);

    // ── Window ───────────────────────────────────────────────────────────────
    // AUTOSIZE keeps canvas pixels and mouse coordinates 1:1.
    cv::namedWindow(config_.window_name, cv::WINDOW_AUTOSIZE);
    cv::setMouseCallback(config_.window_name, &CropWindow::on_mouse, this);
    window_open_ = true;
    dirty_       = true;

    std::cout << "[CropWindow] Frame " << frame.cols << "x" << frame.rows
              << " shown at scale " << transform.scale_x() << "\n"
              << "[CropWindow] drag to select, Shift/s for square, "
                 "r reset, c commit, Esc cancel.\n";

    // ── Event loop ───────────────────────────────────────────────────────────
    while (!session_.is_terminal()) {
        if (dirty_) {
            cv::imshow(config_.window_name, renderer_.render(session_));
            dirty_ = false;
        }

        const int key = cv::waitKey(kPollMs);
        if (key >= 0) {
            handle_key(key & 0xFF);
        }

        if (!session_.is_terminal() && cancel && cancel->load()) {
            std::cout << "[CropWindow] Interrupted.\n";
            dispatch(SelectionEvent::window_closed());
        }
        if (!session_.is_terminal() && !window_visible()) {
            dispatch(SelectionEvent::window_closed());
        }
    }

    close();

    if (!committed_) {
        std::cout << "[CropWindow] Selection cancelled.\n";
        return std::nullopt;
    }

    const cv::Rect roi = to_pixel_rect(*committed_, transform.source_size());
    std::cout << "[CropWindow] Committed ROI " << roi << "\n";
    return roi;
}

// ─────────────────────────────────────────────────────────────────────────────
// Input translation
// ─────────────────────────────────────────────────────────────────────────────

void CropWindow::on_mouse(int event, int x, int y, int flags, void* userdata)
{
    static_cast<CropWindow*>(userdata)->handle_mouse(event, x, y, flags);
}

void CropWindow::handle_mouse(int event, int x, int y, int flags)
{
    const cv::Point2d p(x, y);
    const bool shift = (flags & cv::EVENT_FLAG_SHIFTKEY) != 0;

    switch (event) {
        case cv::EVENT_LBUTTONDOWN:
            dispatch(SelectionEvent::pointer_down(p, shift));
            break;
        case cv::EVENT_MOUSEMOVE:
            if (session_.mode == InteractionMode::Dragging) {
                dispatch(SelectionEvent::pointer_move(p, shift));
            }
            break;
        case cv::EVENT_LBUTTONUP:
            dispatch(SelectionEvent::pointer_up(p, shift));
            break;
        default:
            break;
    }
}

void CropWindow::handle_key(int key)
{
    switch (key) {
        case 'c':
        case 'C':
        case kKeyEnter: {
            dispatch(SelectionEvent::key_press(SelectionKey::Commit));
            if (!committed_) {
                std::cout << "[CropWindow] Select a larger region before committing.\n";
            }
            break;
        }
        case 'r':
        case 'R':
            dispatch(SelectionEvent::key_press(SelectionKey::Reset));
            break;
        case 's':
        case 'S':
            dispatch(SelectionEvent::key_press(SelectionKey::ToggleSquare));
            std::cout << "[CropWindow] Square mode "
                      << (session_.square_mode ? "on" : "off") << ".\n";
            break;
        case 'q':
        case 'Q':
        case kKeyEscape:
            dispatch(SelectionEvent::key_press(SelectionKey::Cancel));
            break;
        default:
            break;
    }
}

void CropWindow::dispatch(const SelectionEvent& event)
{
    if (!machine_) {
        return;
    }
    if (auto source_rect = machine_->dispatch(session_, event)) {
        committed_ = *source_rect;
    }
    dirty_ = true;
}

bool CropWindow::window_visible() const
{
    try {
        return cv::getWindowProperty(config_.window_name, cv::WND_PROP_VISIBLE) >= 1;
    } catch (const cv::Exception& e) {
        // Some backends throw once the window has been destroyed by the user.
        std::cerr << "[CropWindow] Window query failed: " << e.what() << "\n";
        return false;
    }
}

void CropWindow::close()
{
    if (window_open_) {
        cv::destroyWindow(config_.window_name);
        cv::waitKey(1);
        window_open_ = false;
    }
}
