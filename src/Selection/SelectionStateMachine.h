#pragma once

#include "interfaces.h"
#include "Geometry/Geometry.h"

#include <opencv2/core.hpp>

#include <optional>

// ─────────────────────────────────────────────────────────────────────────────
// Selection session
//
// Everything the interactive crop window knows about the current selection.
// Owned by whoever drives the state machine and handed to every dispatch()
// call; nothing else keeps a copy.
// ─────────────────────────────────────────────────────────────────────────────

enum class InteractionMode {
    Idle,
    Dragging,
    Committed,      // terminal
    Cancelled,      // terminal
};

struct SelectionSession {
    Rectangle       rect;                       // display space
    InteractionMode mode          = InteractionMode::Idle;

    bool            square_mode   = false;      // persistent toggle
    bool            square_locked = false;      // toggle OR held modifier, per event

    HandleId        active_handle = HandleId::None;
    cv::Point2d     anchor;                     // pointer-down position
    Rectangle       drag_origin;                // rect when the drag started

    bool is_terminal() const
    {
        return mode == InteractionMode::Committed ||
               mode == InteractionMode::Cancelled;
    }
};

enum class SelectionKey {
    Commit,
    Reset,
    Cancel,
    ToggleSquare,
};

struct SelectionEvent {
    enum class Type {
        PointerDown,
        PointerMove,
        PointerUp,
        Key,
        WindowClosed,
    };

    Type         type            = Type::PointerMove;
    cv::Point2d  point;                         // display space
    bool         square_modifier = false;       // e.g. Shift held
    SelectionKey key             = SelectionKey::Commit;

    static SelectionEvent pointer_down(cv::Point2d p, bool modifier = false)
    {
        return { Type::PointerDown, p, modifier, SelectionKey::Commit };
    }
    static SelectionEvent pointer_move(cv::Point2d p, bool modifier = false)
    {
        return { Type::PointerMove, p, modifier, SelectionKey::Commit };
    }
    static SelectionEvent pointer_up(cv::Point2d p, bool modifier = false)
    {
        return { Type::PointerUp, p, modifier, SelectionKey::Commit };
    }
    static SelectionEvent key_press(SelectionKey k, bool modifier = false)
    {
        return { Type::Key, {}, modifier, k };
    }
    static SelectionEvent window_closed()
    {
        return { Type::WindowClosed, {}, false, SelectionKey::Cancel };
    }
};

struct SelectionConfig {
    double handle_radius   = 10.0;  // display pixels
    double min_commit_size = 0.0;   // smallest width/height accepted on commit
};

// ─────────────────────────────────────────────────────────────────────────────
// SelectionStateMachine
//
//   Idle ──down──▶ Dragging ──up──▶ Idle ──commit──▶ Committed
//     │               │
//     └──cancel/close─┴──────────────────────────────▶ Cancelled
//
// Holds only immutable configuration, so one instance can drive any number of
// sessions. Not reentrant per session: feed events for a given session from a
// single event loop.
// ─────────────────────────────────────────────────────────────────────────────

class SelectionStateMachine {
public:
    explicit SelectionStateMachine(CoordinateTransform transform,
                                   SelectionConfig     config = {});

    // Apply one event to the session. Returns the selection in source
    // coordinates on the event that commits it, nullopt otherwise.
    std::optional<Rectangle> dispatch(SelectionSession&     session,
                                      const SelectionEvent& event) const;

    const CoordinateTransform& transform() const { return transform_; }
    const SelectionConfig&     config()    const { return config_; }

    // Region the selection may occupy (the image part of the canvas).
    Rectangle canvas_bounds() const { return bounds_; }

private:
    CoordinateTransform transform_;
    SelectionConfig     config_;
    Rectangle           bounds_;

    void on_pointer_down(SelectionSession& s, cv::Point2d p) const;
    void on_pointer_move(SelectionSession& s, cv::Point2d p) const;
    void on_pointer_up(SelectionSession& s) const;
    std::optional<Rectangle> on_key(SelectionSession& s, SelectionKey key) const;
    std::optional<Rectangle> commit(SelectionSession& s) const;

    Rectangle moved(const SelectionSession& s, cv::Point2d p) const;
    Rectangle resized_by_corner(const SelectionSession& s, cv::Point2d p) const;
    Rectangle resized_by_edge(const SelectionSession& s, cv::Point2d p) const;
};
