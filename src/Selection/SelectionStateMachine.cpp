#include "Selection/SelectionStateMachine.h"

#include <algorithm>
#include <cmath>
#include <utility>

SelectionStateMachine::SelectionStateMachine(CoordinateTransform transform,
                                             SelectionConfig     config)
    : transform_(std::move(transform))
    , config_(config)
    , bounds_(transform_.image_bounds())
{
}

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Rectangle> SelectionStateMachine::dispatch(SelectionSession&     session,
                                                         const SelectionEvent& event) const
{
    if (session.is_terminal()) {
        return std::nullopt;
    }

    // One flag, two triggers: the held modifier and the persistent toggle.
    session.square_locked = event.square_modifier || session.square_mode;

    switch (event.type) {
        case SelectionEvent::Type::PointerDown:
            on_pointer_down(session, event.point);
            break;
        case SelectionEvent::Type::PointerMove:
            on_pointer_move(session, event.point);
            break;
        case SelectionEvent::Type::PointerUp:
            on_pointer_up(session);
            break;
        case SelectionEvent::Type::Key:
            return on_key(session, event.key);
        case SelectionEvent::Type::WindowClosed:
            session.mode          = InteractionMode::Cancelled;
            session.active_handle = HandleId::None;
            break;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Pointer handling
// ─────────────────────────────────────────────────────────────────────────────

void SelectionStateMachine::on_pointer_down(SelectionSession& s, cv::Point2d p) const
{
    if (s.mode != InteractionMode::Idle) {
        return;
    }
    if (p.x < bounds_.x || p.x > bounds_.right() ||
        p.y < bounds_.y || p.y > bounds_.bottom()) {
        return;
    }

    const HandleId hit = hit_test_handle(s.rect, p, config_.handle_radius);

    s.anchor = p;
    if (hit == HandleId::None) {
        // Fresh selection: a zero-area rect at the pointer, grown by its
        // bottom-right corner. Dragging past the anchor flips the quadrant.
        s.rect          = { p.x, p.y, 0.0, 0.0, CoordinateSpace::Display };
        s.active_handle = HandleId::BottomRight;
    } else {
        s.active_handle = hit;
    }
    s.drag_origin = s.rect;
    s.mode        = InteractionMode::Dragging;
}

void SelectionStateMachine::on_pointer_move(SelectionSession& s, cv::Point2d p) const
{
    if (s.mode != InteractionMode::Dragging) {
        return;
    }

    Rectangle next;
    if (s.active_handle == HandleId::Move) {
        next = moved(s, p);
    } else if (is_corner(s.active_handle)) {
        next = resized_by_corner(s, p);
    } else if (is_edge(s.active_handle)) {
        next = resized_by_edge(s, p);
    } else {
        return;
    }

    s.rect = clamp_to_bounds(next, bounds_);
}

void SelectionStateMachine::on_pointer_up(SelectionSession& s) const
{
    if (s.mode != InteractionMode::Dragging) {
        return;
    }
    s.mode          = InteractionMode::Idle;
    s.active_handle = HandleId::None;
}

// ─────────────────────────────────────────────────────────────────────────────
// Keys
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Rectangle> SelectionStateMachine::on_key(SelectionSession& s,
                                                       SelectionKey      key) const
{
    switch (key) {
        case SelectionKey::Commit:
            return commit(s);

        case SelectionKey::Reset:
            s.rect          = { 0.0, 0.0, 0.0, 0.0, CoordinateSpace::Display };
            s.drag_origin   = s.rect;
            s.active_handle = HandleId::None;
            s.mode          = InteractionMode::Idle;
            break;

        case SelectionKey::Cancel:
            s.mode          = InteractionMode::Cancelled;
            s.active_handle = HandleId::None;
            break;

        case SelectionKey::ToggleSquare:
            s.square_mode   = !s.square_mode;
            s.square_locked = s.square_mode;
            break;
    }
    return std::nullopt;
}

std::optional<Rectangle> SelectionStateMachine::commit(SelectionSession& s) const
{
    if (s.mode != InteractionMode::Idle || s.rect.empty()) {
        return std::nullopt;
    }
    if (s.rect.width < config_.min_commit_size || s.rect.height < config_.min_commit_size) {
        return std::nullopt;
    }

    const Rectangle source = to_source(transform_, s.rect);

    // A sliver narrower than one source pixel would crop nothing.
    if (to_pixel_rect(source, transform_.source_size()).area() == 0) {
        return std::nullopt;
    }

    s.mode = InteractionMode::Committed;
    return source;
}

// ─────────────────────────────────────────────────────────────────────────────
// Rectangle updates
// ─────────────────────────────────────────────────────────────────────────────

Rectangle SelectionStateMachine::moved(const SelectionSession& s, cv::Point2d p) const
{
    Rectangle r = s.drag_origin;
    r.x += p.x - s.anchor.x;
    r.y += p.y - s.anchor.y;
    return r;
}

Rectangle SelectionStateMachine::resized_by_corner(const SelectionSession& s, cv::Point2d p) const
{
    const cv::Point2d pointer = clamp_point(p, bounds_);
    const cv::Point2d fixed   = corner_point(s.drag_origin, opposite_corner(s.active_handle));

    Rectangle r = rect_from_points(fixed, pointer, CoordinateSpace::Display);
    if (s.square_locked) {
        const Corner anchor = anchor_corner(fixed, pointer);
        r = fit_square_in_bounds(apply_square_lock(r, anchor), anchor, bounds_);
    }
    return r;
}

Rectangle SelectionStateMachine::resized_by_edge(const SelectionSession& s, cv::Point2d p) const
{
    const cv::Point2d pointer = clamp_point(p, bounds_);
    const Rectangle&  o       = s.drag_origin;
    Rectangle         r       = o;

    if (s.active_handle == HandleId::Left || s.active_handle == HandleId::Right) {
        const double fixed = (s.active_handle == HandleId::Left) ? o.right() : o.x;
        r.x     = std::min(fixed, pointer.x);
        r.width = std::abs(pointer.x - fixed);

        if (s.square_locked) {
            // Height follows the width, centred on the old vertical centre.
            const double side = std::min(r.width, bounds_.height);
            const double cy   = o.y + o.height / 2.0;
            r.x      = (pointer.x < fixed) ? fixed - side : fixed;
            r.width  = side;
            r.height = side;
            r.y      = std::clamp(cy - side / 2.0, bounds_.y, bounds_.bottom() - side);
        }
    } else {
        const double fixed = (s.active_handle == HandleId::Top) ? o.bottom() : o.y;
        r.y      = std::min(fixed, pointer.y);
        r.height = std::abs(pointer.y - fixed);

        if (s.square_locked) {
            const double side = std::min(r.height, bounds_.width);
            const double cx   = o.x + o.width / 2.0;
            r.y      = (pointer.y < fixed) ? fixed - side : fixed;
            r.height = side;
            r.width  = side;
            r.x      = std::clamp(cx - side / 2.0, bounds_.x, bounds_.right() - side);
        }
    }
    return r;
}
