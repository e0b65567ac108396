#pragma once

#include <chrono>

#include <clean-core/optional.hh>
#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/string_view.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/diagnostics.hh>
#include <retained-interface/handles.hh>
#include <retained-interface/input_state.hh>
#include <retained-interface/options.hh>
#include <retained-interface/raw_input.hh>
#include <retained-interface/ui_event.hh>

namespace ri
{
/// an area registered by a widget during a rebuild pass
/// used to find the widget under the cursor when capturing input
struct widget_area
{
    widget_id id;
    tg::aabb2 area;
    widget_options options;
};

/// turns raw device events into the semantic event log of a cycle
///
/// every raw event is logged as-is, followed by whatever it synthesizes:
///   press: capture transitions towards the widget under the cursor
///   release: click or finished drag, double click, mouse uncapture
///   cursor motion: in-progress drags of held buttons
///   wheel: scroll
///   touch end: tap
/// modifier keys are tracked when the raw event is folded into current_state
///
/// malformed orderings (stray releases, mismatched uncaptures) are no-ops that are counted in diagnostics()
class event_synthesizer
{
    // settings
public:
    /// distance beyond which a held button turns into a drag
    float drag_threshold = 4.0f;
    /// max time between two clicks at the same location to form a double click
    std::chrono::milliseconds double_click_threshold{500};
    /// max distance between start and end of a touch to form a tap
    float tap_threshold = 4.0f;

    using clock = std::chrono::steady_clock;

public:
    void push_event(raw_input const& input) { push_event(input, clock::now()); }
    void push_event(raw_input const& input, clock::time_point now);

    // capture directives
    // NOTE: these are logged like synthesized events
public:
    void capture_mouse(widget_id id);
    void uncapture_mouse(widget_id id);
    void capture_keyboard(widget_id id);
    void uncapture_keyboard(widget_id id);

    // picking
public:
    /// replaces the set of pickable areas, later entries are on top
    void set_widget_areas(cc::vector<widget_area> areas) { _widget_areas = cc::move(areas); }
    void add_widget_area(widget_id id, tg::aabb2 const& area, widget_options options = cc::no_flags);
    void clear_widget_areas() { _widget_areas.clear(); }
    cc::span<widget_area const> widget_areas() const { return _widget_areas; }

    /// topmost pickable widget containing p, invalid if none
    widget_id pick_widget_at(tg::pos2 p) const;

    // cycle
public:
    /// clears the log and rolls start_state forward to current_state
    void end_cycle();

    /// clears the log only, start_state is kept
    void reset() { _events.clear(); }

    // queries
public:
    cc::span<ui_event const> events() const { return _events; }
    input_state const& start_state() const { return _start_state; }
    input_state const& current_state() const { return _current_state; }

    tg::pos2 mouse_position() const { return _current_state.mouse_pos; }
    widget_id capturing_mouse() const { return _current_state.capturing_mouse; }
    widget_id capturing_keyboard() const { return _current_state.capturing_keyboard; }
    modifier_flags modifiers() const { return _current_state.modifiers; }

    input_diagnostics const& diagnostics() const { return _diagnostics; }

    // unscoped views of the log, see ri::widget_input for the capture aware ones
public:
    cc::optional<click_event> mouse_click(mouse_button b) const { return find_click(_events, b); }
    cc::optional<click_event> mouse_left_click() const { return mouse_click(mouse_button::left); }
    cc::optional<drag_event> mouse_drag(mouse_button b) const { return find_last_drag(_events, b); }
    cc::optional<drag_event> mouse_left_drag() const { return mouse_drag(mouse_button::left); }
    cc::optional<scroll_event> scroll() const { return sum_scroll(_events); }
    cc::string text_just_entered() const { return collect_text(_events); }
    cc::vector<key> keys_just_pressed() const { return collect_keys(_events, raw_input_type::press); }
    cc::vector<key> keys_just_released() const { return collect_keys(_events, raw_input_type::release); }

private:
    void append(ui_event e);

    void on_mouse_press(mouse_button b);
    void on_mouse_release(mouse_button b, button_position const& down, clock::time_point now);
    void on_mouse_move();
    void on_touch(touch_input const& t, touch_state const* before, clock::time_point now);

    void move_mouse_capture(widget_id target);
    void move_keyboard_capture(widget_id target);

    bool is_drag(tg::pos2 a, tg::pos2 b) const;
    bool accepts_keyboard(widget_id id) const;

    void warn(input_error e, cc::string_view msg, widget_id id);

private:
    input_state _start_state;
    input_state _current_state;
    cc::vector<ui_event> _events;

    cc::vector<widget_area> _widget_areas;

    struct pending_click
    {
        bool is_valid = false;
        click_event click;
        clock::time_point time;
    };
    pending_click _last_click;

    input_diagnostics _diagnostics;
};
}
