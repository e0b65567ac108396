#pragma once

#include <cstdint>

#include <clean-core/optional.hh>
#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/enums.hh>
#include <retained-interface/handles.hh>
#include <retained-interface/raw_input.hh>

namespace ri
{
/// a button pressed and released without moving further than the drag threshold
/// also used for double clicks
struct click_event
{
    mouse_button button = mouse_button::unknown;
    tg::pos2 location;
    modifier_flags modifiers;

    click_event relative_to(tg::pos2 origin) const;

    bool operator==(click_event const& rhs) const;
    bool operator!=(click_event const& rhs) const { return !operator==(rhs); }
};

/// a button held down while moving beyond the drag threshold
/// in_progress is false once the button was released
struct drag_event
{
    mouse_button button = mouse_button::unknown;
    tg::pos2 start;
    tg::pos2 end;
    modifier_flags modifiers;
    bool in_progress = false;

    tg::vec2 delta() const { return {end.x - start.x, end.y - start.y}; }

    drag_event relative_to(tg::pos2 origin) const;

    bool operator==(drag_event const& rhs) const;
    bool operator!=(drag_event const& rhs) const { return !operator==(rhs); }
};

struct scroll_event
{
    float x = 0;
    float y = 0;
    modifier_flags modifiers;

    bool operator==(scroll_event const& rhs) const { return x == rhs.x && y == rhs.y && modifiers == rhs.modifiers; }
    bool operator!=(scroll_event const& rhs) const { return !operator==(rhs); }
};

/// a touch that ended close to where it started
struct tap_event
{
    touch_id id = 0;
    tg::pos2 location;

    tap_event relative_to(tg::pos2 origin) const;

    bool operator==(tap_event const& rhs) const { return id == rhs.id && location == rhs.location; }
    bool operator!=(tap_event const& rhs) const { return !operator==(rhs); }
};

enum class ui_event_type : uint8_t
{
    raw,
    click,
    double_click,
    drag,
    scroll,
    tap,
    capture_mouse,
    uncapture_mouse,
    capture_keyboard,
    uncapture_keyboard,
};

/// one entry of the semantic event log of a cycle
///
/// only the payload belonging to the type is meaningful:
///   raw: raw (the device event, passed through)
///   click, double_click: click
///   drag: drag
///   scroll: scroll
///   tap: tap
///   capture / uncapture: widget
struct ui_event
{
    ui_event_type type = ui_event_type::raw;

    raw_input raw;
    click_event click;
    drag_event drag;
    scroll_event scroll;
    tap_event tap;
    widget_id widget;

    /// mouse-sourced events are hidden from widgets while another widget captures the mouse
    bool is_mouse_event() const;
    /// keyboard-sourced events are only visible to the widget capturing the keyboard
    bool is_keyboard_event() const;
    bool is_capture_transition() const;

    /// the position used to decide whether the event happened over a widget, if it has one
    cc::optional<tg::pos2> location() const;

    /// a copy with all positions translated into a space with the given origin
    ui_event relative_to(tg::pos2 origin) const;

    bool operator==(ui_event const& rhs) const;
    bool operator!=(ui_event const& rhs) const { return !operator==(rhs); }
};

namespace event
{
ui_event raw(raw_input input);
ui_event click(click_event const& e);
ui_event double_click(click_event const& e);
ui_event drag(drag_event const& e);
ui_event scroll(scroll_event const& e);
ui_event tap(tap_event const& e);
ui_event capture_mouse(widget_id id);
ui_event uncapture_mouse(widget_id id);
ui_event capture_keyboard(widget_id id);
ui_event uncapture_keyboard(widget_id id);
}

// queries over an event sequence
// shared by the global log and the widget scoped views

/// first click of the given button
cc::optional<click_event> find_click(cc::span<ui_event const> events, mouse_button b);
/// first double click of the given button
cc::optional<click_event> find_double_click(cc::span<ui_event const> events, mouse_button b);
/// most recent drag of the given button
cc::optional<drag_event> find_last_drag(cc::span<ui_event const> events, mouse_button b);
/// all scroll events summed per axis, modifiers of the last one
cc::optional<scroll_event> sum_scroll(cc::span<ui_event const> events);
/// first tap
cc::optional<tap_event> find_tap(cc::span<ui_event const> events);
/// all text input concatenated
cc::string collect_text(cc::span<ui_event const> events);
cc::vector<key> collect_keys(cc::span<ui_event const> events, raw_input_type type);
cc::vector<mouse_button> collect_mouse_buttons(cc::span<ui_event const> events, raw_input_type type);
}
