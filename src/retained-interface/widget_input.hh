#pragma once

#include <clean-core/optional.hh>
#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/fwd.hh>
#include <retained-interface/handles.hh>
#include <retained-interface/input_state.hh>
#include <retained-interface/ui_event.hh>

namespace ri
{
/// the view of one widget onto the input of the current cycle
///
/// events are filtered by capture:
///   mouse events are invisible while a different widget captures the mouse
///   if nobody captures, mouse events are only visible if they happened over the widget
///   keyboard events are only visible to the widget capturing the keyboard
/// each event is judged in the capture context in effect when it was logged
///
/// all positions are relative to the center of the widget area
///
/// NOTE: scroll() and modifiers() are not gated by capture
/// NOTE: the view is a snapshot, events logged after construction are not seen
class widget_input
{
public:
    widget_input(widget_id id, tg::aabb2 const& area, event_synthesizer const& input);

    widget_id id() const { return _id; }
    tg::aabb2 const& area() const { return _area; }
    /// local origin in window coordinates
    tg::pos2 origin() const { return _origin; }

    // mouse
public:
    tg::pos2 mouse_position() const { return _state.mouse_pos; }
    /// NOTE: tested against the global mouse position
    bool mouse_is_over_widget() const;
    /// mouse position if it is over the widget
    cc::optional<tg::pos2> maybe_mouse_position() const;
    /// mouse position if the button is held down and the mouse is not captured by someone else
    cc::optional<tg::pos2> mouse_button_down(mouse_button b) const;

    cc::optional<click_event> mouse_click(mouse_button b) const { return find_click(_events, b); }
    cc::optional<click_event> mouse_left_click() const { return mouse_click(mouse_button::left); }
    cc::optional<click_event> mouse_right_click() const { return mouse_click(mouse_button::right); }
    cc::optional<click_event> mouse_double_click(mouse_button b) const { return find_double_click(_events, b); }

    cc::optional<drag_event> mouse_drag(mouse_button b) const { return find_last_drag(_events, b); }
    cc::optional<drag_event> mouse_left_drag() const { return mouse_drag(mouse_button::left); }

    /// all scroll events of the cycle summed per axis
    cc::optional<scroll_event> scroll() const { return sum_scroll(_events); }

    cc::optional<tap_event> tap() const { return find_tap(_events); }

    cc::vector<mouse_button> mouse_buttons_just_pressed() const { return collect_mouse_buttons(_events, raw_input_type::press); }
    cc::vector<mouse_button> mouse_buttons_just_released() const { return collect_mouse_buttons(_events, raw_input_type::release); }

    // keyboard
public:
    cc::string text_just_entered() const { return collect_text(_events); }
    cc::vector<key> keys_just_pressed() const { return collect_keys(_events, raw_input_type::press); }
    cc::vector<key> keys_just_released() const { return collect_keys(_events, raw_input_type::release); }

    modifier_flags modifiers() const { return _state.modifiers; }

    // capture
public:
    bool is_capturing_mouse() const { return _state.capturing_mouse == _id; }
    bool is_capturing_keyboard() const { return _state.capturing_keyboard == _id; }

    /// the filtered and translated events
    cc::span<ui_event const> events() const { return _events; }

    /// current input state, translated
    input_state const& state() const { return _state; }

private:
    bool should_provide(ui_event const& e, input_state const& state) const;

    widget_id _id;
    tg::aabb2 _area;
    tg::pos2 _origin;

    tg::pos2 _global_mouse_pos;
    input_state _state;
    cc::vector<ui_event> _events;
};
}
