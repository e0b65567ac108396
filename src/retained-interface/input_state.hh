#pragma once

#include <chrono>

#include <clean-core/array.hh>
#include <clean-core/optional.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/enums.hh>
#include <retained-interface/fwd.hh>
#include <retained-interface/handles.hh>

namespace ri
{
/// up, or down since origin
struct button_position
{
    bool is_down = false;
    tg::pos2 origin;
    widget_id widget; ///< widget under the cursor when pressed, if any

    bool operator==(button_position const& rhs) const;
    bool operator!=(button_position const& rhs) const { return !operator==(rhs); }
};

/// state of all mouse buttons, indexed by ri::mouse_button
struct button_map
{
    void press(mouse_button b, tg::pos2 origin, widget_id widget = {});
    void release(mouse_button b);

    button_position const& get(mouse_button b) const { return _buttons[int(b)]; }
    button_position const& operator[](mouse_button b) const { return get(b); }
    bool is_down(mouse_button b) const { return get(b).is_down; }

    /// all currently pressed buttons in index order
    cc::vector<mouse_button> pressed() const;

    button_map relative_to(tg::pos2 origin) const;

    bool operator==(button_map const& rhs) const;
    bool operator!=(button_map const& rhs) const { return !operator==(rhs); }

private:
    cc::array<button_position, mouse_button_count> _buttons;
};

struct touch_state
{
    touch_id id = 0;
    std::chrono::steady_clock::time_point start_time;
    tg::pos2 start_pos;
    widget_id widget; ///< widget under the finger when the touch started
    tg::pos2 last_pos;

    bool operator==(touch_state const& rhs) const;
};

/// raw per-source input state
///
/// the event synthesizer keeps two of these:
///   start_state: snapshot at the beginning of the cycle
///   current_state: start_state with all logged events of the cycle folded in
/// widget views replay start_state through the log to judge each event in its capture context
struct input_state
{
    button_map mouse_buttons;
    tg::pos2 mouse_pos;

    // NOTE: usually zero to two entries, searched linearly
    cc::vector<touch_state> touches;

    widget_id capturing_mouse;
    widget_id capturing_keyboard;

    modifier_flags modifiers;

    /// folds one logged event into the state
    void update(ui_event const& e);

    /// a copy with the mouse position, button origins and touches translated into a space with the given origin
    input_state relative_to(tg::pos2 origin) const;

    touch_state* find_touch(touch_id id);
    touch_state const* find_touch(touch_id id) const;

    bool is_ctrl_down() const { return has_ctrl(modifiers); }
    bool is_shift_down() const { return has_shift(modifiers); }
    bool is_alt_down() const { return has_alt(modifiers); }
    bool is_gui_down() const { return has_gui(modifiers); }

    bool operator==(input_state const& rhs) const;
    bool operator!=(input_state const& rhs) const { return !operator==(rhs); }
};
}
