#pragma once

#include <cstdint>

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/enums.hh>
#include <retained-interface/handles.hh>

namespace ri
{
/// a keyboard key or a mouse button
struct input_button
{
    enum class source : uint8_t
    {
        keyboard,
        mouse,
    };

    source type = source::keyboard;
    ri::key key = ri::key::unknown;
    mouse_button mouse = mouse_button::unknown;

    bool is_keyboard() const { return type == source::keyboard; }
    bool is_mouse() const { return type == source::mouse; }

    bool operator==(input_button const& rhs) const
    {
        return type == rhs.type && (is_keyboard() ? key == rhs.key : mouse == rhs.mouse);
    }
    bool operator!=(input_button const& rhs) const { return !operator==(rhs); }
};

enum class raw_input_type : uint8_t
{
    press,
    release,
    motion,
    text,
    focus,
    resize,
};

enum class motion_type : uint8_t
{
    mouse_cursor,
    mouse_scroll,
    touch,
};

struct touch_input
{
    touch_phase phase = touch_phase::start;
    touch_id id = 0;
    tg::pos2 pos;

    bool operator==(touch_input const& rhs) const { return phase == rhs.phase && id == rhs.id && pos == rhs.pos; }
};

/// a device event as delivered by the host window system
///
/// only the fields belonging to the type are meaningful:
///   press / release: button
///   motion: motion and one of position (cursor), scroll (wheel) or touch
///   text: text
///   focus: focused
///   resize: width, height
///
/// positions are window coordinates
struct raw_input
{
    raw_input_type type = raw_input_type::focus;

    input_button button;

    motion_type motion = motion_type::mouse_cursor;
    tg::pos2 position;
    tg::vec2 scroll;
    touch_input touch;

    cc::string text;

    bool focused = false;

    float width = 0;
    float height = 0;

    bool is_mouse_button() const { return (type == raw_input_type::press || type == raw_input_type::release) && button.is_mouse(); }
    bool is_key() const { return (type == raw_input_type::press || type == raw_input_type::release) && button.is_keyboard(); }
    bool is_motion(motion_type t) const { return type == raw_input_type::motion && motion == t; }

    /// a copy with all absolute positions translated into a space with the given origin
    raw_input relative_to(tg::pos2 origin) const;

    bool operator==(raw_input const& rhs) const;
    bool operator!=(raw_input const& rhs) const { return !operator==(rhs); }
};

raw_input press(key k);
raw_input press(mouse_button b);
raw_input release(key k);
raw_input release(mouse_button b);
raw_input mouse_cursor(float x, float y);
raw_input mouse_scroll(float x, float y);
raw_input touch(touch_phase phase, touch_id id, tg::pos2 pos);
raw_input text_input(cc::string_view text);
raw_input focus(bool focused);
raw_input resize(float width, float height);
}
