#pragma once

#include <cstdint>

#include <clean-core/flags.hh>
#include <clean-core/optional.hh>
#include <clean-core/string_view.hh>

namespace ri
{
enum class mouse_button : uint8_t
{
    unknown,
    left,
    right,
    middle,
    x1,
    x2,
    button6,
    button7,
    button8,
};

static constexpr int mouse_button_count = 9;

enum class key : uint16_t
{
    unknown,

    // letters
    a,
    b,
    c,
    d,
    e,
    f,
    g,
    h,
    i,
    j,
    k,
    l,
    m,
    n,
    o,
    p,
    q,
    r,
    s,
    t,
    u,
    v,
    w,
    x,
    y,
    z,

    // digits
    d0,
    d1,
    d2,
    d3,
    d4,
    d5,
    d6,
    d7,
    d8,
    d9,

    // function keys
    f1,
    f2,
    f3,
    f4,
    f5,
    f6,
    f7,
    f8,
    f9,
    f10,
    f11,
    f12,

    // editing and navigation
    escape,
    enter,
    tab,
    backspace,
    space,
    insert,
    del,
    home,
    end,
    page_up,
    page_down,
    left,
    right,
    up,
    down,

    // modifiers
    ctrl_left,
    ctrl_right,
    shift_left,
    shift_right,
    alt_left,
    alt_right,
    gui_left,
    gui_right,
};

/// a modifier bit, tracked independently per side
enum class modifier_key : uint8_t
{
    ctrl_left,
    ctrl_right,
    shift_left,
    shift_right,
    alt_left,
    alt_right,
    gui_left,
    gui_right,
};

CC_FLAGS_ENUM(modifier_key);

using modifier_flags = cc::flags<modifier_key>;

inline bool has_ctrl(modifier_flags m) { return m.has(modifier_key::ctrl_left) || m.has(modifier_key::ctrl_right); }
inline bool has_shift(modifier_flags m) { return m.has(modifier_key::shift_left) || m.has(modifier_key::shift_right); }
inline bool has_alt(modifier_flags m) { return m.has(modifier_key::alt_left) || m.has(modifier_key::alt_right); }
inline bool has_gui(modifier_flags m) { return m.has(modifier_key::gui_left) || m.has(modifier_key::gui_right); }

/// the modifier bit a key toggles, empty for non-modifier keys
cc::optional<modifier_key> modifier_of(key k);

enum class touch_phase : uint8_t
{
    start,
    move,
    end,
    cancel,
};

/// cursor icon requested by the widgets of the last pass
enum class cursor_icon : uint8_t
{
    arrow,
    text,
    hand,
    crosshair,
    resize_horizontal,
    resize_vertical,
    not_allowed,
};

cc::string_view to_string(mouse_button b);
cc::string_view to_string(cursor_icon c);
}
