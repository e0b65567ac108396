#include "raw_input.hh"

#include <clean-core/assert.hh>

#include <typed-geometry/tg.hh>

#include <retained-interface/detail/geometry.hh>

ri::raw_input ri::raw_input::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    if (type == raw_input_type::motion)
    {
        if (motion == motion_type::mouse_cursor)
            r.position = detail::translate(position, origin);
        else if (motion == motion_type::touch)
            r.touch.pos = detail::translate(touch.pos, origin);
    }
    return r;
}

bool ri::raw_input::operator==(raw_input const& rhs) const
{
    if (type != rhs.type)
        return false;

    switch (type)
    {
    case raw_input_type::press:
    case raw_input_type::release:
        return button == rhs.button;
    case raw_input_type::motion:
        if (motion != rhs.motion)
            return false;
        switch (motion)
        {
        case motion_type::mouse_cursor:
            return position == rhs.position;
        case motion_type::mouse_scroll:
            return scroll == rhs.scroll;
        case motion_type::touch:
            return touch == rhs.touch;
        }
        CC_UNREACHABLE("unknown motion type");
    case raw_input_type::text:
        return text == rhs.text;
    case raw_input_type::focus:
        return focused == rhs.focused;
    case raw_input_type::resize:
        return width == rhs.width && height == rhs.height;
    }
    CC_UNREACHABLE("unknown raw input type");
}

namespace
{
ri::raw_input make_button(ri::raw_input_type type, ri::input_button b)
{
    ri::raw_input r;
    r.type = type;
    r.button = b;
    return r;
}

ri::input_button key_button(ri::key k)
{
    ri::input_button b;
    b.type = ri::input_button::source::keyboard;
    b.key = k;
    return b;
}

ri::input_button mouse_button_of(ri::mouse_button m)
{
    ri::input_button b;
    b.type = ri::input_button::source::mouse;
    b.mouse = m;
    return b;
}
}

ri::raw_input ri::press(key k) { return make_button(raw_input_type::press, key_button(k)); }
ri::raw_input ri::press(mouse_button b) { return make_button(raw_input_type::press, mouse_button_of(b)); }
ri::raw_input ri::release(key k) { return make_button(raw_input_type::release, key_button(k)); }
ri::raw_input ri::release(mouse_button b) { return make_button(raw_input_type::release, mouse_button_of(b)); }

ri::raw_input ri::mouse_cursor(float x, float y)
{
    raw_input r;
    r.type = raw_input_type::motion;
    r.motion = motion_type::mouse_cursor;
    r.position = {x, y};
    return r;
}

ri::raw_input ri::mouse_scroll(float x, float y)
{
    raw_input r;
    r.type = raw_input_type::motion;
    r.motion = motion_type::mouse_scroll;
    r.scroll = {x, y};
    return r;
}

ri::raw_input ri::touch(touch_phase phase, touch_id id, tg::pos2 pos)
{
    raw_input r;
    r.type = raw_input_type::motion;
    r.motion = motion_type::touch;
    r.touch.phase = phase;
    r.touch.id = id;
    r.touch.pos = pos;
    return r;
}

ri::raw_input ri::text_input(cc::string_view text)
{
    raw_input r;
    r.type = raw_input_type::text;
    r.text = cc::string(text);
    return r;
}

ri::raw_input ri::focus(bool focused)
{
    raw_input r;
    r.type = raw_input_type::focus;
    r.focused = focused;
    return r;
}

ri::raw_input ri::resize(float width, float height)
{
    raw_input r;
    r.type = raw_input_type::resize;
    r.width = width;
    r.height = height;
    return r;
}
