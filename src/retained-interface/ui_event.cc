#include "ui_event.hh"

#include <clean-core/assert.hh>
#include <clean-core/utility.hh>

#include <retained-interface/detail/geometry.hh>

ri::click_event ri::click_event::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    r.location = detail::translate(location, origin);
    return r;
}

bool ri::click_event::operator==(click_event const& rhs) const
{
    return button == rhs.button && location == rhs.location && modifiers == rhs.modifiers;
}

ri::drag_event ri::drag_event::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    r.start = detail::translate(start, origin);
    r.end = detail::translate(end, origin);
    return r;
}

bool ri::drag_event::operator==(drag_event const& rhs) const
{
    return button == rhs.button && start == rhs.start && end == rhs.end && modifiers == rhs.modifiers && in_progress == rhs.in_progress;
}

ri::tap_event ri::tap_event::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    r.location = detail::translate(location, origin);
    return r;
}

bool ri::ui_event::is_mouse_event() const
{
    switch (type)
    {
    case ui_event_type::raw:
        return raw.is_mouse_button() || raw.is_motion(motion_type::mouse_cursor) || raw.is_motion(motion_type::mouse_scroll);
    case ui_event_type::click:
    case ui_event_type::double_click:
    case ui_event_type::drag:
    case ui_event_type::scroll:
    case ui_event_type::tap:
        return true;
    default:
        return false;
    }
}

bool ri::ui_event::is_keyboard_event() const
{
    switch (type)
    {
    case ui_event_type::raw:
        return raw.is_key() || raw.type == raw_input_type::text;
    case ui_event_type::scroll:
        return true;
    default:
        return false;
    }
}

bool ri::ui_event::is_capture_transition() const
{
    return type == ui_event_type::capture_mouse || type == ui_event_type::uncapture_mouse || //
           type == ui_event_type::capture_keyboard || type == ui_event_type::uncapture_keyboard;
}

cc::optional<tg::pos2> ri::ui_event::location() const
{
    switch (type)
    {
    case ui_event_type::click:
    case ui_event_type::double_click:
        return click.location;
    case ui_event_type::tap:
        return tap.location;
    case ui_event_type::raw:
        if (raw.is_motion(motion_type::touch))
            return raw.touch.pos;
        return {};
    default:
        return {};
    }
}

ri::ui_event ri::ui_event::relative_to(tg::pos2 origin) const
{
    switch (type)
    {
    case ui_event_type::raw:
        return event::raw(raw.relative_to(origin));
    case ui_event_type::click:
        return event::click(click.relative_to(origin));
    case ui_event_type::double_click:
        return event::double_click(click.relative_to(origin));
    case ui_event_type::drag:
        return event::drag(drag.relative_to(origin));
    case ui_event_type::tap:
        return event::tap(tap.relative_to(origin));
    default:
        return *this;
    }
}

bool ri::ui_event::operator==(ui_event const& rhs) const
{
    if (type != rhs.type)
        return false;

    switch (type)
    {
    case ui_event_type::raw:
        return raw == rhs.raw;
    case ui_event_type::click:
    case ui_event_type::double_click:
        return click == rhs.click;
    case ui_event_type::drag:
        return drag == rhs.drag;
    case ui_event_type::scroll:
        return scroll == rhs.scroll;
    case ui_event_type::tap:
        return tap == rhs.tap;
    case ui_event_type::capture_mouse:
    case ui_event_type::uncapture_mouse:
    case ui_event_type::capture_keyboard:
    case ui_event_type::uncapture_keyboard:
        return widget == rhs.widget;
    }
    CC_UNREACHABLE("unknown event type");
}

namespace
{
ri::ui_event make_event(ri::ui_event_type type)
{
    ri::ui_event e;
    e.type = type;
    return e;
}

ri::ui_event make_capture(ri::ui_event_type type, ri::widget_id id)
{
    CC_ASSERT(id.is_valid() && "capture transitions need a widget");
    auto e = make_event(type);
    e.widget = id;
    return e;
}
}

ri::ui_event ri::event::raw(raw_input input)
{
    auto e = make_event(ui_event_type::raw);
    e.raw = cc::move(input);
    return e;
}

ri::ui_event ri::event::click(click_event const& c)
{
    auto e = make_event(ui_event_type::click);
    e.click = c;
    return e;
}

ri::ui_event ri::event::double_click(click_event const& c)
{
    auto e = make_event(ui_event_type::double_click);
    e.click = c;
    return e;
}

ri::ui_event ri::event::drag(drag_event const& d)
{
    auto e = make_event(ui_event_type::drag);
    e.drag = d;
    return e;
}

ri::ui_event ri::event::scroll(scroll_event const& s)
{
    auto e = make_event(ui_event_type::scroll);
    e.scroll = s;
    return e;
}

ri::ui_event ri::event::tap(tap_event const& t)
{
    auto e = make_event(ui_event_type::tap);
    e.tap = t;
    return e;
}

ri::ui_event ri::event::capture_mouse(widget_id id) { return make_capture(ui_event_type::capture_mouse, id); }
ri::ui_event ri::event::uncapture_mouse(widget_id id) { return make_capture(ui_event_type::uncapture_mouse, id); }
ri::ui_event ri::event::capture_keyboard(widget_id id) { return make_capture(ui_event_type::capture_keyboard, id); }
ri::ui_event ri::event::uncapture_keyboard(widget_id id) { return make_capture(ui_event_type::uncapture_keyboard, id); }

cc::optional<ri::click_event> ri::find_click(cc::span<ui_event const> events, mouse_button b)
{
    for (auto const& e : events)
        if (e.type == ui_event_type::click && e.click.button == b)
            return e.click;
    return {};
}

cc::optional<ri::click_event> ri::find_double_click(cc::span<ui_event const> events, mouse_button b)
{
    for (auto const& e : events)
        if (e.type == ui_event_type::double_click && e.click.button == b)
            return e.click;
    return {};
}

cc::optional<ri::drag_event> ri::find_last_drag(cc::span<ui_event const> events, mouse_button b)
{
    cc::optional<drag_event> r;
    for (auto const& e : events)
        if (e.type == ui_event_type::drag && e.drag.button == b)
            r = e.drag;
    return r;
}

cc::optional<ri::scroll_event> ri::sum_scroll(cc::span<ui_event const> events)
{
    cc::optional<scroll_event> r;
    for (auto const& e : events)
    {
        if (e.type != ui_event_type::scroll)
            continue;

        if (!r.has_value())
        {
            r = e.scroll;
            continue;
        }

        auto& s = r.value();
        s.x += e.scroll.x;
        s.y += e.scroll.y;
        s.modifiers = e.scroll.modifiers;
    }
    return r;
}

cc::optional<ri::tap_event> ri::find_tap(cc::span<ui_event const> events)
{
    for (auto const& e : events)
        if (e.type == ui_event_type::tap)
            return e.tap;
    return {};
}

cc::string ri::collect_text(cc::span<ui_event const> events)
{
    cc::string s;
    for (auto const& e : events)
        if (e.type == ui_event_type::raw && e.raw.type == raw_input_type::text)
            s += e.raw.text;
    return s;
}

cc::vector<ri::key> ri::collect_keys(cc::span<ui_event const> events, raw_input_type type)
{
    cc::vector<key> keys;
    for (auto const& e : events)
        if (e.type == ui_event_type::raw && e.raw.type == type && e.raw.button.is_keyboard())
            keys.push_back(e.raw.button.key);
    return keys;
}

cc::vector<ri::mouse_button> ri::collect_mouse_buttons(cc::span<ui_event const> events, raw_input_type type)
{
    cc::vector<mouse_button> buttons;
    for (auto const& e : events)
        if (e.type == ui_event_type::raw && e.raw.type == type && e.raw.button.is_mouse())
            buttons.push_back(e.raw.button.mouse);
    return buttons;
}
