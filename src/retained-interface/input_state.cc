#include "input_state.hh"

#include <clean-core/assert.hh>

#include <retained-interface/detail/geometry.hh>
#include <retained-interface/ui_event.hh>

bool ri::button_position::operator==(button_position const& rhs) const
{
    if (is_down != rhs.is_down)
        return false;
    if (!is_down)
        return true;
    return origin == rhs.origin && widget == rhs.widget;
}

void ri::button_map::press(mouse_button b, tg::pos2 origin, widget_id widget)
{
    auto& p = _buttons[int(b)];
    p.is_down = true;
    p.origin = origin;
    p.widget = widget;
}

void ri::button_map::release(mouse_button b) { _buttons[int(b)] = {}; }

cc::vector<ri::mouse_button> ri::button_map::pressed() const
{
    cc::vector<mouse_button> r;
    for (auto i = 0; i < mouse_button_count; ++i)
        if (_buttons[i].is_down)
            r.push_back(mouse_button(i));
    return r;
}

ri::button_map ri::button_map::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    for (auto& b : r._buttons)
        if (b.is_down)
            b.origin = detail::translate(b.origin, origin);
    return r;
}

bool ri::button_map::operator==(button_map const& rhs) const
{
    for (auto i = 0; i < mouse_button_count; ++i)
        if (_buttons[i] != rhs._buttons[i])
            return false;
    return true;
}

bool ri::touch_state::operator==(touch_state const& rhs) const
{
    return id == rhs.id && start_time == rhs.start_time && start_pos == rhs.start_pos && widget == rhs.widget && last_pos == rhs.last_pos;
}

void ri::input_state::update(ui_event const& e)
{
    switch (e.type)
    {
    case ui_event_type::raw:
    {
        auto const& r = e.raw;
        switch (r.type)
        {
        case raw_input_type::press:
            if (r.button.is_mouse())
                mouse_buttons.press(r.button.mouse, mouse_pos);
            else if (auto m = modifier_of(r.button.key); m.has_value())
                modifiers |= m.value();
            break;

        case raw_input_type::release:
            if (r.button.is_mouse())
                mouse_buttons.release(r.button.mouse);
            else if (auto m = modifier_of(r.button.key); m.has_value())
                modifiers &= ~modifier_flags(m.value());
            break;

        case raw_input_type::motion:
            if (r.motion == motion_type::mouse_cursor)
                mouse_pos = r.position;
            else if (r.motion == motion_type::touch)
            {
                auto const& t = r.touch;
                switch (t.phase)
                {
                case touch_phase::start:
                {
                    touch_state s;
                    s.id = t.id;
                    s.start_pos = t.pos;
                    s.last_pos = t.pos;
                    if (auto existing = find_touch(t.id))
                        *existing = s; // restarted without an end
                    else
                        touches.push_back(s);
                    break;
                }
                case touch_phase::move:
                    if (auto s = find_touch(t.id))
                        s->last_pos = t.pos;
                    break;
                case touch_phase::end:
                case touch_phase::cancel:
                    for (size_t i = 0; i < touches.size(); ++i)
                        if (touches[i].id == t.id)
                        {
                            touches[i] = touches.back();
                            touches.pop_back();
                            break;
                        }
                    break;
                }
            }
            break;

        case raw_input_type::text:
        case raw_input_type::focus:
        case raw_input_type::resize:
            break;
        }
        break;
    }

    case ui_event_type::capture_mouse:
        capturing_mouse = e.widget;
        break;
    case ui_event_type::uncapture_mouse:
        if (capturing_mouse == e.widget)
            capturing_mouse = {};
        break;
    case ui_event_type::capture_keyboard:
        capturing_keyboard = e.widget;
        break;
    case ui_event_type::uncapture_keyboard:
        if (capturing_keyboard == e.widget)
            capturing_keyboard = {};
        break;

    case ui_event_type::click:
    case ui_event_type::double_click:
    case ui_event_type::drag:
    case ui_event_type::scroll:
    case ui_event_type::tap:
        break;
    }
}

ri::input_state ri::input_state::relative_to(tg::pos2 origin) const
{
    auto r = *this;
    r.mouse_pos = detail::translate(mouse_pos, origin);
    r.mouse_buttons = mouse_buttons.relative_to(origin);
    for (auto& t : r.touches)
    {
        t.start_pos = detail::translate(t.start_pos, origin);
        t.last_pos = detail::translate(t.last_pos, origin);
    }
    return r;
}

ri::touch_state* ri::input_state::find_touch(touch_id id)
{
    for (auto& t : touches)
        if (t.id == id)
            return &t;
    return nullptr;
}

ri::touch_state const* ri::input_state::find_touch(touch_id id) const
{
    for (auto const& t : touches)
        if (t.id == id)
            return &t;
    return nullptr;
}

bool ri::input_state::operator==(input_state const& rhs) const
{
    if (touches.size() != rhs.touches.size())
        return false;
    for (size_t i = 0; i < touches.size(); ++i)
        if (!(touches[i] == rhs.touches[i]))
            return false;

    return mouse_buttons == rhs.mouse_buttons && mouse_pos == rhs.mouse_pos && capturing_mouse == rhs.capturing_mouse
           && capturing_keyboard == rhs.capturing_keyboard && modifiers == rhs.modifiers;
}
