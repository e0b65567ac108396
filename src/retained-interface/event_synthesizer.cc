#include "event_synthesizer.hh"

#include <clean-core/assert.hh>
#include <clean-core/utility.hh>

#include <rich-log/log.hh>

#include <typed-geometry/tg.hh>

void ri::event_synthesizer::push_event(raw_input const& input, clock::time_point now)
{
    // the down entry of a released button and an ending touch are gone once the raw event is folded in
    button_position down;
    if (input.type == raw_input_type::release && input.button.is_mouse())
        down = _current_state.mouse_buttons.get(input.button.mouse);

    cc::optional<touch_state> touch_before;
    if (input.is_motion(motion_type::touch))
        if (auto t = _current_state.find_touch(input.touch.id))
            touch_before = *t;

    append(event::raw(input));

    switch (input.type)
    {
    case raw_input_type::press:
        if (input.button.is_mouse())
            on_mouse_press(input.button.mouse);
        break;

    case raw_input_type::release:
        if (input.button.is_mouse())
            on_mouse_release(input.button.mouse, down, now);
        break;

    case raw_input_type::motion:
        switch (input.motion)
        {
        case motion_type::mouse_cursor:
            on_mouse_move();
            break;
        case motion_type::mouse_scroll:
        {
            scroll_event s;
            s.x = input.scroll.x;
            s.y = input.scroll.y;
            s.modifiers = _current_state.modifiers;
            append(event::scroll(s));
            break;
        }
        case motion_type::touch:
            on_touch(input.touch, touch_before.has_value() ? &touch_before.value() : nullptr, now);
            break;
        }
        break;

    case raw_input_type::text:
    case raw_input_type::focus:
    case raw_input_type::resize:
        break;
    }
}

void ri::event_synthesizer::capture_mouse(widget_id id)
{
    CC_ASSERT(id.is_valid() && "cannot capture the mouse for an invalid widget");
    move_mouse_capture(id);
}

void ri::event_synthesizer::uncapture_mouse(widget_id id)
{
    if (_current_state.capturing_mouse != id)
    {
        warn(input_error::mismatched_capture, "uncapture_mouse by a widget that does not capture the mouse", id);
        return;
    }

    append(event::uncapture_mouse(id));
}

void ri::event_synthesizer::capture_keyboard(widget_id id)
{
    CC_ASSERT(id.is_valid() && "cannot capture the keyboard for an invalid widget");
    move_keyboard_capture(id);
}

void ri::event_synthesizer::uncapture_keyboard(widget_id id)
{
    if (_current_state.capturing_keyboard != id)
    {
        warn(input_error::mismatched_capture, "uncapture_keyboard by a widget that does not capture the keyboard", id);
        return;
    }

    append(event::uncapture_keyboard(id));
}

void ri::event_synthesizer::add_widget_area(widget_id id, tg::aabb2 const& area, widget_options options)
{
    CC_ASSERT(id.is_valid() && "widget areas need a valid id");
    _widget_areas.push_back({id, area, options});
}

ri::widget_id ri::event_synthesizer::pick_widget_at(tg::pos2 p) const
{
    for (auto i = int(_widget_areas.size()) - 1; i >= 0; --i)
    {
        auto const& a = _widget_areas[i];

        if (a.options.has(widget_option::no_input))
            continue; // does not receive input

        if (contains(a.area, p))
            return a.id;
    }
    return {};
}

void ri::event_synthesizer::end_cycle()
{
    _events.clear();
    _start_state = _current_state;
}

void ri::event_synthesizer::append(ui_event e)
{
    _current_state.update(e);
    _events.push_back(cc::move(e));
}

void ri::event_synthesizer::on_mouse_press(mouse_button b)
{
    auto const pos = _current_state.mouse_pos;
    auto const under = pick_widget_at(pos);

    // update() does not know about widgets
    _current_state.mouse_buttons.press(b, pos, under);

    move_mouse_capture(under);

    if (b == mouse_button::left)
        move_keyboard_capture(accepts_keyboard(under) ? under : widget_id{});
}

void ri::event_synthesizer::on_mouse_release(mouse_button b, button_position const& down, clock::time_point now)
{
    if (!down.is_down)
    {
        _diagnostics.report(input_error::stale_release_without_press);
        LOG_WARN("[ri] {}: {} mouse button released without press", to_string(input_error::stale_release_without_press), to_string(b));
        return;
    }

    auto const pos = _current_state.mouse_pos;

    if (is_drag(down.origin, pos))
    {
        drag_event d;
        d.button = b;
        d.start = down.origin;
        d.end = pos;
        d.modifiers = _current_state.modifiers;
        d.in_progress = false;
        append(event::drag(d));
    }
    else
    {
        click_event c;
        c.button = b;
        c.location = down.origin;
        c.modifiers = _current_state.modifiers;
        append(event::click(c));

        auto const is_double = _last_click.is_valid //
                               && _last_click.click.button == b && _last_click.click.location == c.location
                               && now - _last_click.time <= double_click_threshold;
        if (is_double)
        {
            append(event::double_click(c));
            _last_click = {};
        }
        else
        {
            _last_click.is_valid = true;
            _last_click.click = c;
            _last_click.time = now;
        }
    }

    if (b == mouse_button::left)
    {
        auto const holder = _current_state.capturing_mouse;
        if (holder.is_valid() && pick_widget_at(pos) != holder)
            append(event::uncapture_mouse(holder));
    }
}

void ri::event_synthesizer::on_mouse_move()
{
    auto const pos = _current_state.mouse_pos;

    for (auto b : _current_state.mouse_buttons.pressed())
    {
        auto const origin = _current_state.mouse_buttons.get(b).origin;
        if (!is_drag(origin, pos))
            continue;

        drag_event d;
        d.button = b;
        d.start = origin;
        d.end = pos;
        d.modifiers = _current_state.modifiers;
        d.in_progress = true;
        append(event::drag(d));
    }
}

void ri::event_synthesizer::on_touch(touch_input const& t, touch_state const* before, clock::time_point now)
{
    switch (t.phase)
    {
    case touch_phase::start:
    {
        auto s = _current_state.find_touch(t.id);
        CC_ASSERT(s && "touch start was not recorded");
        s->start_time = now;
        s->widget = pick_widget_at(t.pos);
        break;
    }

    case touch_phase::move:
    case touch_phase::cancel:
        break;

    case touch_phase::end:
        if (!before)
        {
            warn(input_error::stale_release_without_press, "touch end without touch start", {});
            break;
        }

        if (distance(before->start_pos, t.pos) <= tap_threshold)
        {
            tap_event tap;
            tap.id = t.id;
            tap.location = t.pos;
            append(event::tap(tap));
        }
        break;
    }
}

void ri::event_synthesizer::move_mouse_capture(widget_id target)
{
    auto const holder = _current_state.capturing_mouse;
    if (holder == target)
        return;

    if (holder.is_valid())
        append(event::uncapture_mouse(holder));
    if (target.is_valid())
        append(event::capture_mouse(target));
}

void ri::event_synthesizer::move_keyboard_capture(widget_id target)
{
    auto const holder = _current_state.capturing_keyboard;
    if (holder == target)
        return;

    if (holder.is_valid())
        append(event::uncapture_keyboard(holder));
    if (target.is_valid())
        append(event::capture_keyboard(target));
}

bool ri::event_synthesizer::is_drag(tg::pos2 a, tg::pos2 b) const { return distance(a, b) > drag_threshold; }

bool ri::event_synthesizer::accepts_keyboard(widget_id id) const
{
    if (!id.is_valid())
        return false;

    for (auto i = int(_widget_areas.size()) - 1; i >= 0; --i)
        if (_widget_areas[i].id == id)
            return !_widget_areas[i].options.has(widget_option::no_keyboard);

    return false;
}

void ri::event_synthesizer::warn(input_error e, cc::string_view msg, widget_id id)
{
    _diagnostics.report(e);
    LOG_WARN("[ri] {}: {} (widget id {})", to_string(e), msg, id.id());
}
