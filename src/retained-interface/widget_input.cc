#include "widget_input.hh"

#include <typed-geometry/tg.hh>

#include <retained-interface/detail/geometry.hh>
#include <retained-interface/event_synthesizer.hh>

ri::widget_input::widget_input(widget_id id, tg::aabb2 const& area, event_synthesizer const& input)
  : _id(id), _area(area), _origin(detail::center_of(area))
{
    // replay the cycle to know who captured what at the time of each event
    auto state = input.start_state();
    for (auto const& e : input.events())
    {
        state.update(e);
        if (should_provide(e, state))
            _events.push_back(e.relative_to(_origin));
    }

    _global_mouse_pos = input.current_state().mouse_pos;
    _state = input.current_state().relative_to(_origin);
}

bool ri::widget_input::mouse_is_over_widget() const { return contains(_area, _global_mouse_pos); }

cc::optional<tg::pos2> ri::widget_input::maybe_mouse_position() const
{
    if (!mouse_is_over_widget())
        return {};
    return _state.mouse_pos;
}

cc::optional<tg::pos2> ri::widget_input::mouse_button_down(mouse_button b) const
{
    if (!_state.mouse_buttons.is_down(b))
        return {};

    if (_state.capturing_mouse.is_valid() && _state.capturing_mouse != _id)
        return {};

    return _state.mouse_pos;
}

bool ri::widget_input::should_provide(ui_event const& e, input_state const& state) const
{
    // visible to everyone
    if (e.type == ui_event_type::scroll)
        return true;

    if (e.is_keyboard_event())
        return state.capturing_keyboard == _id;

    if (e.is_mouse_event())
    {
        if (state.capturing_mouse.is_valid())
            return state.capturing_mouse == _id;

        if (e.type == ui_event_type::drag)
            return contains(_area, e.drag.start) || contains(_area, e.drag.end);

        if (auto p = e.location(); p.has_value())
            return contains(_area, p.value());

        return contains(_area, state.mouse_pos);
    }

    return true;
}
