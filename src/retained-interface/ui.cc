#include "ui.hh"

#include <clean-core/assert.hh>
#include <clean-core/utility.hh>

ri::ui::ui(ui_settings const& settings)
  : _ids(settings.id_capacity), _window_width(settings.window_width), _window_height(settings.window_height)
{
    _input.drag_threshold = settings.drag_threshold;
    _input.double_click_threshold = settings.double_click_threshold;
    _input.tap_threshold = settings.tap_threshold;
}

void ri::ui::handle_event(raw_input const& input, clock::time_point now)
{
    if (input.type == raw_input_type::resize)
    {
        _window_width = input.width;
        _window_height = input.height;
        _changes.request_redraw();
    }

    _input.push_event(input, now);
}

void ri::ui::update(cc::function_ref<void(ui_cell&)> do_update)
{
    _cursor = cursor_icon::arrow;
    _changes.begin_pass();
    _primitives.clear();
    _pass_areas.clear();

    ui_cell cell(*this);
    do_update(cell);

    // picking for the events of the next cycle uses this pass
    _input.set_widget_areas(cc::move(_pass_areas));
    _pass_areas = {};

    _input.end_cycle();
}

ri::primitive_list const* ri::ui::draw_if_changed()
{
    auto const changed = _changes.needs_redraw();
    _changes.consume_redraw_request();
    return changed ? &_primitives : nullptr;
}

ri::input_diagnostics ri::ui::diagnostics() const
{
    auto d = _input.diagnostics();
    if (_ids.exhausted_count() > 0)
    {
        d.allocation_exhausted += _ids.exhausted_count();
        d.last_error = input_error::allocation_exhausted;
    }
    return d;
}

void ri::ui_cell::set_area(widget_id id, tg::aabb2 const& area, widget_options options)
{
    CC_ASSERT(id.is_valid() && "widget areas need a valid id");
    _ui._pass_areas.push_back({id, area, options});
}
