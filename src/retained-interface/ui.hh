#pragma once

#include <chrono>
#include <cstddef>

#include <clean-core/function_ref.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/change_tracker.hh>
#include <retained-interface/diagnostics.hh>
#include <retained-interface/enums.hh>
#include <retained-interface/event_synthesizer.hh>
#include <retained-interface/fwd.hh>
#include <retained-interface/id_arena.hh>
#include <retained-interface/options.hh>
#include <retained-interface/primitives.hh>
#include <retained-interface/widget_input.hh>

namespace ri
{
struct ui_settings
{
    float window_width = 1280;
    float window_height = 720;

    float drag_threshold = 4.0f;
    std::chrono::milliseconds double_click_threshold{500};
    float tap_threshold = 4.0f;

    size_t id_capacity = id_arena::default_capacity;
};

/// a retained user interface
///
/// one cycle:
///   handle_event() for every raw device event since the last cycle
///   update() rebuilds the widget tree, widgets read their scoped input and store their state
///   draw_if_changed() yields the primitives only if some widget state actually changed
///
/// Usage:
///
///   ri::ui ui;
///   ui.handle_event(ri::press(ri::mouse_button::left));
///   ui.update([&](ri::ui_cell& c) {
///       auto id = c.make_id("counter");
///       auto area = tg::aabb2({10, 10}, {110, 40});
///       auto clicked = c.input_for(id, area).mouse_left_click().has_value();
///       auto count = c.update_state<int>(id, area, [&](int prev) { return clicked ? prev + 1 : prev; });
///       c.draw().add_rectangle(id, area, count % 2 ? tg::color4(1, 0, 0, 1) : tg::color4(0, 0, 1, 1));
///   });
///   if (auto prims = ui.draw_if_changed())
///       render(*prims);
class ui
{
public:
    using clock = event_synthesizer::clock;

    explicit ui(ui_settings const& settings = {});

    // input
public:
    void handle_event(raw_input const& input) { handle_event(input, clock::now()); }
    void handle_event(raw_input const& input, clock::time_point now);

    // update
public:
    /// runs one rebuild pass and ends the cycle
    void update(cc::function_ref<void(ui_cell&)> do_update);

    // output
public:
    /// the primitives of the last pass if any visited widget changed or a redraw was requested, nullptr otherwise
    /// consumes a pending redraw request
    primitive_list const* draw_if_changed();

    /// the primitives of the last pass, unconditionally
    primitive_list const& draw() const { return _primitives; }

    bool needs_redraw() const { return _changes.needs_redraw(); }
    void request_redraw() { _changes.request_redraw(); }

    cursor_icon cursor() const { return _cursor; }
    tg::aabb2 window_rect() const { return {{0, 0}, {_window_width, _window_height}}; }
    float window_width() const { return _window_width; }
    float window_height() const { return _window_height; }

    // access
public:
    id_arena& ids() { return _ids; }
    event_synthesizer const& input() const { return _input; }
    change_tracker const& changes() const { return _changes; }

    /// a scoped view of the input that is not yet consumed by an update
    widget_input input_for(widget_id id, tg::aabb2 const& area) const { return {id, area, _input}; }

    /// anomalies of input synthesis and id allocation
    input_diagnostics diagnostics() const;

private:
    id_arena _ids;
    id_registry _registry;
    event_synthesizer _input;
    change_tracker _changes;
    primitive_list _primitives;
    cc::vector<widget_area> _pass_areas;

    cursor_icon _cursor = cursor_icon::arrow;
    float _window_width;
    float _window_height;

    friend class ui_cell;
};

/// the interface lent to the rebuild function during ri::ui::update
class ui_cell
{
public:
    /// id bound to a call-site key, allocated on first use
    template <class... Args>
    widget_id make_id(Args const&... key)
    {
        return _ui._registry.get_or_create(_ui._ids, key...);
    }

    id_arena& ids() { return _ui._ids; }

    /// registers area as the input area of the widget for the next cycle
    /// later registrations are on top of earlier ones
    void set_area(widget_id id, tg::aabb2 const& area, widget_options options = cc::no_flags);

    /// input of this cycle as seen by the widget
    widget_input input_for(widget_id id, tg::aabb2 const& area) const { return {id, area, _ui._input}; }

    /// registers the area and updates the cached state of the widget
    template <class T, class F>
    T const& update_state(widget_id id, tg::aabb2 const& area, F&& compute, widget_options options = cc::no_flags)
    {
        set_area(id, area, options);
        return _ui._changes.update<T>(id, compute);
    }

    /// the primitive list of this pass
    primitive_list& draw() { return _ui._primitives; }

    void set_mouse_cursor(cursor_icon c) { _ui._cursor = c; }

    tg::aabb2 window_rect() const { return _ui.window_rect(); }

    // capture directives, logged like synthesized events
public:
    void capture_mouse(widget_id id) { _ui._input.capture_mouse(id); }
    void uncapture_mouse(widget_id id) { _ui._input.uncapture_mouse(id); }
    void capture_keyboard(widget_id id) { _ui._input.capture_keyboard(id); }
    void uncapture_keyboard(widget_id id) { _ui._input.uncapture_keyboard(id); }

private:
    explicit ui_cell(ui& owner) : _ui(owner) {}

    ui& _ui;

    friend class ui;
};
}
