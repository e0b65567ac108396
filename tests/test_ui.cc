#include <catch2/catch_test_macros.hpp>

#include <clean-core/string_view.hh>

#include <retained-interface/ui.hh>

namespace
{
tg::aabb2 const button_area = {{10, 10}, {110, 40}};
tg::aabb2 const field_area = {{10, 50}, {110, 80}};

// a minimal counter button: counts left clicks
int counter_button(ri::ui_cell& c)
{
    auto const id = c.make_id("counter");
    auto const clicked = c.input_for(id, button_area).mouse_left_click().has_value();
    auto const count = c.update_state<int>(id, button_area, [&](int prev) { return clicked ? prev + 1 : prev; });
    c.draw().add_rectangle(id, button_area, count % 2 ? tg::color4(1, 0, 0, 1) : tg::color4(0, 0, 1, 1));
    return count;
}

void click_at(ri::ui& ui, float x, float y)
{
    ui.handle_event(ri::mouse_cursor(x, y));
    ui.handle_event(ri::press(ri::mouse_button::left));
    ui.handle_event(ri::release(ri::mouse_button::left));
}
}

TEST_CASE("ui draw_if_changed", "[ui]")
{
    ri::ui ui;
    int count = -1;
    auto rebuild = [&](ri::ui_cell& c) { count = counter_button(c); };

    SECTION("first pass draws")
    {
        ui.update(rebuild);
        auto prims = ui.draw_if_changed();
        REQUIRE(prims != nullptr);
        REQUIRE(prims->size() == 1);
    }

    SECTION("identical passes do not draw")
    {
        ui.update(rebuild);
        (void)ui.draw_if_changed();

        ui.update(rebuild);
        REQUIRE(ui.draw_if_changed() == nullptr);

        ui.update(rebuild);
        REQUIRE(ui.draw_if_changed() == nullptr);
        REQUIRE(!ui.needs_redraw());

        // primitives stay accessible
        REQUIRE(ui.draw().size() == 1);
    }

    SECTION("a click changes the state and draws")
    {
        ui.update(rebuild);
        (void)ui.draw_if_changed();

        click_at(ui, 50, 20);
        ui.update(rebuild);
        REQUIRE(count == 1);
        REQUIRE(ui.draw_if_changed() != nullptr);

        ui.update(rebuild);
        REQUIRE(count == 1);
        REQUIRE(ui.draw_if_changed() == nullptr);
    }

    SECTION("clicks elsewhere change nothing")
    {
        ui.update(rebuild);
        (void)ui.draw_if_changed();

        click_at(ui, 500, 500);
        ui.update(rebuild);
        REQUIRE(count == 0);
        REQUIRE(ui.draw_if_changed() == nullptr);
    }

    SECTION("resize forces a redraw once")
    {
        ui.update(rebuild);
        (void)ui.draw_if_changed();

        ui.handle_event(ri::resize(800, 600));
        REQUIRE(ui.window_width() == 800);
        REQUIRE(ui.window_height() == 600);

        ui.update(rebuild);
        REQUIRE(ui.draw_if_changed() != nullptr);

        ui.update(rebuild);
        REQUIRE(ui.draw_if_changed() == nullptr);
    }
}

TEST_CASE("ui cycle", "[ui]")
{
    ri::ui ui;

    SECTION("ids are stable across passes")
    {
        ri::widget_id first;
        ri::widget_id second;
        ui.update([&](ri::ui_cell& c) { first = c.make_id("w"); });
        ui.update([&](ri::ui_cell& c) { second = c.make_id("w"); });

        REQUIRE(first.is_valid());
        REQUIRE(first == second);
        REQUIRE(ui.ids().allocated_count() == 1);
    }

    SECTION("the cursor hint is reset every pass")
    {
        ui.update([](ri::ui_cell& c) { c.set_mouse_cursor(ri::cursor_icon::hand); });
        REQUIRE(ui.cursor() == ri::cursor_icon::hand);
        REQUIRE(ri::to_string(ui.cursor()) == cc::string_view("hand"));

        ui.update([](ri::ui_cell&) {});
        REQUIRE(ui.cursor() == ri::cursor_icon::arrow);
    }

    SECTION("the log is consumed by the update")
    {
        ui.handle_event(ri::mouse_cursor(1, 1));
        REQUIRE(ui.input().events().size() == 1);

        ui.update([](ri::ui_cell&) {});
        REQUIRE(ui.input().events().empty());
        REQUIRE(ui.input().start_state().mouse_pos == tg::pos2(1, 1));
    }

    SECTION("areas of a pass are used for picking in the next cycle")
    {
        ri::widget_id button;
        ri::widget_id field;
        auto rebuild = [&](ri::ui_cell& c) {
            button = c.make_id("button");
            field = c.make_id("field");
            c.set_area(button, button_area);
            c.set_area(field, field_area);
        };

        ui.update(rebuild);
        REQUIRE(ui.input().widget_areas().size() == 2);

        ui.handle_event(ri::mouse_cursor(50, 60));
        ui.handle_event(ri::press(ri::mouse_button::left));
        REQUIRE(ui.input().capturing_mouse() == field);
        REQUIRE(ui.input().capturing_keyboard() == field);

        ui.handle_event(ri::release(ri::mouse_button::left));
        ui.update(rebuild);

        // capture survives the cycle
        REQUIRE(ui.input().capturing_keyboard() == field);
    }

    SECTION("capture directives of a pass are seen by later widgets")
    {
        ri::widget_id field;
        bool captured = false;
        ui.update([&](ri::ui_cell& c) {
            field = c.make_id("field");
            c.capture_keyboard(field);
            captured = c.input_for(field, field_area).is_capturing_keyboard();
        });

        REQUIRE(captured);
        REQUIRE(ui.input().capturing_keyboard() == field);

        ui.handle_event(ri::text_input("abc"));
        cc::string text;
        ui.update([&](ri::ui_cell& c) { text = c.input_for(field, field_area).text_just_entered(); });
        REQUIRE(text == "abc");
    }

    SECTION("diagnostics are collected")
    {
        ui.handle_event(ri::release(ri::mouse_button::left));
        ui.update([](ri::ui_cell& c) { c.uncapture_mouse(c.make_id("nobody")); });

        auto d = ui.diagnostics();
        REQUIRE(d.stale_release_without_press == 1);
        REQUIRE(d.mismatched_capture == 1);
        REQUIRE(d.total() == 2);
    }

    SECTION("id exhaustion shows up in diagnostics")
    {
        ri::ui_settings settings;
        settings.id_capacity = 1;
        ri::ui small(settings);

        (void)small.ids().next();
        REQUIRE(!small.ids().try_next().has_value());
        REQUIRE(small.diagnostics().allocation_exhausted == 1);
        REQUIRE(small.diagnostics().last_error == ri::input_error::allocation_exhausted);
    }
}
