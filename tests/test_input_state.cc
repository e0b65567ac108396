#include <catch2/catch_test_macros.hpp>

#include <retained-interface/input_state.hh>
#include <retained-interface/ui_event.hh>

TEST_CASE("input_state relative_to", "[input_state]")
{
    ri::input_state s;
    s.mouse_pos = {50, -10};
    s.mouse_buttons.press(ri::mouse_button::middle, {-20, -10});

    SECTION("translates mouse and button origins")
    {
        auto r = s.relative_to({20, 20});
        REQUIRE(r.mouse_pos == tg::pos2(30, -30));
        REQUIRE(r.mouse_buttons.is_down(ri::mouse_button::middle));
        REQUIRE(r.mouse_buttons.get(ri::mouse_button::middle).origin == tg::pos2(-40, -30));
    }

    SECTION("composes additively")
    {
        auto ab = s.relative_to({20, 20}).relative_to({5, -3});
        auto sum = s.relative_to({25, 17});
        REQUIRE(ab == sum);
    }

    SECTION("does not mutate the original")
    {
        (void)s.relative_to({20, 20});
        REQUIRE(s.mouse_pos == tg::pos2(50, -10));
    }
}

TEST_CASE("input_state update", "[input_state]")
{
    ri::input_state s;

    SECTION("mouse buttons")
    {
        s.update(ri::event::raw(ri::mouse_cursor(3, 4)));
        s.update(ri::event::raw(ri::press(ri::mouse_button::left)));
        REQUIRE(s.mouse_buttons.is_down(ri::mouse_button::left));
        REQUIRE(s.mouse_buttons[ri::mouse_button::left].origin == tg::pos2(3, 4));

        auto pressed = s.mouse_buttons.pressed();
        REQUIRE(pressed.size() == 1);
        REQUIRE(pressed[0] == ri::mouse_button::left);

        s.update(ri::event::raw(ri::release(ri::mouse_button::left)));
        REQUIRE(!s.mouse_buttons.is_down(ri::mouse_button::left));
    }

    SECTION("modifier sides are independent")
    {
        s.update(ri::event::raw(ri::press(ri::key::ctrl_left)));
        s.update(ri::event::raw(ri::press(ri::key::ctrl_right)));
        REQUIRE(s.is_ctrl_down());

        s.update(ri::event::raw(ri::release(ri::key::ctrl_left)));
        REQUIRE(s.is_ctrl_down());
        REQUIRE(s.modifiers.has(ri::modifier_key::ctrl_right));
        REQUIRE(!s.modifiers.has(ri::modifier_key::ctrl_left));

        s.update(ri::event::raw(ri::release(ri::key::ctrl_right)));
        REQUIRE(!s.is_ctrl_down());
    }

    SECTION("non-modifier keys leave modifiers alone")
    {
        s.update(ri::event::raw(ri::press(ri::key::a)));
        REQUIRE(!s.is_ctrl_down());
        REQUIRE(!s.is_shift_down());
        REQUIRE(!s.is_alt_down());
        REQUIRE(!s.is_gui_down());
    }

    SECTION("capture transitions")
    {
        auto a = ri::widget_id::from_id(1);
        auto b = ri::widget_id::from_id(2);

        s.update(ri::event::capture_mouse(a));
        REQUIRE(s.capturing_mouse == a);

        // an uncapture by someone else does not clear the capture
        s.update(ri::event::uncapture_mouse(b));
        REQUIRE(s.capturing_mouse == a);

        s.update(ri::event::uncapture_mouse(a));
        REQUIRE(!s.capturing_mouse.is_valid());

        s.update(ri::event::capture_keyboard(b));
        REQUIRE(s.capturing_keyboard == b);
        REQUIRE(!s.capturing_mouse.is_valid());
    }

    SECTION("touches")
    {
        s.update(ri::event::raw(ri::touch(ri::touch_phase::start, 7, {1, 1})));
        REQUIRE(s.touches.size() == 1);

        s.update(ri::event::raw(ri::touch(ri::touch_phase::move, 7, {2, 3})));
        REQUIRE(s.find_touch(7) != nullptr);
        REQUIRE(s.find_touch(7)->last_pos == tg::pos2(2, 3));
        REQUIRE(s.find_touch(7)->start_pos == tg::pos2(1, 1));

        s.update(ri::event::raw(ri::touch(ri::touch_phase::end, 7, {2, 3})));
        REQUIRE(s.touches.empty());
    }
}
