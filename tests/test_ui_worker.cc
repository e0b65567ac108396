#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <retained-interface/runtime/channel.hh>
#include <retained-interface/runtime/ui_worker.hh>

TEST_CASE("channel", "[runtime]")
{
    ri::channel<int> ch;

    SECTION("fifo")
    {
        REQUIRE(ch.push(1));
        REQUIRE(ch.push(2));
        REQUIRE(ch.size() == 2);
        REQUIRE(ch.try_pop().value() == 1);
        REQUIRE(ch.try_pop().value() == 2);
        REQUIRE(!ch.try_pop().has_value());
    }

    SECTION("close drains and then ends")
    {
        REQUIRE(ch.push(1));
        ch.close();
        REQUIRE(ch.is_closed());
        REQUIRE(!ch.push(2));
        REQUIRE(ch.wait_pop().value() == 1);
        REQUIRE(!ch.wait_pop().has_value());
    }

    SECTION("wait_pop blocks until a value arrives")
    {
        std::thread producer([&] { ch.push(42); });
        auto v = ch.wait_pop();
        producer.join();
        REQUIRE(v.has_value());
        REQUIRE(v.value() == 42);
    }
}

TEST_CASE("ui_worker", "[runtime]")
{
    tg::aabb2 const area = {{0, 0}, {20, 20}};

    // counts clicks, draws one rectangle
    ri::ui_worker worker({}, [area](ri::ui_cell& c) {
        auto id = c.make_id("button");
        auto clicked = c.input_for(id, area).mouse_left_click().has_value();
        c.update_state<int>(id, area, [&](int prev) { return clicked ? prev + 1 : prev; });
        c.draw().add_rectangle(id, area, tg::color4(1, 1, 1, 1));
    });

    SECTION("only changed cycles produce batches")
    {
        worker.request_update(); // first visit
        worker.request_update(); // unchanged

        worker.push_event(ri::mouse_cursor(10, 10));
        worker.push_event(ri::press(ri::mouse_button::left));
        worker.push_event(ri::release(ri::mouse_button::left));
        worker.request_update(); // clicked

        worker.stop();
        REQUIRE(worker.cycle_count() == 3);

        auto first = worker.wait_receive();
        REQUIRE(first.has_value());
        REQUIRE(first.value().size() == 1);

        auto second = worker.wait_receive();
        REQUIRE(second.has_value());

        REQUIRE(!worker.wait_receive().has_value());
    }

    SECTION("stopping twice is fine")
    {
        worker.stop();
        worker.stop();
        REQUIRE(!worker.try_receive().has_value());
    }
}
