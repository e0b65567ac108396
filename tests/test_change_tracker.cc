#include <catch2/catch_test_macros.hpp>

#include <clean-core/string.hh>

#include <retained-interface/change_tracker.hh>

namespace
{
struct slider_state
{
    float value = 0;
    bool is_dragged = false;

    bool operator==(slider_state const& rhs) const { return value == rhs.value && is_dragged == rhs.is_dragged; }
};
}

TEST_CASE("widget_cached_state", "[change_tracker]")
{
    ri::widget_cached_state<int> s;

    SECTION("first update is a change")
    {
        REQUIRE(s.update([] { return 0; }));
        REQUIRE(s.dirty);
        REQUIRE(s.value == 0);
    }

    SECTION("equal values are not committed")
    {
        (void)s.update([] { return 3; });
        s.clear_dirty();

        REQUIRE(!s.update([] { return 3; }));
        REQUIRE(!s.dirty);

        REQUIRE(s.update([] { return 4; }));
        REQUIRE(s.dirty);
        REQUIRE(s.value == 4);
    }

    SECTION("compute may read the previous value")
    {
        (void)s.update([] { return 1; });
        (void)s.update([](int prev) { return prev + 1; });
        REQUIRE(s.value == 2);
    }
}

TEST_CASE("change_tracker passes", "[change_tracker]")
{
    ri::change_tracker tracker;
    auto const a = ri::widget_id::from_id(1);
    auto const b = ri::widget_id::from_id(2);

    SECTION("identical passes do not need a redraw")
    {
        tracker.begin_pass();
        tracker.update<int>(a, [] { return 5; });
        tracker.update<int>(b, [] { return 7; });
        REQUIRE(tracker.needs_redraw());

        tracker.begin_pass();
        tracker.update<int>(a, [] { return 5; });
        tracker.update<int>(b, [] { return 7; });
        REQUIRE(!tracker.needs_redraw());

        tracker.begin_pass();
        tracker.update<int>(a, [] { return 5; });
        tracker.update<int>(b, [] { return 8; });
        REQUIRE(tracker.needs_redraw());
        REQUIRE(!tracker.is_dirty(a));
        REQUIRE(tracker.is_dirty(b));
    }

    SECTION("unvisited widgets do not contribute")
    {
        tracker.begin_pass();
        tracker.update<int>(a, [] { return 1; });
        tracker.update<int>(b, [] { return 1; });

        tracker.begin_pass();
        tracker.update<int>(b, [] { return 1; });

        REQUIRE(!tracker.was_visited(a));
        REQUIRE(tracker.was_visited(b));
        REQUIRE(!tracker.needs_redraw());
        REQUIRE(tracker.visited().size() == 1);

        // state survives skipped passes
        REQUIRE(tracker.get<int>(a) != nullptr);
        REQUIRE(*tracker.get<int>(a) == 1);
    }

    SECTION("structured state")
    {
        tracker.begin_pass();
        auto const& s0 = tracker.update<slider_state>(a, [] { return slider_state{0.5f, true}; });
        REQUIRE(s0.value == 0.5f);

        tracker.begin_pass();
        tracker.update<slider_state>(a, [](slider_state const& prev) {
            auto s = prev;
            s.is_dragged = false;
            return s;
        });
        REQUIRE(tracker.needs_redraw());
        REQUIRE(!tracker.get<slider_state>(a)->is_dragged);
    }

    SECTION("changing the stored type re-initializes")
    {
        tracker.begin_pass();
        tracker.update<int>(a, [] { return 1; });

        tracker.begin_pass();
        auto const& text = tracker.update<cc::string>(a, [] { return cc::string("one"); });
        REQUIRE(text == "one");
        REQUIRE(tracker.needs_redraw());
        REQUIRE(tracker.get<int>(a) == nullptr);
        REQUIRE(tracker.tracked_count() == 1);
    }

    SECTION("states of different widgets keep their own types")
    {
        auto const c = ri::widget_id::from_id(7);

        tracker.begin_pass();
        tracker.update<cc::string>(a, [] { return cc::string("label"); });
        tracker.update<slider_state>(c, [] { return slider_state{0.5f, false}; });
        REQUIRE(tracker.tracked_count() == 2);

        // growing the entry table moves the owned states
        tracker.update<int>(ri::widget_id::from_id(100), [] { return 3; });

        REQUIRE(*tracker.get<cc::string>(a) == "label");
        REQUIRE(tracker.get<slider_state>(c)->value == 0.5f);
        REQUIRE(tracker.get<slider_state>(a) == nullptr);
        REQUIRE(tracker.get<cc::string>(c) == nullptr);
    }

    SECTION("redraw requests")
    {
        tracker.begin_pass();
        tracker.update<int>(a, [] { return 1; });
        tracker.begin_pass();
        tracker.update<int>(a, [] { return 1; });
        REQUIRE(!tracker.needs_redraw());

        tracker.request_redraw();
        REQUIRE(tracker.needs_redraw());

        // survives a pass until consumed
        tracker.begin_pass();
        REQUIRE(tracker.needs_redraw());

        REQUIRE(tracker.consume_redraw_request());
        REQUIRE(!tracker.needs_redraw());
        REQUIRE(!tracker.consume_redraw_request());
    }
}
