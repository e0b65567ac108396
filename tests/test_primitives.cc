#include <catch2/catch_test_macros.hpp>

#include <typed-geometry/tg.hh>

#include <retained-interface/primitives.hh>

TEST_CASE("primitive_list", "[primitives]")
{
    ri::primitive_list list;
    auto const id = ri::widget_id::from_id(1);

    list.add_rectangle(id, {{0, 0}, {10, 10}}, tg::color4(1, 0, 0, 1));
    list.add_text(id, {{0, 0}, {10, 10}}, "label", tg::color4(0, 0, 0, 1));

    REQUIRE(list.size() == 2);
    REQUIRE(list[0].kind == ri::primitive_kind::rectangle);
    REQUIRE(list[1].kind == ri::primitive_kind::text);
    REQUIRE(list[1].text == "label");
    REQUIRE(list[1].widget == id);

    auto copy = list;
    REQUIRE(copy == list);
    copy.add_rectangle(id, {{1, 1}, {2, 2}}, tg::color4(1, 1, 1, 1));
    REQUIRE(copy != list);
}

TEST_CASE("build_render_list", "[primitives]")
{
    ri::primitive_list list;
    auto const id = ri::widget_id::from_id(1);
    tg::aabb2 const clip = {{0, 0}, {100, 100}};

    SECTION("rectangles become quads")
    {
        list.add_rectangle(id, {{10, 10}, {20, 20}}, tg::color4(1, 1, 1, 1));
        list.add_rectangle(id, {{30, 30}, {40, 40}}, tg::color4(1, 1, 1, 1));

        auto rl = ri::build_render_list(list, clip);
        REQUIRE(rl.vertices.size() == 8);
        REQUIRE(rl.indices.size() == 12);
        REQUIRE(rl.cmds.size() == 1);
        REQUIRE(rl.cmds[0].indices_count == 12);
    }

    SECTION("clipping")
    {
        list.add_rectangle(id, {{90, 90}, {120, 120}}, tg::color4(1, 1, 1, 1));
        list.add_rectangle(id, {{200, 200}, {210, 210}}, tg::color4(1, 1, 1, 1));

        auto rl = ri::build_render_list(list, clip);
        REQUIRE(rl.vertices.size() == 4);
        for (auto const& v : rl.vertices)
        {
            REQUIRE(v.pos.x <= 100);
            REQUIRE(v.pos.y <= 100);
        }
    }

    SECTION("text is left to the renderer")
    {
        list.add_rectangle(id, {{10, 10}, {20, 20}}, tg::color4(1, 1, 1, 1));
        list.add_text(id, {{10, 10}, {20, 20}}, "x", tg::color4(0, 0, 0, 1));

        auto rl = ri::build_render_list(list, clip);
        REQUIRE(rl.vertices.size() == 4);
        REQUIRE(rl.text_primitives.size() == 1);
        REQUIRE(rl.text_primitives[0] == 1);
    }

    SECTION("colors are packed as rgba8")
    {
        REQUIRE(ri::to_rgba8(tg::color4(1, 0, 0, 1)) == 0xFF0000FFu);
        REQUIRE(ri::to_rgba8(tg::color4(0, 0, 0, 0)) == 0u);
    }
}
