#include "primitives.hh"

#include <clean-core/assert.hh>

#include <typed-geometry/tg.hh>

bool ri::primitive::operator==(primitive const& rhs) const
{
    return widget == rhs.widget && kind == rhs.kind && rect == rhs.rect && color == rhs.color && text == rhs.text;
}

void ri::primitive_list::add_rectangle(widget_id widget, tg::aabb2 const& rect, tg::color4 const& color)
{
    auto& p = _primitives.emplace_back();
    p.widget = widget;
    p.kind = primitive_kind::rectangle;
    p.rect = rect;
    p.color = color;
}

void ri::primitive_list::add_text(widget_id widget, tg::aabb2 const& rect, cc::string_view text, tg::color4 const& color)
{
    auto& p = _primitives.emplace_back();
    p.widget = widget;
    p.kind = primitive_kind::text;
    p.rect = rect;
    p.color = color;
    p.text = cc::string(text);
}

bool ri::primitive_list::operator==(primitive_list const& rhs) const
{
    if (_primitives.size() != rhs._primitives.size())
        return false;
    for (size_t i = 0; i < _primitives.size(); ++i)
        if (_primitives[i] != rhs._primitives[i])
            return false;
    return true;
}

uint32_t ri::to_rgba8(tg::color4 const& c)
{
    auto r = uint32_t(tg::clamp(int(256 * c.r), 0, 255));
    auto g = uint32_t(tg::clamp(int(256 * c.g), 0, 255));
    auto b = uint32_t(tg::clamp(int(256 * c.b), 0, 255));
    auto a = uint32_t(tg::clamp(int(256 * c.a), 0, 255));
    return (a << 24) | (b << 16) | (g << 8) | r;
}

namespace
{
void add_quad(ri::render_list& rl, tg::aabb2 bb, tg::color4 const& color, tg::aabb2 const& clip)
{
    auto cbb = intersection(bb, clip);
    if (!cbb.has_value())
        return; // fully clipped
    bb = cbb.value();

    if (rl.cmds.empty())
    {
        CC_ASSERT(rl.indices.empty());
        rl.cmds.emplace_back();
    }

    auto& cmd = rl.cmds.back();
    CC_ASSERT(cmd.indices_start + cmd.indices_count == rl.indices.size());

    auto const rgba = ri::to_rgba8(color);
    auto add_vertex = [&](tg::pos2 p) -> int {
        auto idx = int(rl.vertices.size());
        auto& v = rl.vertices.emplace_back();
        v.pos = p;
        v.uv = {0, 0};
        v.color = rgba;
        return idx;
    };

    auto v00 = add_vertex({bb.min.x, bb.min.y});
    auto v10 = add_vertex({bb.max.x, bb.min.y});
    auto v01 = add_vertex({bb.min.x, bb.max.y});
    auto v11 = add_vertex({bb.max.x, bb.max.y});

    rl.indices.push_back(v00);
    rl.indices.push_back(v10);
    rl.indices.push_back(v11);

    rl.indices.push_back(v00);
    rl.indices.push_back(v11);
    rl.indices.push_back(v01);

    cmd.indices_count += 6;
}
}

ri::render_list ri::build_render_list(primitive_list const& primitives, tg::aabb2 const& clip)
{
    render_list rl;
    for (auto i = 0; i < int(primitives.size()); ++i)
    {
        auto const& p = primitives[i];
        switch (p.kind)
        {
        case primitive_kind::rectangle:
            add_quad(rl, p.rect, p.color, clip);
            break;
        case primitive_kind::text:
            rl.text_primitives.push_back(i);
            break;
        }
    }
    return rl;
}
