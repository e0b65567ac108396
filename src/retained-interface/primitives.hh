#pragma once

#include <cstdint>

#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/string_view.hh>
#include <clean-core/vector.hh>

#include <typed-geometry/tg-lean.hh>

#include <retained-interface/handles.hh>

namespace ri
{
enum class primitive_kind : uint8_t
{
    rectangle,
    text,
};

/// one drawing primitive emitted by a widget
/// rect is in window coordinates, for text it is the layout box of the string
struct primitive
{
    widget_id widget;
    primitive_kind kind = primitive_kind::rectangle;
    tg::aabb2 rect;
    tg::color4 color;
    cc::string text;

    bool operator==(primitive const& rhs) const;
    bool operator!=(primitive const& rhs) const { return !operator==(rhs); }
};

/// the primitives of one pass, back to front
class primitive_list
{
public:
    void add_rectangle(widget_id widget, tg::aabb2 const& rect, tg::color4 const& color);
    void add_text(widget_id widget, tg::aabb2 const& rect, cc::string_view text, tg::color4 const& color);

    void clear() { _primitives.clear(); }

    size_t size() const { return _primitives.size(); }
    bool empty() const { return _primitives.empty(); }

    primitive const& operator[](size_t i) const { return _primitives[i]; }
    primitive const* begin() const { return _primitives.begin(); }
    primitive const* end() const { return _primitives.end(); }

    cc::span<primitive const> primitives() const { return _primitives; }

    bool operator==(primitive_list const& rhs) const;
    bool operator!=(primitive_list const& rhs) const { return !operator==(rhs); }

private:
    cc::vector<primitive> _primitives;
};

/// gpu friendly triangle data for the rectangles of a primitive_list
struct render_list
{
    struct vertex
    {
        tg::pos2 pos; // in pixels
        tg::pos2 uv;
        uint32_t color = 0xFFFFFFFF;
    };
    struct draw_cmd
    {
        uint64_t texture_handle = 0;
        uint32_t indices_start = 0;
        uint32_t indices_count = 0;
    };

    cc::vector<vertex> vertices;
    cc::vector<int> indices;
    cc::vector<draw_cmd> cmds;

    /// indices into the primitive list of text primitives
    /// NOTE: text is shaped by the renderer
    cc::vector<int> text_primitives;
};

/// tessellates all rectangles into quads clipped against clip
render_list build_render_list(primitive_list const& primitives, tg::aabb2 const& clip);

/// packs a color into 0xAABBGGRR
uint32_t to_rgba8(tg::color4 const& c);
}
