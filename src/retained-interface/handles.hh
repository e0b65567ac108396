#pragma once

#include <cstddef>
#include <cstdint>

#include <clean-core/fwd.hh>

#include <retained-interface/detail/hash.hh>

namespace ri
{
/// stable identity of one widget instance across update cycles
/// ids are handed out by ri::id_arena and never reused within a session
/// NOTE: every cross-widget reference (capture owner, press owner, touch owner) is a widget_id, never a pointer
struct widget_id
{
    widget_id() = default;

    bool is_valid() const { return _id > 0; }
    size_t id() const { return _id; }

    bool operator==(widget_id h) const { return _id == h._id; }
    bool operator!=(widget_id h) const { return _id != h._id; }
    bool operator<(widget_id h) const { return _id < h._id; }

    static widget_id from_id(size_t id) { return widget_id(id); }

private:
    explicit widget_id(size_t id) : _id(id) {}

    size_t _id = 0;
};

/// identifies one finger for the lifetime of a touch
using touch_id = uint64_t;
}

template <>
struct cc::hash<ri::widget_id>
{
    [[nodiscard]] hash_t operator()(ri::widget_id const& value) const noexcept { return value.id(); }
};
