#pragma once

#include <cstddef>
#include <cstdint>

#include <clean-core/array.hh>
#include <clean-core/assert.hh>
#include <clean-core/map.hh>
#include <clean-core/optional.hh>
#include <clean-core/span.hh>
#include <clean-core/vector.hh>

#include <retained-interface/detail/hash.hh>
#include <retained-interface/handles.hh>

namespace ri
{
/// hands out widget ids in increasing order
/// ids are never reused, the counter is never rolled back
class id_arena
{
public:
    /// the full 32 bit index space
    static constexpr size_t default_capacity = size_t(uint32_t(-1));

    explicit id_arena(size_t capacity = default_capacity) : _capacity(capacity) {}

    /// allocates the next id, empty if the index space is exhausted
    cc::optional<widget_id> try_next();

    /// allocates the next id
    /// returns an invalid id if the index space is exhausted (the failure is logged and counted)
    widget_id next();

    size_t allocated_count() const { return _count; }
    size_t capacity() const { return _capacity; }
    bool is_exhausted() const { return _count >= _capacity; }

    /// number of failed allocations so far
    int exhausted_count() const { return _exhausted_count; }

private:
    size_t _capacity;
    size_t _count = 0;
    int _exhausted_count = 0;
};

class id_list_walk;

/// a growable ordered sequence of ids, e.g. one id per item of a list widget
/// growing only allocates ids for slots that never existed before
/// shrinking truncates but remembers the ids, so regrowing restores them
class id_list
{
public:
    /// grows or truncates to exactly target_len ids
    /// returns false if the arena ran out of ids before target_len was reached
    bool resize(size_t target_len, id_arena& arena);

    size_t size() const { return _size; }
    bool empty() const { return _size == 0; }

    /// number of ids ever allocated for this list (high-water mark)
    size_t reserved() const { return _ids.size(); }

    widget_id operator[](size_t i) const
    {
        CC_ASSERT(i < _size && "id list index out of bounds");
        return _ids[i];
    }

    cc::span<widget_id const> ids() const { return {_ids.data(), _size}; }

    widget_id const* begin() const { return _ids.data(); }
    widget_id const* end() const { return _ids.data() + _size; }

    id_list_walk walk() const;

private:
    /// grows the logical size by one, reusing a remembered id if there is one
    bool grow_one(id_arena& arena);

    cc::vector<widget_id> _ids; // backing storage, may hold more than _size ids
    size_t _size = 0;

    friend class id_list_walk;
};

/// forward-only cursor over an id_list
/// grows the list by at most one id per next() call
class id_list_walk
{
public:
    widget_id next(id_list& list, id_arena& arena);

    size_t position() const { return _pos; }

private:
    size_t _pos = 0;
};

/// a fixed bundle of N ids allocated up front, e.g. for the parts of a composite widget
template <size_t N>
class widget_ids
{
public:
    explicit widget_ids(id_arena& arena)
    {
        for (auto& id : _ids)
            id = arena.next();
    }

    widget_id operator[](size_t i) const
    {
        CC_ASSERT(i < N && "widget id index out of bounds");
        return _ids[i];
    }

    static constexpr size_t size() { return N; }

    widget_id const* begin() const { return _ids.begin(); }
    widget_id const* end() const { return _ids.end(); }

private:
    cc::array<widget_id, N> _ids;
};

/// remembers which id belongs to which call site
/// the first visit of a call-site key allocates, later visits return the same id
class id_registry
{
public:
    template <class... Args>
    widget_id get_or_create(id_arena& arena, Args const&... key)
    {
        return get_or_create_hashed(arena, detail::make_hash(0x5249, key...));
    }

    widget_id get_or_create_hashed(id_arena& arena, uint64_t key);

    bool contains(uint64_t key) const { return _ids.contains_key(key); }
    size_t size() const { return _count; }

private:
    cc::map<uint64_t, widget_id> _ids;
    size_t _count = 0;
};
}
