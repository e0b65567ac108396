#include "id_arena.hh"

#include <clean-core/assert.hh>

#include <rich-log/log.hh>

cc::optional<ri::widget_id> ri::id_arena::try_next()
{
    if (_count >= _capacity)
    {
        ++_exhausted_count;
        LOG_ERROR("[ri] widget id space exhausted after {} ids", _count);
        return {};
    }

    ++_count;
    return widget_id::from_id(_count);
}

ri::widget_id ri::id_arena::next()
{
    auto id = try_next();
    if (!id.has_value())
        return {};
    return id.value();
}

bool ri::id_list::grow_one(id_arena& arena)
{
    if (_size < _ids.size())
    {
        ++_size;
        return true;
    }

    auto id = arena.try_next();
    if (!id.has_value())
        return false;
    _ids.push_back(id.value());
    ++_size;
    return true;
}

bool ri::id_list::resize(size_t target_len, id_arena& arena)
{
    if (target_len <= _size)
    {
        _size = target_len;
        return true;
    }

    while (_size < target_len)
        if (!grow_one(arena))
            return false;
    return true;
}

ri::id_list_walk ri::id_list::walk() const { return {}; }

ri::widget_id ri::id_list_walk::next(id_list& list, id_arena& arena)
{
    if (_pos >= list._size)
    {
        CC_ASSERT(_pos == list._size && "walk ran ahead of its list");
        if (!list.grow_one(arena))
            return {};
    }

    return list._ids[_pos++];
}

ri::widget_id ri::id_registry::get_or_create_hashed(id_arena& arena, uint64_t key)
{
    if (_ids.contains_key(key))
        return _ids[key];

    auto id = arena.next();
    if (!id.is_valid())
        return id; // retried on the next visit
    _ids[key] = id;
    ++_count;
    return id;
}
