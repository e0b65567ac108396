#include "change_tracker.hh"

#include <clean-core/assert.hh>

#include <rich-log/log.hh>

void ri::change_tracker::begin_pass()
{
    for (auto id : _visited)
    {
        auto& e = _entries[id.id() - 1];
        e.visited = false;
        e.dirty = false;
    }
    _visited.clear();
}

bool ri::change_tracker::was_visited(widget_id id) const
{
    auto e = find_entry(id);
    return e && e->visited;
}

bool ri::change_tracker::is_dirty(widget_id id) const
{
    auto e = find_entry(id);
    return e && e->dirty;
}

bool ri::change_tracker::needs_redraw() const
{
    if (_redraw_requested)
        return true;

    for (auto id : _visited)
        if (_entries[id.id() - 1].dirty)
            return true;

    return false;
}

bool ri::change_tracker::consume_redraw_request()
{
    auto const r = _redraw_requested;
    _redraw_requested = false;
    return r;
}

ri::change_tracker::entry& ri::change_tracker::entry_for(widget_id id)
{
    CC_ASSERT(id.is_valid() && "cannot track state of an invalid widget");
    if (id.id() > _entries.size())
        _entries.resize(id.id());
    return _entries[id.id() - 1];
}

ri::change_tracker::entry const* ri::change_tracker::find_entry(widget_id id) const
{
    if (!id.is_valid() || id.id() > _entries.size())
        return nullptr;
    return &_entries[id.id() - 1];
}

void ri::change_tracker::visit(widget_id id, entry& e)
{
    if (e.visited)
        return;

    e.visited = true;
    _visited.push_back(id);
}

void ri::change_tracker::warn_type_change(widget_id id) const
{
    LOG_WARN("[ri] cached state of widget changed its type, re-initializing (widget id {})", id.id());
}
