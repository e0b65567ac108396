#pragma once

#include <type_traits>

#include <clean-core/span.hh>
#include <clean-core/type_id.hh>
#include <clean-core/unique_ptr.hh>
#include <clean-core/utility.hh>
#include <clean-core/vector.hh>

#include <retained-interface/detail/traits.hh>
#include <retained-interface/handles.hh>

namespace ri
{
/// common base of all cached states, lets the tracker own states of any type
struct cached_state_base
{
    cc::type_id_t type;

    explicit cached_state_base(cc::type_id_t t) : type(t) {}
    virtual ~cached_state_base() = default;

    cached_state_base(cached_state_base const&) = default;
    cached_state_base& operator=(cached_state_base const&) = default;
};

/// the previous state of a widget and whether the last update changed it
template <class T>
struct widget_cached_state : cached_state_base
{
    static_assert(detail::is_equality_comparable<T>, "cached widget state must provide operator==");

    widget_cached_state() : cached_state_base(cc::type_id<widget_cached_state<T>>()) {}

    T value = {};
    bool dirty = false;
    bool initialized = false;

    /// computes the new state and commits it if it differs from the cached one
    /// compute is called either without arguments or with the previous value
    /// returns true if the state changed
    template <class F>
    bool update(F&& compute)
    {
        auto next = invoke_compute(compute);
        if (initialized && next == value)
            return false;

        value = cc::move(next);
        initialized = true;
        dirty = true;
        return true;
    }

    void clear_dirty() { dirty = false; }

private:
    template <class F>
    T invoke_compute(F& compute) const
    {
        if constexpr (std::is_invocable_v<F&, T const&>)
            return compute(value);
        else
            return compute();
    }
};

/// per-widget cached states of one ui, keyed by widget id
///
/// a pass visits some widgets and updates their states
/// needs_redraw() is true if any widget visited in the current pass changed
/// widgets not visited in a pass keep their state but do not contribute
class change_tracker
{
public:
    /// clears visit marks and dirty flags
    void begin_pass();

    /// updates the state of a widget and marks it visited
    /// the first visit of a widget always counts as a change
    /// NOTE: the returned reference is valid until the widget is updated with a different type
    template <class T, class F>
    T const& update(widget_id id, F&& compute);

    /// the state of a widget, nullptr if it never stored a T
    template <class T>
    T const* get(widget_id id) const;

    bool was_visited(widget_id id) const;
    bool is_dirty(widget_id id) const;

    bool needs_redraw() const;

    /// forces needs_redraw() until the request is consumed
    void request_redraw() { _redraw_requested = true; }
    bool consume_redraw_request();
    bool is_redraw_requested() const { return _redraw_requested; }

    cc::span<widget_id const> visited() const { return _visited; }
    size_t tracked_count() const { return _tracked_count; }

private:
    struct entry
    {
        cc::unique_ptr<cached_state_base> state;
        bool dirty = false;
        bool visited = false;
    };

    entry& entry_for(widget_id id);
    entry const* find_entry(widget_id id) const;
    void visit(widget_id id, entry& e);
    void warn_type_change(widget_id id) const;

    // indexed by id - 1, ids are dense
    cc::vector<entry> _entries;
    cc::vector<widget_id> _visited;
    size_t _tracked_count = 0;
    bool _redraw_requested = false;
};

// ======== Implementation ========

template <class T, class F>
T const& change_tracker::update(widget_id id, F&& compute)
{
    auto& e = entry_for(id);
    visit(id, e);

    auto const type = cc::type_id<widget_cached_state<T>>();
    if (e.state.get() == nullptr)
    {
        e.state = cc::make_unique<widget_cached_state<T>>();
        ++_tracked_count;
    }
    else if (e.state->type != type)
    {
        warn_type_change(id);
        e.state = cc::make_unique<widget_cached_state<T>>();
    }

    auto& cached = static_cast<widget_cached_state<T>&>(*e.state);
    if (cached.update(compute))
        e.dirty = true;

    return cached.value;
}

template <class T>
T const* change_tracker::get(widget_id id) const
{
    auto e = find_entry(id);
    if (!e || e->state.get() == nullptr || e->state->type != cc::type_id<widget_cached_state<T>>())
        return nullptr;
    return &static_cast<widget_cached_state<T> const&>(*e->state).value;
}
}
