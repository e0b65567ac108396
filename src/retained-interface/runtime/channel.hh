#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include <clean-core/optional.hh>
#include <clean-core/utility.hh>

namespace ri
{
/// unbounded multi-producer queue for handing values to another thread
/// after close(), pushes are dropped and consumers drain what is left
template <class T>
class channel
{
public:
    channel() = default;
    channel(channel const&) = delete;
    channel& operator=(channel const&) = delete;

    /// returns false if the channel is closed
    bool push(T value)
    {
        {
            std::lock_guard lock(_mutex);
            if (_closed)
                return false;
            _queue.push_back(cc::move(value));
        }
        _condition.notify_one();
        return true;
    }

    /// non-blocking, empty if nothing is queued
    cc::optional<T> try_pop()
    {
        std::lock_guard lock(_mutex);
        return pop_front();
    }

    /// blocks until a value is available, empty once closed and drained
    cc::optional<T> wait_pop()
    {
        std::unique_lock lock(_mutex);
        _condition.wait(lock, [this] { return !_queue.empty() || _closed; });
        return pop_front();
    }

    void close()
    {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
        }
        _condition.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard lock(_mutex);
        return _closed;
    }

    size_t size() const
    {
        std::lock_guard lock(_mutex);
        return _queue.size();
    }

private:
    // requires _mutex
    cc::optional<T> pop_front()
    {
        if (_queue.empty())
            return {};
        cc::optional<T> v = cc::move(_queue.front());
        _queue.pop_front();
        return v;
    }

    mutable std::mutex _mutex;
    std::condition_variable _condition;
    std::deque<T> _queue;
    bool _closed = false;
};
}
