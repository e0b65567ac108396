#pragma once

#include <thread>

#include <clean-core/unique_function.hh>
#include <clean-core/optional.hh>

#include <retained-interface/primitives.hh>
#include <retained-interface/raw_input.hh>
#include <retained-interface/runtime/channel.hh>
#include <retained-interface/ui.hh>

namespace ri
{
/// runs a ri::ui on its own thread
///
/// the host pushes raw events and update requests
/// the worker answers each update that changed something with a copy of the primitives
/// the ui itself is only ever touched by the worker thread
///
/// Usage:
///
///   ri::ui_worker worker({}, [](ri::ui_cell& c) { ... });
///   worker.push_event(ri::mouse_cursor(10, 10));
///   worker.request_update();
///   if (auto prims = worker.wait_receive())
///       render(prims.value());
class ui_worker
{
public:
    using rebuild_fn = cc::unique_function<void(ui_cell&)>;

    ui_worker(ui_settings const& settings, rebuild_fn rebuild);
    ~ui_worker();

    ui_worker(ui_worker const&) = delete;
    ui_worker& operator=(ui_worker const&) = delete;

    void push_event(raw_input input);
    /// runs one update cycle on the worker after all previously pushed events
    void request_update();

    /// the next batch of changed primitives, if one arrived
    cc::optional<primitive_list> try_receive() { return _outbox.try_pop(); }
    /// blocks until the next batch, empty once the worker stopped and everything was received
    cc::optional<primitive_list> wait_receive() { return _outbox.wait_pop(); }

    /// finishes all pushed messages and joins the worker
    void stop();

    /// number of update cycles run so far, only valid after stop()
    int cycle_count() const { return _cycle_count; }

private:
    struct message
    {
        bool is_update = false;
        raw_input input;
        ui::clock::time_point time;
    };

    void run(ui_settings settings);

    channel<message> _inbox;
    channel<primitive_list> _outbox;
    rebuild_fn _rebuild;
    int _cycle_count = 0;

    std::thread _thread;
};
}
