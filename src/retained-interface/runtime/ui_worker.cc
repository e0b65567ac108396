#include "ui_worker.hh"

#include <clean-core/utility.hh>

ri::ui_worker::ui_worker(ui_settings const& settings, rebuild_fn rebuild) : _rebuild(cc::move(rebuild))
{
    _thread = std::thread([this, settings] { run(settings); });
}

ri::ui_worker::~ui_worker() { stop(); }

void ri::ui_worker::push_event(raw_input input)
{
    message m;
    m.input = cc::move(input);
    m.time = ui::clock::now();
    _inbox.push(cc::move(m));
}

void ri::ui_worker::request_update()
{
    message m;
    m.is_update = true;
    _inbox.push(cc::move(m));
}

void ri::ui_worker::stop()
{
    _inbox.close();
    if (_thread.joinable())
        _thread.join();
}

void ri::ui_worker::run(ui_settings settings)
{
    ui u(settings);

    while (true)
    {
        auto m = _inbox.wait_pop();
        if (!m.has_value())
            break; // closed and drained

        auto const& msg = m.value();
        if (!msg.is_update)
        {
            u.handle_event(msg.input, msg.time);
            continue;
        }

        u.update([&](ui_cell& c) { _rebuild(c); });
        ++_cycle_count;

        if (auto prims = u.draw_if_changed())
            _outbox.push(*prims);
    }

    _outbox.close();
}
