#include "piecenet/event.hpp"
#include "piecenet/co.hpp"
#include "piecenet/epoll.hpp"
#include "piecenet/execute_context.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace piecenet
{
thread_local event_loop_t *thread_in_loop = nullptr;

event_loop_t::event_loop_t(microsecond_t precision)
    : is_exit(false)
    , has_wake_up(false)
    , exit_code(0)
    , context(nullptr)
{
    time_manager = std::make_unique<time_manager_t>(precision);
    thread_in_loop = this;
}

event_loop_t::~event_loop_t()
{
    if (thread_in_loop == this)
        thread_in_loop = nullptr;
}

void event_loop_t::set_demuxer(std::unique_ptr<event_demultiplexer> demuxer) { this->demuxer = std::move(demuxer); }

void event_loop_t::add_event_handler(handle_t handle, event_handler_t *handler)
{
    lock::lock_guard g(lock);
    event_map[handle] = handler;
}

void event_loop_t::remove_event_handler(handle_t handle, event_handler_t *handler)
{
    unlink(handle, event_type::error | event_type::writable | event_type::readable);

    lock::lock_guard g(lock);
    auto it = event_map.find(handle);
    if (it != event_map.end() && it->second == handler)
        event_map.erase(it);
}

event_loop_t &event_loop_t::link(handle_t handle, event_type_t type)
{
    demuxer->add(handle, type);
    return *this;
}

event_loop_t &event_loop_t::unlink(handle_t handle, event_type_t type)
{
    demuxer->remove(handle, type);
    return *this;
}

int event_loop_t::run()
{
    event_type_t type;
    while (!is_exit)
    {
        /// wake ups after this point interrupt the next select
        has_wake_up = false;
        microsecond_t cur_time = get_current_time();
        if (cur_time >= time_manager->next_tick_timepoint())
        {
            time_manager->tick();
        }
        dispatcher.dispatch();

        if (is_exit)
            break;

        microsecond_t timeout;
        if (!dispatcher.empty())
        {
            timeout = 0;
        }
        else
        {
            auto next = time_manager->next_tick_timepoint();
            cur_time = get_current_time();
            if (next == make_timespan_full())
                timeout = make_timespan_full();
            else if (next > cur_time)
                timeout = next - cur_time;
            else
                timeout = 0;
        }

        type = 0;
        auto handle = demuxer->select(&type, &timeout);
        if (handle > 0)
        {
            event_handler_t *handler;
            {
                lock::lock_guard g(lock);
                auto ev_it = event_map.find(handle);
                if (ev_it == event_map.end())
                {
                    continue;
                }
                handler = ev_it->second;
            }
            handler->on_event(*context, type);
        }
    }
    return exit_code;
}

void event_loop_t::exit(int code)
{
    exit_code = code;
    is_exit = true;
    demuxer->wake_up();
}

void event_loop_t::wake_up()
{
    /// no need for wake in current thread
    if (this == thread_in_loop)
        return;
    if (!has_wake_up.exchange(true))
        demuxer->wake_up();
}

int event_loop_t::load_factor()
{
    lock::lock_guard g(lock);
    return (int)event_map.size();
}

event_loop_t &event_loop_t::current() { return *thread_in_loop; }

event_loop_t *event_loop_t::current_or_null() { return thread_in_loop; }

timer_registered_t event_loop_t::add_timer(timer_t timer) { return time_manager->insert(std::move(timer)); }

void event_loop_t::remove_timer(timer_registered_t reg) { time_manager->cancel(reg); }

execute_thread_dispatcher_t &event_loop_t::get_dispatcher() { return dispatcher; }

event_loop_t &event_context_t::select_loop()
{
    /// get minimum workload loop
    event_loop_t *min_load_loop;
    {
        std::shared_lock<std::shared_mutex> lock(loop_mutex);
        if (loops.empty())
            throw net_param_exception("event context has no loop");
        min_load_loop = loops[0];
        int min_fac = min_load_loop->load_factor();
        for (auto loop : loops)
        {
            int fac = loop->load_factor();
            if (fac < min_fac)
            {
                min_fac = fac;
                min_load_loop = loop;
            }
        }
    }

    return *min_load_loop;
}

void event_context_t::do_init()
{
    if (thread_in_loop != nullptr || exit)
        return;

    std::unique_ptr<event_demultiplexer> demuxer;
    if (strategy == event_strategy::AUTO)
    {
        strategy = event_strategy::epoll;
    }
    switch (strategy)
    {
        case event_strategy::epoll:
            demuxer = std::make_unique<event_epoll_demultiplexer>();
            break;
        default:
            throw std::invalid_argument("invalid strategy " + std::to_string(strategy));
    }

    auto loop = new event_loop_t(precision);
    loop->set_context(this);
    loop->set_demuxer(std::move(demuxer));

    std::unique_lock<std::shared_mutex> lock(loop_mutex);
    loops.push_back(loop);
    loop_counter++;
    VLOG(1) << "event loop " << loops.size() << " is ready";
}

event_context_t::event_context_t(event_strategy strategy, microsecond_t precision)
    : strategy(strategy)
    , loop_counter(0)
    , precision(precision)
    , exit(false)
{
    do_init();
}

int event_context_t::run()
{
    do_init();
    if (thread_in_loop == nullptr)
        return 0;

    int code = thread_in_loop->run();

    loop_counter--;
    std::unique_lock<std::mutex> lock(exit_mutex);
    cond.notify_all();
    cond.wait(lock, [this]() { return loop_counter == 0; });

    return code;
}

void event_context_t::exit_all(int code)
{
    exit = true;
    std::shared_lock<std::shared_mutex> lock(loop_mutex);
    for (auto &loop : loops)
    {
        loop->exit(code);
    }
}

event_context_t::~event_context_t()
{
    std::unique_lock<std::shared_mutex> lock(loop_mutex);
    for (auto loop : loops)
    {
        delete loop;
    }
}

} // namespace piecenet
