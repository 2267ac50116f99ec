/**
* \file event.hpp
* \author piecenet authors
* \brief The event loop and the event context. Every thread runs a loop which waits on a demultiplexer, runs timers and
dispatches coroutines.
* \version 0.1
* \date 2026-10-18
*
* @copyright Copyright (c) 2026.
This file is part of piecenet.

piecenet is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as
published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

piecenet is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with piecenet. If not, see <http: //www.gnu.org/licenses/>.
*
*/

#pragma once
#include "execute_dispatcher.hpp"
#include "lock.hpp"
#include "net.hpp"
#include "timer.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace piecenet
{

using event_type_t = unsigned long;

using handle_t = int;

namespace event_type
{
enum : event_type_t
{
    readable = 1,
    writable = 2,
    error = 4,
};
};

class socket_t;
class event_context_t;
class event_loop_t;
class execute_context_t;

enum event_strategy
{
    epoll,
    AUTO,
};

/// readiness source of a loop, used by the thread of the loop except wake_up
class event_demultiplexer
{
  public:
    /// watch type on handle, watching a type twice is harmless
    virtual void add(handle_t handle, event_type_t type) = 0;

    /// wait for one ready handle
    ///\param type set to the ready types
    ///\param timeout make_timespan_full() waits forever
    ///\return 0 on timeout, wake up or interrupt
    virtual handle_t select(event_type_t *type, microsecond_t *timeout) = 0;

    virtual void remove(handle_t handle, event_type_t type) = 0;

    /// interrupt select from any thread
    virtual void wake_up() = 0;

    virtual ~event_demultiplexer(){};
};

class event_handler_t
{
  public:
    virtual void on_event(event_context_t &, event_type_t) = 0;
    virtual ~event_handler_t(){};
};

/// One loop per thread. It routes ready handles to their handlers, fires timers and resumes the coroutines queued by
/// other threads.
///\note loops are created by event_context_t
class event_loop_t
{
  private:
    using event_handle_map_t = std::unordered_map<handle_t, event_handler_t *>;
    friend class event_context_t;

    std::atomic_bool is_exit;
    std::atomic_bool has_wake_up;
    int exit_code;

    std::unique_ptr<event_demultiplexer> demuxer;
    event_handle_map_t event_map;
    /// guards event_map
    lock::spinlock_t lock;

    event_context_t *context;
    std::unique_ptr<time_manager_t> time_manager;

    execute_thread_dispatcher_t dispatcher;

  private:
    void set_demuxer(std::unique_ptr<event_demultiplexer> demuxer);
    void set_context(event_context_t *context) { this->context = context; }

    /// until exit is called
    int run();

  public:
    event_loop_t(microsecond_t precision);
    ~event_loop_t();

    event_loop_t(const event_loop_t &) = delete;
    event_loop_t &operator=(const event_loop_t &) = delete;

    ///\note thread-safety
    void exit(int code);
    /// handlers registered, select_loop picks the lowest
    int load_factor();

    event_loop_t &link(handle_t handle, event_type_t type);
    event_loop_t &unlink(handle_t handle, event_type_t type);

    ///\note thread-safety
    void add_event_handler(handle_t handle, event_handler_t *handler);
    void remove_event_handler(handle_t handle, event_handler_t *handler);

    ///\note call it in the thread of loop
    timer_registered_t add_timer(timer_t timer);
    void remove_timer(timer_registered_t);

    execute_thread_dispatcher_t &get_dispatcher();

    event_context_t &get_context() const { return *context; }

    /// the loop of this thread, it must exist
    static event_loop_t &current();

    /// the loop of this thread or nullptr
    static event_loop_t *current_or_null();

    /// interrupt a sleeping select, thread-safety
    void wake_up();
};

/// Owns the loops. Each thread calling run() adds its loop to the pool of workers.
class event_context_t
{
    event_strategy strategy;

    std::shared_mutex loop_mutex;
    std::vector<event_loop_t *> loops;

    /// the destructor waits on it for the loops to end
    std::mutex exit_mutex;
    std::condition_variable cond;
    std::atomic_int loop_counter;

    microsecond_t precision;
    std::atomic_bool exit;

    /// create the loop of this thread once
    void do_init();

  public:
    event_context_t(event_strategy strategy, microsecond_t precision = timer_min_precision);
    /// wait for the running loops to end and delete them
    ~event_context_t();

    event_context_t(const event_context_t &) = delete;
    event_context_t &operator=(const event_context_t &) = delete;

    /// the loop with the fewest handlers
    event_loop_t &select_loop();

    /// ask every loop to exit with code, it returns immediately
    void exit_all(int code);
    /// run the loop of this thread, the return value is the code of exit_all
    int run();
};

} // namespace piecenet
