/**
* \file execute_context.hpp
* \author piecenet authors
* \brief The execute context binds a coroutine to an event loop. It is resumed by the dispatcher of the loop.
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
#include "timer.hpp"

namespace piecenet
{
namespace co
{
class coroutine_t;
} // namespace co

class execute_thread_dispatcher_t;
class event_loop_t;

class execute_context_t
{
    co::coroutine_t *co;
    event_loop_t *loop;
    friend class event_context_t;
    friend class execute_thread_dispatcher_t;
    timer_registered_t timer;
    /// delete itself when the coroutine finishes
    bool detached;

    /// called by the dispatcher after the coroutine returns
    void on_finish();

  public:
    /// this sleep can be interrupt by event. Check return value
    ///
    ///\param us sleep time in microsecond
    ///\return the time left, 0 when the whole span elapsed. It is greater than 0 when an event occurs during sleep
    microsecond_t sleep(microsecond_t us);
    void stop();

    void stop_for(microsecond_t us);

    event_loop_t *get_loop() const { return loop; }
    void set_loop(event_loop_t *loop) { this->loop = loop; }

    /// Rerun the coroutine and push it to the dispatcher queue
    ///\note thread-safety, call wake_up_thread after it from other threads
    void start();

    /// start coroutine and set function. Push it to dispatcher queue
    ///
    ///\param func the startup function to run.
    void run(std::function<void()> func);

    /// the coroutine is created and not finished
    bool is_running() const { return co != nullptr; }

    /// delete the context when its coroutine finishes, don't delete it by yourself after it
    void detach() { detached = true; }

    /// wake up loop to execute coroutine
    void wake_up_thread();

    /// run func in a new coroutine on loop, the context is released when func returns
    static void spawn(event_loop_t &loop, std::function<void()> func);

    /// the context of the running coroutine, nullptr outside of coroutines
    static execute_context_t *current();

    execute_context_t();
    virtual ~execute_context_t();

    execute_context_t(const execute_context_t &) = delete;
    execute_context_t &operator=(const execute_context_t &) = delete;
};

} // namespace piecenet
