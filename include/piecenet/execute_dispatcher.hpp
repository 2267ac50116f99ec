/**
* \file execute_dispatcher.hpp
* \author piecenet authors
* \brief The queue of execute contexts waiting to be resumed by an event loop.
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
#include "lock.hpp"
#include <deque>
#include <functional>
#include <utility>

namespace piecenet
{
class execute_context_t;

class execute_thread_dispatcher_t
{
    std::deque<std::pair<execute_context_t *, std::function<void()>>> co_wait_for_resume;
    lock::spinlock_t lock;

  public:
    /// Not thread-safe and must be called by the event loop to execute the execute context in the queue.
    ///\note this function is called automatically in event loop. Contexts queued while dispatching run in the next
    /// round.
    void dispatch();

    /// Thread-safe functions. Drop all queued resumes of an execute context
    void cancel(execute_context_t *econtext);
    /// Thread-safe functions. Add an execute context to the queue and set the wakeup function to execute
    void add(execute_context_t *econtext, std::function<void()> func);

    bool empty();
};
} // namespace piecenet
