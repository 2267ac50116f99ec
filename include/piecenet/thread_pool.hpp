/**
* \file thread_pool.hpp
* \author piecenet authors
* \brief Fixed size thread pool. The content store runs its blocking file reads here.
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
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace piecenet
{

class thread_pool_t
{
  private:
    std::vector<std::thread> threads;
    mutable std::mutex mutex;
    std::condition_variable cond;
    std::queue<std::function<void()>> tasks;
    // exit flag
    bool exit;
    void wrapper();

  public:
    ///\param count thread count in pool
    explicit thread_pool_t(int count);

    thread_pool_t(const thread_pool_t &) = delete;
    thread_pool_t &operator=(const thread_pool_t &) = delete;

    ///\note queued tasks are finished and all threads are joined here
    ~thread_pool_t();

    /// commit a task to thread pool
    ///
    ///\param task to run
    ///\return false when the pool is exiting and the task is dropped
    bool commit(std::function<void()> task);

    /// return true if there are no tasks in task queue.
    bool empty() const;

    int size() const { return (int)threads.size(); }
};

} // namespace piecenet
