/**
* \file co_sync.hpp
* \author piecenet authors
* \brief Synchronization between coroutines which may run on different event loops. A waiting coroutine gives up its
loop instead of blocking the thread.
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
#include "co.hpp"
#include "execute_context.hpp"
#include "thread_pool.hpp"
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>

namespace piecenet::co
{

/// condition variable of coroutines
///\note the waiter list is guarded by the mutex passed to wait, notify with the same mutex held
class condition_t
{
    std::list<execute_context_t *> waiters;

  public:
    condition_t() = default;
    condition_t(const condition_t &) = delete;
    condition_t &operator=(const condition_t &) = delete;

    /// suspend current coroutine and unlock the mutex, the mutex is locked again when it returns.
    ///\note it may return without notify
    void wait(std::unique_lock<std::mutex> &lock);

    template <typename Pred> void wait(std::unique_lock<std::mutex> &lock, Pred pred)
    {
        while (!pred())
        {
            wait(lock);
        }
    }

    void notify_one();
    void notify_all();
};

/// mutex which suspends the coroutine instead of the thread
class mutex_t
{
    std::mutex mutex;
    condition_t cond;
    bool locked;

  public:
    mutex_t()
        : locked(false)
    {
    }

    mutex_t(const mutex_t &) = delete;
    mutex_t &operator=(const mutex_t &) = delete;

    void lock();
    void unlock();
};

/// run func in the thread pool and suspend current coroutine until it returns.
/// exceptions thrown by func are rethrown here.
///\param pool run func inline if it is nullptr
template <typename Func> auto run_blocking(thread_pool_t *pool, Func func) -> decltype(func())
{
    using result_t = decltype(func());
    if (pool == nullptr)
        return func();

    struct state_t
    {
        std::mutex mutex;
        condition_t cond;
        bool done = false;
        std::exception_ptr error;
        std::conditional_t<std::is_void_v<result_t>, bool, std::optional<result_t>> value;
    };
    auto state = std::make_shared<state_t>();

    bool committed = pool->commit([state, func]() mutable {
        std::exception_ptr error;
        try
        {
            if constexpr (std::is_void_v<result_t>)
            {
                func();
            }
            else
            {
                auto v = func();
                std::unique_lock<std::mutex> lock(state->mutex);
                state->value.emplace(std::move(v));
            }
        } catch (...)
        {
            error = std::current_exception();
        }
        std::unique_lock<std::mutex> lock(state->mutex);
        state->error = error;
        state->done = true;
        state->cond.notify_all();
    });
    if (!committed)
        return func();

    std::unique_lock<std::mutex> lock(state->mutex);
    state->cond.wait(lock, [&state]() { return state->done; });
    if (state->error)
        std::rethrow_exception(state->error);
    if constexpr (!std::is_void_v<result_t>)
        return std::move(*state->value);
}

} // namespace piecenet::co
