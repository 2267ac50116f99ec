/**
* \file co.hpp
* \author piecenet authors
* \brief This is a encapsulation with a stackfull coroutine for the boost library. It consists of a series of coroutine
chains and runs in them.
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
#include "execute_context.hpp"
#include "net.hpp"
#include <boost/context/fiber.hpp>
#include <boost/context/fixedsize_stack.hpp>
#include <functional>
#include <optional>

namespace piecenet::co
{
namespace ctx = boost::context;

/// stack size of every coroutine
constexpr std::size_t coroutine_stack_size = 256 * 1024;

template <typename T> class async_result_t
{
    std::optional<T> value;

  public:
    async_result_t(T t)
        : value(std::move(t))
    {
    }

    async_result_t() {}
    /// get result
    ///\note undefined when task is not completed
    T operator()() { return *value; }
    bool is_finish() const { return value.has_value(); };
};

class coroutine_t;

/// the running coroutine of this thread, nullptr in the main coroutine
thread_local inline coroutine_t *co_cur = nullptr;

ctx::fiber co_wrapper(ctx::fiber &&sink, coroutine_t *co);
ctx::fiber co_reschedule_wrapper(ctx::fiber &&sink, coroutine_t *co, std::function<void()> func);

/// throw it when wants to stop coroutine
class coroutine_stop_exception
{
};

class coroutine_t
{
    /// boost fiber
    ctx::fiber context;
    /// entry function
    std::function<void()> func;
    /// previous coroutine
    /// make up a list chain
    coroutine_t *prev;
    execute_context_t *econtext;
    bool finished;

    friend ctx::fiber co_wrapper(ctx::fiber &&sink, coroutine_t *co);
    friend ctx::fiber co_reschedule_wrapper(ctx::fiber &&sink, coroutine_t *co, std::function<void()> func);

    /// Don't create in the stack
    coroutine_t(std::function<void()> f);

  public:
    coroutine_t(const coroutine_t &) = delete;
    coroutine_t &operator=(const coroutine_t &) = delete;
    /// a suspended coroutine is unwound here
    ~coroutine_t();

    static coroutine_t *create(std::function<void()> f) { return new coroutine_t(std::move(f)); }

    /// return current coroutine
    static coroutine_t *current() { return co_cur; }

    static bool in_main_coroutine() { return co_cur == nullptr; }

    static bool in_coroutine(coroutine_t *co) { return co_cur == co; }

    execute_context_t *get_execute_context() const { return econtext; }

    void set_execute_context(execute_context_t *ec) { econtext = ec; }

    bool is_finished() const { return finished; }

    /// switch to this
    void resume();

    /// switch to this and call func on the coroutine stack first
    void resume_with(std::function<void()> func);

    /// switch back to the previous coroutine
    static void yield();

    /// switch back to the previous coroutine and call func there once this coroutine is fully suspended.
    static void yield(std::function<void()> func);
};

class paramter_t
{
    /// how many times called
    int times;
    /// stop immediately because timeout
    bool stop;

  public:
    paramter_t()
        : times(0)
        , stop(false){};

    bool is_stop() const { return stop; }
    int get_times() const { return times; }
    void stop_wait() { stop = true; }
    void add_times() { times++; }
};

/// async wait
///
///\tparam func function to async wait
///\tparam args function args request
///\return return function result when async wait ok
///\note All Func with coroutine tag is not reentrant. Don't wait for function calls with the same parameters at the
/// same time.
template <typename Func, typename... Args> inline static auto await(Func func, Args &&... args)
{
    paramter_t param;
    while (1)
    {
        auto ret = func(param, std::forward<Args>(args)...);
        if (ret.is_finish())
        {
            return ret();
        }
        param.add_times();
        coroutine_t::yield();
    }
}

/// async wait timeout
///
///\tparam func function to async wait
///\tparam args function args request
///\param span microseconds for maximum timeout
///\return return function result when async wait ok
///\note func is called one more time with param.is_stop() set when the time is out, and must finish then.
template <typename Func, typename... Args>
inline static auto await_timeout(microsecond_t span, Func func, Args &&... args)
{
    paramter_t param;
    auto co = coroutine_t::current();
    while (1)
    {
        auto ret = func(param, std::forward<Args>(args)...);
        if (ret.is_finish())
        {
            return ret();
        }
        span = co->get_execute_context()->sleep(span);
        if (span == 0)
            param.stop_wait();
        param.add_times();
    }
}

} // namespace piecenet::co
