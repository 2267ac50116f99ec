#include "piecenet/co.hpp"
#include <glog/logging.h>

namespace piecenet::co
{
ctx::fiber co_wrapper(ctx::fiber &&sink, coroutine_t *co)
{
    co->context = std::move(sink);
    try
    {
        co->func();
    } catch (const coroutine_stop_exception &e)
    {
    } catch (const std::exception &e)
    {
        LOG(ERROR) << "coroutine exits with exception: " << e.what();
    }
    co->finished = true;
    co_cur = co->prev;
    return std::move(co->context);
}

ctx::fiber co_reschedule_wrapper(ctx::fiber &&sink, coroutine_t *co, std::function<void()> func)
{
    co->context = std::move(sink);
    func();
    return std::move(co->context);
}

coroutine_t::coroutine_t(std::function<void()> f)
    : context(std::allocator_arg, ctx::fixedsize_stack(coroutine_stack_size),
              std::bind(co_wrapper, std::placeholders::_1, this))
    , func(std::move(f))
    , prev(nullptr)
    , econtext(nullptr)
    , finished(false)
{
}

coroutine_t::~coroutine_t()
{
    /// unwind before the entry function is released
    context = ctx::fiber();
}

void coroutine_t::resume()
{
    if (finished)
        return;
    prev = co_cur;
    co_cur = this;
    context = std::move(context).resume();
}

void coroutine_t::resume_with(std::function<void()> func)
{
    if (finished)
        return;
    prev = co_cur;
    co_cur = this;
    context = std::move(context).resume_with(
        std::bind(co_reschedule_wrapper, std::placeholders::_1, this, std::move(func)));
}

void coroutine_t::yield()
{
    coroutine_t *cur = current();
    if (!cur)
        throw net_param_exception("yield outside of a coroutine");
    co_cur = cur->prev;
    cur->context = std::move(cur->context).resume();
}

void coroutine_t::yield(std::function<void()> func)
{
    coroutine_t *cur = current();
    if (!cur)
        throw net_param_exception("yield outside of a coroutine");
    co_cur = cur->prev;
    cur->context =
        std::move(cur->context).resume_with(std::bind(co_reschedule_wrapper, std::placeholders::_1, cur, std::move(func)));
}

} // namespace piecenet::co
