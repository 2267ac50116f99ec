#include "piecenet/co_sync.hpp"
#include "piecenet/execute_context.hpp"
#include <algorithm>

namespace piecenet::co
{

void condition_t::wait(std::unique_lock<std::mutex> &lock)
{
    auto ctx = execute_context_t::current();
    if (ctx == nullptr)
        throw net_param_exception("wait on condition outside of a coroutine");

    waiters.push_back(ctx);
    auto mutex = lock.release();
    /// unlock after this coroutine is suspended, a notifier from other thread can't resume it earlier
    coroutine_t::yield([mutex]() { mutex->unlock(); });
    lock = std::unique_lock<std::mutex>(*mutex);

    auto it = std::find(waiters.begin(), waiters.end(), ctx);
    if (it != waiters.end())
        waiters.erase(it);
}

void condition_t::notify_one()
{
    if (waiters.empty())
        return;
    auto ctx = waiters.front();
    waiters.pop_front();
    ctx->start();
    ctx->wake_up_thread();
}

void condition_t::notify_all()
{
    while (!waiters.empty())
    {
        notify_one();
    }
}

void mutex_t::lock()
{
    std::unique_lock<std::mutex> lock(mutex);
    cond.wait(lock, [this]() { return !locked; });
    locked = true;
}

void mutex_t::unlock()
{
    std::unique_lock<std::mutex> lock(mutex);
    locked = false;
    cond.notify_one();
}

} // namespace piecenet::co
