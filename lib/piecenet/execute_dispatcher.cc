#include "piecenet/execute_dispatcher.hpp"
#include "piecenet/co.hpp"
#include "piecenet/execute_context.hpp"
#include <algorithm>

namespace piecenet
{

void execute_thread_dispatcher_t::dispatch()
{
    size_t count;
    {
        lock::lock_guard g(lock);
        count = co_wait_for_resume.size();
    }

    while (count-- > 0)
    {
        execute_context_t *executor;
        std::function<void()> fn;
        {
            lock::lock_guard g(lock);
            if (co_wait_for_resume.empty())
                break;
            executor = co_wait_for_resume.front().first;
            fn = std::move(co_wait_for_resume.front().second);
            co_wait_for_resume.pop_front();
        }

        auto co = executor->co;
        if (co == nullptr)
            continue;

        if (fn)
            co->resume_with(std::move(fn));
        else
            co->resume();

        if (co->is_finished())
            executor->on_finish();
    }
}

void execute_thread_dispatcher_t::add(execute_context_t *econtext, std::function<void()> func)
{
    lock::lock_guard g(lock);
    co_wait_for_resume.emplace_back(econtext, std::move(func));
}

void execute_thread_dispatcher_t::cancel(execute_context_t *econtext)
{
    lock::lock_guard g(lock);
    co_wait_for_resume.erase(std::remove_if(co_wait_for_resume.begin(), co_wait_for_resume.end(),
                                            [econtext](const auto &it) { return it.first == econtext; }),
                             co_wait_for_resume.end());
}

bool execute_thread_dispatcher_t::empty()
{
    lock::lock_guard g(lock);
    return co_wait_for_resume.empty();
}
} // namespace piecenet
