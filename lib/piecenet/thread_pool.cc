#include "piecenet/thread_pool.hpp"
#include <glog/logging.h>

namespace piecenet
{

void thread_pool_t::wrapper()
{
    while (1)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cond.wait(lock, [this]() { return !tasks.empty() || exit; });
            if (tasks.empty())
                return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

thread_pool_t::thread_pool_t(int count)
    : exit(false)
{
    for (auto i = 0; i < count; i++)
    {
        std::thread thread(std::bind(&thread_pool_t::wrapper, this));
        threads.emplace_back(std::move(thread));
    }
    VLOG(1) << "thread pool started with " << count << " threads";
}

thread_pool_t::~thread_pool_t()
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        exit = true;
    }
    cond.notify_all();

    for (auto &i : threads)
    {
        i.join();
    }
}

bool thread_pool_t::commit(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (exit) // don't push task
            return false;
        tasks.emplace(std::move(task));
    }
    cond.notify_one();
    return true;
}


bool thread_pool_t::empty() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return tasks.empty();
}

} // namespace piecenet
