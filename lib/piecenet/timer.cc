#include "piecenet/timer.hpp"
#include <chrono>

namespace piecenet
{
timer_t make_timer(microsecond_t span, timer_callback_t callback)
{
    return timer_t(span + get_current_time(), std::move(callback));
}

time_manager_t::time_manager_t(microsecond_t precision)
    : precision(precision)
{
}

time_manager_t::~time_manager_t()
{
    for (auto &it : map)
    {
        delete it.second;
    }
}

void time_manager_t::tick()
{
    auto us = get_current_time();
    while (!queue.empty())
    {
        auto slot = queue.top();
        if (slot->timepoint > us)
        {
            break;
        }
        queue.pop();
        /// callbacks may insert into this slot, index it instead of iterating
        for (size_t i = 0; i < slot->callbacks.size(); i++)
        {
            if (slot->callbacks[i].second)
            {
                slot->callbacks[i].second = false;
                auto callback = slot->callbacks[i].first;
                callback();
            }
        }
        map.erase(slot->timepoint);
        delete slot;
    }
}

timer_registered_t time_manager_t::insert(timer_t timer)
{
    timer.timepoint = (timer.timepoint + precision - 1) / precision * precision;

    auto it = map.find(timer.timepoint);
    if (it == map.end())
    {
        it = map.emplace(timer.timepoint, new timer_slot_t(timer.timepoint)).first;
        queue.push(it->second);
    }

    it->second->callbacks.emplace_back(std::move(timer.callback), true);
    return {(timer_id)it->second->callbacks.size(), timer.timepoint};
}

void time_manager_t::cancel(timer_registered_t reg)
{
    if (reg.id <= 0)
        return;
    auto it = map.find(reg.timepoint);
    if (it != map.end() && (size_t)reg.id <= it->second->callbacks.size())
    {
        it->second->callbacks[reg.id - 1].second = false;
    }
}

microsecond_t time_manager_t::next_tick_timepoint() const
{
    if (!queue.empty())
    {
        return queue.top()->timepoint;
    }

    return make_timespan_full();
}

microsecond_t get_current_time()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

microsecond_t get_timestamp()
{
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now())
        .time_since_epoch()
        .count();
}

} // namespace piecenet
