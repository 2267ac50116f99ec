/**
* \file timer.hpp
* \author piecenet authors
* \brief Timers of an event loop. Timers are grouped into slots by their rounded timepoint and kept in a priority
queue ordered by timepoint.
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
#include "net.hpp"
#include <functional>
#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace piecenet
{
using microsecond_t = u64;
using timer_callback_t = std::function<void()>;
using timer_id = i64;

constexpr microsecond_t timer_min_precision = 1000;

struct timer_t
{
    microsecond_t timepoint;
    timer_callback_t callback;
    timer_t(microsecond_t timepoint, timer_callback_t callback)
        : timepoint(timepoint)
        , callback(std::move(callback))
    {
    }
};

struct timer_slot_t
{
    microsecond_t timepoint;
    /// callback and enable flag, the timer id is index + 1
    std::vector<std::pair<timer_callback_t, bool>> callbacks;
    timer_slot_t(microsecond_t tp)
        : timepoint(tp)
    {
    }
};

struct timer_cmp
{
    bool operator()(timer_slot_t *lh, timer_slot_t *rh) const { return lh->timepoint > rh->timepoint; }
};

/// handle returned by insert, id < 0 means nothing registered
struct timer_registered_t
{
    timer_id id;
    microsecond_t timepoint;
};

timer_t make_timer(microsecond_t span, timer_callback_t callback);

/// timer is run in one thread, and is not thread-safety. don't add timer from other thread
class time_manager_t
{
    microsecond_t precision;
    std::priority_queue<timer_slot_t *, std::vector<timer_slot_t *>, timer_cmp> queue;
    std::unordered_map<microsecond_t, timer_slot_t *> map;

  public:
    explicit time_manager_t(microsecond_t precision = timer_min_precision);
    ~time_manager_t();

    time_manager_t(const time_manager_t &) = delete;
    time_manager_t &operator=(const time_manager_t &) = delete;

    /// run all expired timers
    void tick();
    timer_registered_t insert(timer_t timer);
    void cancel(timer_registered_t reg);
    /// the earliest timepoint or make_timespan_full() when empty
    microsecond_t next_tick_timepoint() const;
};

/// monotonic clock in microseconds
microsecond_t get_current_time();
/// unix time in microseconds
microsecond_t get_timestamp();

constexpr microsecond_t make_timespan(int second, int ms = 0, int us = 0)
{
    return (u64)second * 1000000 + (u64)ms * 1000 + us;
}

constexpr microsecond_t make_timespan_full() { return 0xFFFFFFFFFFFFFFFFULL; }

} // namespace piecenet
