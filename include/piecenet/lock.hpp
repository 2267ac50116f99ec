/**
* \file lock.hpp
* \author piecenet authors
* \brief Spinlock for short critical sections inside the event loop and the dispatcher.
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
#include <atomic>

namespace piecenet::lock
{
class spinlock_t
{
    std::atomic_bool flag;

  public:
    spinlock_t()
        : flag(false)
    {
    }

    spinlock_t(const spinlock_t &) = delete;
    spinlock_t &operator=(const spinlock_t &) = delete;

    void lock()
    {
        bool old;
        do
        {
            while (flag.load(std::memory_order_relaxed))
            {
            }
            old = false;
        } while (!flag.compare_exchange_weak(old, true, std::memory_order_acquire));
    }

    void unlock() { flag.store(false, std::memory_order_release); }
};

template <typename T> struct lock_guard
{
    T &ref;
    lock_guard(T &ref)
        : ref(ref)
    {
        ref.lock();
    }
    ~lock_guard() { ref.unlock(); }

    lock_guard(const lock_guard &) = delete;
    lock_guard &operator=(const lock_guard &) = delete;
};

} // namespace piecenet::lock
