/**
* \file epoll.hpp
* \author piecenet authors
* \brief Edge triggered epoll demultiplexer with an eventfd to wake up the waiting thread.
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
#include "event.hpp"
#include "lock.hpp"
#include <unordered_map>

namespace piecenet
{
class event_epoll_demultiplexer : public event_demultiplexer
{
    int fd;
    int ev_fd;
    /// registered events of every handle
    std::unordered_map<handle_t, event_type_t> registered;
    lock::spinlock_t lock;

    void update(handle_t handle, event_type_t old_type, event_type_t new_type);

  public:
    event_epoll_demultiplexer();
    ~event_epoll_demultiplexer();
    void add(handle_t handle, event_type_t type) override;
    handle_t select(event_type_t *type, microsecond_t *timeout) override;
    void remove(handle_t handle, event_type_t type) override;
    void wake_up() override;
};
} // namespace piecenet
