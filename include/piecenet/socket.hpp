/**
* \file socket.hpp
* \author piecenet authors
* \brief Non-blocking TCP socket bound to an event loop. The socket is an execute context, its coroutine is resumed
when an event comes.
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
#include "event.hpp"
#include "execute_context.hpp"
#include "net.hpp"
#include "socket_addr.hpp"
#include "socket_buffer.hpp"

namespace piecenet
{
class socket_t : public execute_context_t, public event_handler_t
{
    int fd;
    socket_addr_t local;
    socket_addr_t remote;
    bool is_connection_closed;
    bool bound;

    friend co::async_result_t<io_result> connect_to(co::paramter_t &, socket_t *, socket_addr_t);
    friend co::async_result_t<socket_t *> accept_from(co::paramter_t &, socket_t *in);
    friend co::async_result_t<io_result> socket_awrite(co::paramter_t &, socket_t *, socket_buffer_t &);
    friend co::async_result_t<io_result> socket_aread(co::paramter_t &, socket_t *, socket_buffer_t &);

    /// send or recv the rest of buffer, wait for the readiness of op while the socket would block
    co::async_result_t<io_result> transfer(co::paramter_t &param, socket_buffer_t &buffer, io_operation op);

  public:
    explicit socket_t(int fd);
    ~socket_t();
    socket_t(const socket_t &) = delete;
    socket_t &operator=(const socket_t &) = delete;

    socket_addr_t local_addr();
    socket_addr_t remote_addr();

    void on_event(event_context_t &context, event_type_t type) override;

    void add_event(event_type_t type);
    void remove_event(event_type_t type);

    int get_raw_handle() const { return fd; }

    /// bind to the minimum load loop of context
    void bind_context(event_context_t &context);
    void bind_loop(event_loop_t &loop);
    void unbind_context();
    bool is_bound() const { return bound; }
};

/// write the whole buffer, closed when the peer is gone
co::async_result_t<io_result> socket_awrite(co::paramter_t &param, socket_t *socket, socket_buffer_t &buffer);
/// read until the buffer is full, closed at end of stream
co::async_result_t<io_result> socket_aread(co::paramter_t &param, socket_t *socket, socket_buffer_t &buffer);

socket_t *new_tcp_socket();

socket_t *reuse_addr_socket(socket_t *socket, bool reuse);

/// disable nagle
socket_t *set_nodelay(socket_t *socket, bool nodelay);

/// async connect to server
///\note the socket must be bound to a loop
co::async_result_t<io_result> connect_to(co::paramter_t &param, socket_t *socket, socket_addr_t socket_to_addr);

socket_t *bind_at(socket_t *socket, socket_addr_t socket_to_addr);

socket_t *listen_from(socket_t *socket, int max_wait_client);

/// async accept a new socket, the new socket is not bound
co::async_result_t<socket_t *> accept_from(co::paramter_t &param, socket_t *socket);

/// unbind and delete the socket
void close_socket(socket_t *socket);

} // namespace piecenet
