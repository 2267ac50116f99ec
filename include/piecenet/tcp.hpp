/**
* \file tcp.hpp
* \author piecenet authors
* \brief TCP acceptor. It runs the accept loop in the coroutine of the listening socket and hands accepted sockets to
the join handler.
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
#include "socket_addr.hpp"
#include "timer.hpp"
#include <atomic>
#include <functional>

namespace piecenet
{
class event_context_t;
class socket_t;
}; // namespace piecenet

namespace piecenet::tcp
{

class server_t
{
  public:
    /// the accepted socket is owned by the handler, it is not bound to any loop
    using handler_t = std::function<void(server_t &, socket_t *)>;
    using error_handler_t = std::function<void(server_t &, connection_state)>;

  private:
    socket_t *server_socket;
    event_context_t *context;
    handler_t join_handler;
    error_handler_t error_handler;
    std::atomic_bool stopping;

  private:
    void wait_client();

  public:
    server_t();
    ~server_t();

    server_t(const server_t &) = delete;
    server_t &operator=(const server_t &) = delete;

    /// listen port in acceptor coroutine.
    ///
    ///\param context event context
    ///\param address the address:port to bind
    ///\param max_wait_client client count in completion queue
    ///\param reuse_addr create socket by SO_REUSEADDR?
    void listen(event_context_t &context, socket_addr_t address, int max_wait_client, bool reuse_addr = false);

    server_t &on_client_join(handler_t handler);
    server_t &on_client_error(error_handler_t handler);

    /// stop accepting, thread-safety
    void stop();

    /// release the listening socket
    ///\note call it when the acceptor coroutine is stopped or the loops exited
    void close_server();

    /// the bound address, useful when listening on port 0
    socket_addr_t local_addr();

    socket_t *get_socket() const { return server_socket; }
};

} // namespace piecenet::tcp
