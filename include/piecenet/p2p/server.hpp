/**
* \file server.hpp
* \author piecenet authors
* \brief Protocol server. Accept connections, accept streams of every connection and answer one request per stream.
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
#include "../mux.hpp"
#include "../tcp.hpp"
#include "../thread_pool.hpp"
#include "../transport.hpp"
#include "config.hpp"
#include "message.hpp"
#include "store.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace piecenet
{
class event_context_t;
class socket_t;
} // namespace piecenet

namespace piecenet::p2p
{

/// build the response payload of a request payload
using handler_t = std::function<proto::MessagePayload(const proto::MessagePayload &)>;

/// request variant -> handler
class handler_table_t
{
    std::unordered_map<int, handler_t> handlers;

  public:
    ///\throw net_param_exception when request is not a request variant
    handler_table_t &on(payload_case_t request, handler_t handler);

    bool has(payload_case_t request) const;

    /// call the handler registered for the variant of request
    ///\throw net_protocol_exception(unexpected_message) for responses, empty payloads and unregistered requests
    proto::MessagePayload dispatch(const proto::MessagePayload &request) const;
};

/// handlers answering from store, health check answers "OK"
///\param pool run the lookups in it, nullptr runs them in the calling coroutine
handler_table_t make_store_handlers(std::shared_ptr<content_store_t> store, thread_pool_t *pool);

class server_t
{
    server_config_t config;
    handler_table_t handlers;
    std::shared_ptr<tls::context_t> tls_ctx;
    mux::options_t options;
    tcp::server_t acceptor;
    event_context_t *context;

    /// guards connections and stopping
    std::mutex mutex;
    std::unordered_map<u64, std::shared_ptr<mux::connection_t>> connections;
    bool stopping;

  private:
    void on_accept(tcp::server_t &server, socket_t *socket);
    void connection_main(std::shared_ptr<mux::connection_t> conn);
    void stream_main(std::shared_ptr<transport::stream_t> stream, socket_addr_t remote);

  public:
    ///\throw net_param_exception when the certificate can't be loaded
    server_t(server_config_t config, handler_table_t handlers);
    ~server_t();

    server_t(const server_t &) = delete;
    server_t &operator=(const server_t &) = delete;

    /// bind config.listen_addr and start the accept loop
    ///\throw net_connect_exception when the address can't be bound
    void listen(event_context_t &context);

    /// stop accepting connections and drain the live ones, thread-safety
    void stop();

    socket_addr_t local_address();

    size_t connection_count();
};

} // namespace piecenet::p2p
