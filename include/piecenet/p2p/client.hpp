/**
* \file client.hpp
* \author piecenet authors
* \brief Protocol client bound to one server address. The connection is created on the first request and reused by
later requests, every request runs on its own stream.
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
#include "../co_sync.hpp"
#include "../transport.hpp"
#include "config.hpp"
#include "message.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace piecenet
{
class event_context_t;
} // namespace piecenet

namespace piecenet::p2p
{

///\note call the requests in coroutines, they suspend on network I/O
class client_t
{
    client_config_t config;
    std::shared_ptr<transport::connector_t> connector;
    /// one connection attempt at a time
    co::mutex_t connect_mutex;
    /// guards conn
    std::mutex mutex;
    std::shared_ptr<transport::connection_t> conn;

  private:
    std::shared_ptr<transport::connection_t> connect();
    proto::MessagePayload request(proto::MessagePayload payload);

  public:
    client_t(client_config_t config, std::shared_ptr<transport::connector_t> connector);
    ~client_t();

    client_t(const client_t &) = delete;
    client_t &operator=(const client_t &) = delete;

    /// client over a TLS multiplexed connection built from config
    static std::unique_ptr<client_t> create(event_context_t &context, client_config_t config);

    ///\throw net_connect_exception when connecting or opening the stream fails
    ///\throw net_io_exception when the stream breaks
    ///\throw net_protocol_exception when the response can't be decoded or is not a download piece response
    proto::DownloadPieceResponse download_piece(const proto::DownloadPieceRequest &request);
    proto::DownloadTaskResponse download_task(const proto::DownloadTaskRequest &request);
    proto::SyncPiecesResponse sync_pieces(const proto::SyncPiecesRequest &request);
    proto::DownloadPersistentCachePieceResponse
    download_persistent_cache_piece(const proto::DownloadPersistentCachePieceRequest &request);
    /// the status string of server
    std::string health_check();

    /// close the cached connection, the next request connects again
    void invalidate();

    const std::string &get_address() const { return config.addr; }
};

} // namespace piecenet::p2p
