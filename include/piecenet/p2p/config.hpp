/**
* \file config.hpp
* \author piecenet authors
* \brief Client and server configuration.
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
#include "../timer.hpp"
#include "../tls.hpp"
#include <string>

namespace piecenet::p2p
{
constexpr u64 default_max_message_size = 64 * 1024 * 1024;

struct client_config_t
{
    /// server "host:port"
    std::string addr = "127.0.0.1:8080";
    /// tcp connect and tls handshake
    microsecond_t connect_timeout = make_timespan(30);
    u32 max_concurrent_streams = 100;
    microsecond_t keep_alive_interval = make_timespan(60);
    microsecond_t idle_timeout = make_timespan(180);
    /// largest response accepted
    u64 max_message_size = default_max_message_size;
    /// threads resolving the server name, 0 resolves in the requesting coroutine
    u32 resolve_threads = 1;
    tls::client_options_t tls;

    mux::options_t mux_options() const
    {
        mux::options_t options;
        options.max_concurrent_streams = max_concurrent_streams;
        options.handshake_timeout = connect_timeout;
        options.keep_alive_interval = keep_alive_interval;
        options.idle_timeout = idle_timeout;
        return options;
    }
};

struct server_config_t
{
    std::string listen_addr = "0.0.0.0:8080";
    /// PEM files, an ephemeral certificate is generated when one is empty
    std::string cert_path;
    std::string key_path;
    u32 max_concurrent_connections = 1000;
    /// streams per connection
    u32 max_concurrent_streams = 100;
    /// deadline of the tls handshake of accepted connections
    microsecond_t request_timeout = make_timespan(30);
    microsecond_t keep_alive_interval = make_timespan(60);
    microsecond_t idle_timeout = make_timespan(180);
    /// largest request accepted
    u64 max_message_size = default_max_message_size;
    int backlog = 128;
    bool reuse_addr = true;
    tls::server_options_t tls;

    mux::options_t mux_options() const
    {
        mux::options_t options;
        options.max_concurrent_streams = max_concurrent_streams;
        options.handshake_timeout = request_timeout;
        options.keep_alive_interval = keep_alive_interval;
        options.idle_timeout = idle_timeout;
        return options;
    }
};

} // namespace piecenet::p2p
