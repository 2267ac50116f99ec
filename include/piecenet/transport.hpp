/**
* \file transport.hpp
* \author piecenet authors
* \brief Capability interface of a secure multiplexed transport. A connection carries many independent bidirectional
streams, each stream is half-closed by its writer.
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
#include "socket_addr.hpp"
#include "socket_buffer.hpp"
#include <memory>
#include <string>

namespace piecenet::transport
{

/// reason sent with a stream reset
enum class reset_code : u32
{
    cancelled = 0,
    /// the peer does not take more streams
    refused = 1,
    /// the peer failed to serve the stream
    internal = 2,
    /// the peer received a malformed or unexpected message
    protocol = 3,
};

///\note all functions suspend the calling coroutine, call them in a coroutine
class stream_t
{
  public:
    virtual ~stream_t(){};

    virtual u32 id() const = 0;

    /// write all data from the current offset of buffer
    ///\throw net_io_exception when the stream or the connection is gone
    virtual void write_all(socket_buffer_t &buffer) = 0;

    /// close the write half, the peer reads the end of stream
    virtual void finish() = 0;

    /// read available bytes into buffer at its current offset
    ///\return bytes read, 0 at end of stream
    virtual u64 read(socket_buffer_t &buffer) = 0;

    /// abort both halves
    virtual void reset(reset_code code) = 0;

    /// read until the peer closes its write half
    ///\param limit maximum bytes accepted
    ///\throw net_protocol_exception(framing) when the data exceeds limit
    socket_buffer_t read_to_end(u64 limit);
};

class connection_t
{
  public:
    virtual ~connection_t(){};

    /// open a new bidirectional stream, no handshake is needed
    virtual std::shared_ptr<stream_t> open_stream() = 0;

    /// wait for the next stream opened by the peer
    ///\return nullptr when the connection stops accepting streams
    virtual std::shared_ptr<stream_t> accept_stream() = 0;

    /// the connection is established and not closing
    virtual bool is_open() const = 0;

    /// stop opening streams and close once the live streams end
    virtual void close() = 0;

    virtual socket_addr_t remote_address() const = 0;

    /// unique in the process
    virtual u64 id() const = 0;
};

class connector_t
{
  public:
    virtual ~connector_t(){};

    /// establish a secure connection to "host:port"
    virtual std::shared_ptr<connection_t> connect(const std::string &address) = 0;
};

} // namespace piecenet::transport
