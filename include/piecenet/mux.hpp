/**
* \file mux.hpp
* \author piecenet authors
* \brief Stream multiplexing over one TLS connection. Every stream is a sequence of data frames started by a syn flag
and ended by a fin or a rst flag. One I/O coroutine per connection writes the queued frames and routes the received
frames to their streams.
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
#include "co_sync.hpp"
#include "endian.hpp"
#include "socket_addr.hpp"
#include "socket_buffer.hpp"
#include "timer.hpp"
#include "thread_pool.hpp"
#include "tls.hpp"
#include "transport.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace piecenet
{
class event_context_t;
class socket_t;
} // namespace piecenet

namespace piecenet::mux
{
namespace frame_type
{
enum : u8
{
    data = 0,
    ping = 1,
    go_away = 2,
    /// u32 stream limit of the sender, the first frame after the tls handshake
    settings = 3,
};
}

namespace frame_flag
{
enum : u8
{
    /// first frame of a stream
    syn = 1,
    /// the sender closes its write half
    fin = 2,
    /// abort the stream, the payload is a 4 bytes reset code
    rst = 4,
    /// reply of a ping
    ack = 8,
};
}

#pragma pack(push, 1)
/// frame head, network order on wire
struct frame_head_t
{
    u8 type;
    u8 flags;
    u32 stream_id;
    /// payload length
    u32 length;
    using member_list_t = serialization::typelist_t<u8, u8, u32, u32>;
};
#pragma pack(pop)

constexpr u32 max_frame_payload = 16 * 1024;
/// writers wait when the queued bytes exceed it
constexpr u64 send_queue_high_watermark = 1024 * 1024;

struct options_t
{
    /// streams the peer may open and not finished yet, sent to the peer in settings
    u32 max_concurrent_streams = 100;
    /// deadline of tcp connect and tls handshake
    microsecond_t handshake_timeout = make_timespan(30);
    /// send a ping when nothing is sent for it
    microsecond_t keep_alive_interval = make_timespan(60);
    /// close when nothing is received for it
    microsecond_t idle_timeout = make_timespan(180);
};

enum class role_t
{
    connector,
    acceptor,
};

enum class state_t
{
    connecting,
    /// tls handshake and settings exchange
    handshaking,
    open,
    /// no new streams, close when the live streams end
    draining,
    closed,
};

class connection_t;

class stream_t : public transport::stream_t
{
    friend class connection_t;
    std::shared_ptr<connection_t> conn;
    u32 stream_id;
    /// opened by the peer
    bool incoming;

    /// guarded by the mutex of connection
    std::deque<socket_buffer_t> recv_chunks;
    bool syn_sent;
    bool local_fin;
    bool remote_fin;
    bool reset_sent;
    bool reset_recv;
    transport::reset_code peer_code;
    /// removed from the connection
    bool released;
    co::condition_t read_cond;

  public:
    stream_t(std::shared_ptr<connection_t> conn, u32 id, bool incoming);
    ~stream_t();

    u32 id() const override { return stream_id; }
    void write_all(socket_buffer_t &buffer) override;
    void finish() override;
    u64 read(socket_buffer_t &buffer) override;
    void reset(transport::reset_code code) override;
};

class connection_t : public transport::connection_t, public std::enable_shared_from_this<connection_t>
{
    friend class stream_t;

    role_t role;
    std::unique_ptr<socket_t> socket;
    std::shared_ptr<tls::context_t> tls_ctx;
    options_t options;
    socket_addr_t remote;
    u64 conn_id;

    mutable std::mutex mutex;
    state_t state;
    connection_state close_state;
    std::string close_reason;
    co::condition_t state_cond;
    co::condition_t accept_cond;
    co::condition_t send_cond;
    /// wait for the stream credit of peer
    co::condition_t open_cond;

    std::unordered_map<u32, std::weak_ptr<stream_t>> streams;
    /// streams opened by the peer and not accepted yet
    std::deque<std::shared_ptr<stream_t>> incoming;
    u32 next_stream_id;
    /// the largest stream id opened by the peer
    u32 last_peer_stream_id;
    u32 active_incoming;
    u32 active_outgoing;
    /// stream limit of the peer, 0 until its settings arrive
    u32 peer_max_streams;
    std::deque<socket_buffer_t> send_queue;
    u64 send_queue_bytes;
    bool close_requested;
    bool go_away_sent;

    /// used by the I/O coroutine only
    std::unique_ptr<tls::session_t> session;
    socket_buffer_t pending_out;
    socket_buffer_t recv_buffer;
    u64 recv_length;
    microsecond_t last_recv;
    microsecond_t last_send;
    microsecond_t handshake_deadline;

  private:
    void io_main(socket_addr_t addr);
    void handshake();
    void pump();
    io_result flush();
    bool receive(std::vector<std::shared_ptr<stream_t>> &keep);
    void parse_frames(std::vector<std::shared_ptr<stream_t>> &keep);
    void on_frame(const frame_head_t &head, const byte *payload, std::vector<std::shared_ptr<stream_t>> &keep);
    void finish_close(connection_state st, const std::string &reason, bool graceful);

    bool is_peer_stream(u32 id) const;
    bool should_close_locked() const;
    void enqueue_locked(socket_buffer_t frame);
    void release_locked(stream_t *stream);
    /// queue a frame of stream, wait when the queue is full
    void send_stream_frame(stream_t *stream, u8 flags, const byte *data, u32 len);
    void stream_destroyed(stream_t *stream);
    void wake_io();

  public:
    ///\param socket bound to a loop, owned by the connection
    connection_t(role_t role, std::unique_ptr<socket_t> socket, std::shared_ptr<tls::context_t> tls_ctx,
                 options_t options);
    ~connection_t();

    connection_t(const connection_t &) = delete;
    connection_t &operator=(const connection_t &) = delete;

    /// run the I/O coroutine on the loop of socket
    ///\param addr the server address to connect, unused by the acceptor
    void start(socket_addr_t addr);

    /// wait for the handshake
    ///\throw net_connect_exception with the reason of close
    void wait_established();

    /// wait until the I/O coroutine stops
    void wait_closed();

    /// wait while the peer limit of concurrent streams is reached
    std::shared_ptr<transport::stream_t> open_stream() override;
    std::shared_ptr<transport::stream_t> accept_stream() override;
    bool is_open() const override;
    void close() override;
    socket_addr_t remote_address() const override { return remote; }
    u64 id() const override { return conn_id; }

    state_t get_state() const;
    role_t get_role() const { return role; }
    /// streams not finished on both sides
    size_t stream_count() const;
};

/// create frame with head and payload
socket_buffer_t make_frame(u8 type, u8 flags, u32 stream_id, const byte *data, u32 len);

class connector_t : public transport::connector_t
{
    event_context_t &context;
    std::shared_ptr<tls::context_t> tls_ctx;
    options_t options;
    std::shared_ptr<thread_pool_t> resolver;

  public:
    ///\param resolver runs the name resolution, nullptr resolves in the calling coroutine
    connector_t(event_context_t &context, std::shared_ptr<tls::context_t> tls_ctx, options_t options,
                std::shared_ptr<thread_pool_t> resolver = nullptr);

    /// connect on the loop of the calling coroutine
    std::shared_ptr<transport::connection_t> connect(const std::string &address) override;
};

} // namespace piecenet::mux
