#include "piecenet/mux.hpp"
#include "piecenet/co.hpp"
#include "piecenet/event.hpp"
#include "piecenet/net_exception.hpp"
#include "piecenet/socket.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <glog/logging.h>

namespace piecenet::mux
{
namespace
{
std::atomic<u64> connection_counter = 1;

/// room for two complete frames
constexpr u64 recv_buffer_size = (sizeof(frame_head_t) + max_frame_payload) * 2;

[[noreturn]] void throw_reset(transport::reset_code code, io_operation op, u32 id)
{
    auto sid = std::to_string(id);
    switch (code)
    {
        case transport::reset_code::refused:
            throw net_connect_exception("stream " + sid + " refused by peer", connection_state::stream_refused);
        case transport::reset_code::internal:
            throw net_protocol_exception("stream " + sid + " failed on peer", protocol_error::internal);
        case transport::reset_code::protocol:
            throw net_protocol_exception("stream " + sid + " rejected by peer", protocol_error::unexpected_message);
        default:
            throw net_io_exception("stream " + sid + " reset by peer", op);
    }
}

socket_buffer_t make_reset_frame(u32 stream_id, u8 flags, transport::reset_code code)
{
    u32 value = (u32)code;
    endian::cast(value);
    return make_frame(frame_type::data, flags | frame_flag::rst, stream_id, (const byte *)&value, sizeof(value));
}

} // namespace

socket_buffer_t make_frame(u8 type, u8 flags, u32 stream_id, const byte *data, u32 len)
{
    socket_buffer_t buffer(sizeof(frame_head_t) + len);
    buffer.expect().origin_length();
    frame_head_t head;
    head.type = type;
    head.flags = flags;
    head.stream_id = stream_id;
    head.length = len;
    endian::save_to(head, buffer);
    if (len > 0)
        memcpy(buffer.get_base_ptr() + sizeof(frame_head_t), data, len);
    return buffer;
}

stream_t::stream_t(std::shared_ptr<connection_t> conn, u32 id, bool incoming)
    : conn(std::move(conn))
    , stream_id(id)
    , incoming(incoming)
    , syn_sent(incoming)
    , local_fin(false)
    , remote_fin(false)
    , reset_sent(false)
    , reset_recv(false)
    , peer_code(transport::reset_code::cancelled)
    , released(false)
{
}

stream_t::~stream_t() { conn->stream_destroyed(this); }

void stream_t::write_all(socket_buffer_t &buffer)
{
    while (buffer.get_length() > 0)
    {
        u32 n = buffer.get_length() > max_frame_payload ? max_frame_payload : (u32)buffer.get_length();
        conn->send_stream_frame(this, 0, buffer.get(), n);
        buffer.walk_step(n);
    }
    buffer.finish_walk();
}

void stream_t::finish() { conn->send_stream_frame(this, frame_flag::fin, nullptr, 0); }

u64 stream_t::read(socket_buffer_t &buffer)
{
    if (buffer.get_length() == 0)
        throw net_param_exception("read stream " + std::to_string(stream_id) + " with an empty buffer");

    std::unique_lock<std::mutex> lock(conn->mutex);
    read_cond.wait(lock, [this]() { return !recv_chunks.empty() || remote_fin || reset_recv || released; });

    if (!recv_chunks.empty())
    {
        u64 total = 0;
        byte *target = buffer.get();
        u64 room = buffer.get_length();
        while (!recv_chunks.empty() && total < room)
        {
            auto &chunk = recv_chunks.front();
            u64 n = std::min(chunk.get_length(), room - total);
            memcpy(target + total, chunk.get(), n);
            chunk.walk_step(n);
            total += n;
            if (chunk.get_length() == 0)
                recv_chunks.pop_front();
        }
        return total;
    }
    if (reset_recv)
        throw_reset(peer_code, io_operation::read, stream_id);
    if (remote_fin)
        return 0;
    if (reset_sent)
        throw net_io_exception("stream " + std::to_string(stream_id) + " is reset", io_operation::read);
    throw net_io_exception("connection closed before stream " + std::to_string(stream_id) +
                               " ends: " + conn->close_reason,
                           io_operation::read);
}

void stream_t::reset(transport::reset_code code)
{
    {
        std::unique_lock<std::mutex> lock(conn->mutex);
        if (released || reset_sent)
            return;
        reset_sent = true;
        // the peer knows nothing of a stream without frames
        if (syn_sent && conn->state != state_t::closed)
            conn->enqueue_locked(make_reset_frame(stream_id, 0, code));
        conn->release_locked(this);
        read_cond.notify_all();
    }
    conn->wake_io();
}

connection_t::connection_t(role_t role, std::unique_ptr<socket_t> socket, std::shared_ptr<tls::context_t> tls_ctx,
                           options_t options)
    : role(role)
    , socket(std::move(socket))
    , tls_ctx(std::move(tls_ctx))
    , options(options)
    , conn_id(connection_counter++)
    , state(state_t::connecting)
    , close_state(connection_state::closed)
    , next_stream_id(role == role_t::connector ? 1 : 2)
    , last_peer_stream_id(0)
    , active_incoming(0)
    , active_outgoing(0)
    , peer_max_streams(0)
    , send_queue_bytes(0)
    , close_requested(false)
    , go_away_sent(false)
    , recv_buffer(recv_buffer_size)
    , recv_length(0)
    , last_recv(0)
    , last_send(0)
    , handshake_deadline(0)
{
    if (role == role_t::acceptor)
    {
        remote = this->socket->remote_addr();
        state = state_t::handshaking;
    }
}

connection_t::~connection_t()
{
    session.reset();
    if (socket && socket->is_bound())
        socket->unbind_context();
}

void connection_t::start(socket_addr_t addr)
{
    if (role == role_t::connector)
        remote = addr;
    auto self = shared_from_this();
    socket->run([self, addr]() { self->io_main(addr); });
    socket->wake_up_thread();
}

void connection_t::wake_io()
{
    socket->start();
    socket->wake_up_thread();
}

bool connection_t::is_peer_stream(u32 id) const
{
    // the connector opens odd ids, the acceptor opens even ids
    return (id % 2 == 0) == (role == role_t::connector);
}

void connection_t::enqueue_locked(socket_buffer_t frame)
{
    send_queue_bytes += frame.get_length();
    send_queue.push_back(std::move(frame));
}

void connection_t::release_locked(stream_t *stream)
{
    if (stream->released)
        return;
    stream->released = true;
    streams.erase(stream->stream_id);
    if (stream->incoming)
    {
        if (active_incoming > 0)
            active_incoming--;
    }
    else if (active_outgoing > 0)
    {
        active_outgoing--;
        open_cond.notify_one();
    }
}

bool connection_t::should_close_locked() const
{
    return state == state_t::draining && go_away_sent && streams.empty() && incoming.empty() && send_queue.empty() &&
           pending_out.get_length() == 0;
}

void connection_t::send_stream_frame(stream_t *stream, u8 flags, const byte *data, u32 len)
{
    auto op = io_operation::write;
    auto sid = std::to_string(stream->stream_id);
    {
        std::unique_lock<std::mutex> lock(mutex);
        send_cond.wait(lock, [this, stream]() {
            return send_queue_bytes < send_queue_high_watermark || state == state_t::closed || stream->released;
        });
        if (stream->reset_recv)
            throw_reset(stream->peer_code, op, stream->stream_id);
        if (stream->reset_sent)
            throw net_io_exception("stream " + sid + " is reset", op);
        if (stream->local_fin)
            throw net_io_exception("stream " + sid + " is finished", op);
        if (state == state_t::closed || stream->released)
            throw net_io_exception("connection closed: " + close_reason, op);

        if (!stream->syn_sent)
        {
            flags |= frame_flag::syn;
            stream->syn_sent = true;
        }
        enqueue_locked(make_frame(frame_type::data, flags, stream->stream_id, data, len));
        if (flags & frame_flag::fin)
        {
            stream->local_fin = true;
            if (stream->remote_fin)
                release_locked(stream);
        }
    }
    wake_io();
}

void connection_t::stream_destroyed(stream_t *stream)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (stream->released)
            return;
        if (stream->syn_sent && state != state_t::closed)
        {
            // the owner dropped a stream in the middle, the peer must release it too
            enqueue_locked(make_reset_frame(stream->stream_id, 0, transport::reset_code::cancelled));
        }
        release_locked(stream);
    }
    wake_io();
}

void connection_t::io_main(socket_addr_t addr)
{
    try
    {
        if (role == role_t::connector)
        {
            auto ret = co::await_timeout(options.handshake_timeout, connect_to, socket.get(), addr);
            if (ret == io_result::timeout)
                throw net_connect_exception("connect to " + addr.to_string() + " timeout", connection_state::timeout);
            if (ret != io_result::ok)
                throw net_connect_exception("failed to connect " + addr.to_string(),
                                            connection_state::connection_refuse);
            set_nodelay(socket.get(), true);
        }
        handshake();
        pump();
    } catch (net_connect_exception &e)
    {
        VLOG(1) << "connection " << conn_id << " " << remote.to_string() << " closed: " << e.what();
        finish_close(e.get_state(), e.what(), false);
    } catch (net_exception &e)
    {
        VLOG(1) << "connection " << conn_id << " " << remote.to_string() << " failed: " << e.what();
        finish_close(connection_state::closed, e.what(), false);
    } catch (std::exception &e)
    {
        LOG(ERROR) << "connection " << conn_id << " " << remote.to_string() << " aborted: " << e.what();
        finish_close(connection_state::closed, e.what(), false);
    }
}

void connection_t::handshake()
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        state = state_t::handshaking;
    }
    session = std::make_unique<tls::session_t>(tls_ctx, socket->get_raw_handle());
    socket->add_event(event_type::readable | event_type::writable);

    auto deadline = get_current_time() + options.handshake_timeout;
    while (1)
    {
        auto ret = session->handshake();
        if (ret == io_result::ok)
            break;
        if (ret != io_result::cont)
            throw net_connect_exception("tls handshake with " + remote.to_string() + " failed: " + session->get_error(),
                                        connection_state::secure_check_failed);
        auto now = get_current_time();
        if (now >= deadline)
            throw net_connect_exception("tls handshake with " + remote.to_string() + " timeout",
                                        connection_state::timeout);
        socket->sleep(deadline - now);
    }

    last_recv = last_send = get_current_time();
    handshake_deadline = deadline;

    // the connection is open when the settings of peer arrive
    u32 limit = options.max_concurrent_streams;
    endian::cast(limit);
    std::unique_lock<std::mutex> lock(mutex);
    enqueue_locked(make_frame(frame_type::settings, 0, 0, (const byte *)&limit, sizeof(limit)));
}

void connection_t::pump()
{
    while (1)
    {
        std::vector<std::shared_ptr<stream_t>> keep;
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (state == state_t::draining && !go_away_sent)
            {
                if (close_requested)
                    enqueue_locked(make_frame(frame_type::go_away, 0, 0, nullptr, 0));
                go_away_sent = true;
            }
        }
        flush();

        if (!receive(keep))
        {
            bool graceful;
            {
                std::unique_lock<std::mutex> lock(mutex);
                graceful = state == state_t::draining && streams.empty();
            }
            finish_close(graceful ? connection_state::closed : connection_state::close_by_peer,
                         "connection closed by peer", graceful);
            return;
        }
        keep.clear();

        {
            std::unique_lock<std::mutex> lock(mutex);
            if (should_close_locked())
            {
                lock.unlock();
                finish_close(connection_state::closed, "connection closed", true);
                return;
            }
        }

        bool settled;
        {
            std::unique_lock<std::mutex> lock(mutex);
            settled = state != state_t::handshaking;
        }
        auto now = get_current_time();
        if (!settled && now >= handshake_deadline)
            throw net_connect_exception("no settings from " + remote.to_string(), connection_state::timeout);
        if (now - last_recv >= options.idle_timeout)
            throw net_connect_exception("connection idle for " + std::to_string(options.idle_timeout / 1000000) + "s",
                                        connection_state::timeout);
        if (now - last_send >= options.keep_alive_interval)
        {
            u64 stamp = get_timestamp();
            std::unique_lock<std::mutex> lock(mutex);
            enqueue_locked(make_frame(frame_type::ping, 0, 0, (const byte *)&stamp, sizeof(stamp)));
            // count the ping as sent so that it is queued once
            last_send = now;
            continue;
        }

        auto next = std::min(last_recv + options.idle_timeout, last_send + options.keep_alive_interval);
        if (!settled)
            next = std::min(next, handshake_deadline);
        if (next > now)
            socket->sleep(next - now);
    }
}

io_result connection_t::flush()
{
    while (1)
    {
        if (pending_out.get_length() == 0)
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (send_queue.empty())
                return io_result::ok;
            pending_out = std::move(send_queue.front());
            send_queue.pop_front();
            send_queue_bytes -= pending_out.get_length();
            send_cond.notify_all();
        }
        u64 written = 0;
        auto ret = session->write(pending_out.get(), pending_out.get_length(), written);
        if (ret == io_result::ok)
        {
            pending_out.walk_step(written);
            last_send = get_current_time();
            continue;
        }
        if (ret == io_result::cont)
            return ret;
        if (ret == io_result::closed)
            throw net_connect_exception("connection closed by peer", connection_state::close_by_peer);
        throw net_connect_exception("tls write failed: " + session->get_error(), connection_state::close_by_peer);
    }
}

bool connection_t::receive(std::vector<std::shared_ptr<stream_t>> &keep)
{
    while (1)
    {
        u64 n = 0;
        auto ret = session->read(recv_buffer.get_base_ptr() + recv_length, recv_buffer_size - recv_length, n);
        if (ret == io_result::ok)
        {
            recv_length += n;
            last_recv = get_current_time();
            parse_frames(keep);
            continue;
        }
        if (ret == io_result::cont)
            return true;
        if (ret == io_result::closed)
            return false;
        throw net_connect_exception("tls read failed: " + session->get_error(), connection_state::close_by_peer);
    }
}

void connection_t::parse_frames(std::vector<std::shared_ptr<stream_t>> &keep)
{
    byte *base = recv_buffer.get_base_ptr();
    u64 offset = 0;
    {
        std::unique_lock<std::mutex> lock(mutex);
        while (recv_length - offset >= sizeof(frame_head_t))
        {
            frame_head_t head;
            memcpy(&head, base + offset, sizeof(head));
            endian::cast(head);
            if (head.length > max_frame_payload)
                throw net_connect_exception("frame of " + std::to_string(head.length) + " bytes from " +
                                                remote.to_string(),
                                            connection_state::invalid_request);
            if (recv_length - offset < sizeof(frame_head_t) + head.length)
                break;
            on_frame(head, base + offset + sizeof(frame_head_t), keep);
            offset += sizeof(frame_head_t) + head.length;
        }
    }
    if (offset > 0)
    {
        memmove(base, base + offset, recv_length - offset);
        recv_length -= offset;
    }
}

void connection_t::on_frame(const frame_head_t &head, const byte *payload, std::vector<std::shared_ptr<stream_t>> &keep)
{
    switch (head.type)
    {
        case frame_type::ping:
            if (!(head.flags & frame_flag::ack))
                enqueue_locked(make_frame(frame_type::ping, frame_flag::ack, 0, payload, head.length));
            return;
        case frame_type::go_away:
            if (state == state_t::open)
            {
                LOG(INFO) << "connection " << conn_id << " " << remote.to_string() << " is draining by peer";
                state = state_t::draining;
            }
            state_cond.notify_all();
            accept_cond.notify_all();
            open_cond.notify_all();
            return;
        case frame_type::settings:
        {
            if (head.length < sizeof(u32))
                throw net_connect_exception("short settings from " + remote.to_string(),
                                            connection_state::invalid_request);
            u32 limit;
            memcpy(&limit, payload, sizeof(limit));
            endian::cast(limit);
            peer_max_streams = limit;
            if (state == state_t::handshaking)
            {
                state = close_requested ? state_t::draining : state_t::open;
                VLOG(1) << "connection " << conn_id << " established with " << remote.to_string() << ", peer allows "
                        << limit << " streams";
                state_cond.notify_all();
                accept_cond.notify_all();
            }
            open_cond.notify_all();
            return;
        }
        case frame_type::data:
            break;
        default:
            throw net_connect_exception("unknown frame type " + std::to_string(head.type) + " from " +
                                            remote.to_string(),
                                        connection_state::invalid_request);
    }

    u32 id = head.stream_id;
    if (id == 0)
        throw net_connect_exception("data frame without stream from " + remote.to_string(),
                                    connection_state::invalid_request);

    std::shared_ptr<stream_t> stream;
    auto it = streams.find(id);
    if (it != streams.end())
        stream = it->second.lock();
    // the last reference must not drop under the lock
    if (stream)
        keep.push_back(stream);

    if (head.flags & frame_flag::syn)
    {
        // stream ids of a side only grow, a released id is never opened again
        if (stream || !is_peer_stream(id) || id <= last_peer_stream_id)
            throw net_connect_exception("invalid stream id " + std::to_string(id) + " from " + remote.to_string(),
                                        connection_state::invalid_request);
        last_peer_stream_id = id;
        if (head.flags & frame_flag::rst)
            return;
        // the limit is advertised in settings, only a broken peer or a draining connection gets here
        if (state != state_t::open || active_incoming >= options.max_concurrent_streams)
        {
            LOG(WARNING) << "refuse stream " << id << " from " << remote.to_string() << ", " << active_incoming
                         << " streams active";
            enqueue_locked(make_reset_frame(id, 0, transport::reset_code::refused));
            return;
        }
        stream = std::make_shared<stream_t>(shared_from_this(), id, true);
        streams[id] = stream;
        active_incoming++;
        incoming.push_back(stream);
        accept_cond.notify_one();
    }
    else if (!stream)
    {
        if (!(head.flags & frame_flag::rst))
            enqueue_locked(make_reset_frame(id, 0, transport::reset_code::cancelled));
        return;
    }

    if (head.flags & frame_flag::rst)
    {
        u32 code = (u32)transport::reset_code::cancelled;
        if (head.length >= sizeof(u32))
        {
            memcpy(&code, payload, sizeof(code));
            endian::cast(code);
        }
        stream->reset_recv = true;
        stream->peer_code = (transport::reset_code)code;
        stream->recv_chunks.clear();
        release_locked(stream.get());
        stream->read_cond.notify_all();
        send_cond.notify_all();
        return;
    }

    if (head.length > 0 && !stream->remote_fin)
    {
        socket_buffer_t chunk(head.length);
        chunk.expect().origin_length();
        memcpy(chunk.get_base_ptr(), payload, head.length);
        stream->recv_chunks.push_back(std::move(chunk));
    }
    if (head.flags & frame_flag::fin)
    {
        stream->remote_fin = true;
        if (stream->local_fin)
            release_locked(stream.get());
    }
    stream->read_cond.notify_all();
}

void connection_t::finish_close(connection_state st, const std::string &reason, bool graceful)
{
    std::vector<std::shared_ptr<stream_t>> live;
    std::deque<std::shared_ptr<stream_t>> pending;
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (state == state_t::closed)
            return;
        state = state_t::closed;
        close_state = st;
        close_reason = reason;
        for (auto &it : streams)
        {
            auto stream = it.second.lock();
            if (stream)
                live.push_back(stream);
        }
        for (auto &stream : live)
        {
            stream->released = true;
            stream->read_cond.notify_all();
        }
        streams.clear();
        active_incoming = 0;
        active_outgoing = 0;
        pending.swap(incoming);
        send_queue.clear();
        send_queue_bytes = 0;
        state_cond.notify_all();
        accept_cond.notify_all();
        send_cond.notify_all();
        open_cond.notify_all();
    }
    if (graceful && session)
        session->shutdown();
    if (!live.empty())
        LOG(WARNING) << "connection " << conn_id << " " << remote.to_string() << " closed with " << live.size()
                     << " streams alive: " << reason;
    socket->unbind_context();
}

void connection_t::wait_established()
{
    std::unique_lock<std::mutex> lock(mutex);
    state_cond.wait(lock, [this]() { return state != state_t::connecting && state != state_t::handshaking; });
    if (state == state_t::closed)
        throw net_connect_exception(close_reason, close_state);
}

void connection_t::wait_closed()
{
    std::unique_lock<std::mutex> lock(mutex);
    state_cond.wait(lock, [this]() { return state == state_t::closed; });
}

std::shared_ptr<transport::stream_t> connection_t::open_stream()
{
    std::unique_lock<std::mutex> lock(mutex);
    if (state == state_t::open && peer_max_streams == 0)
        throw net_connect_exception("peer " + remote.to_string() + " accepts no streams",
                                    connection_state::stream_refused);
    if (state == state_t::open && active_outgoing >= peer_max_streams)
        VLOG(1) << "connection " << conn_id << " waits for stream credit, " << active_outgoing << " streams open";
    open_cond.wait(lock, [this]() { return state != state_t::open || active_outgoing < peer_max_streams; });
    if (state != state_t::open)
    {
        throw net_connect_exception("connection " + remote.to_string() + " is not open" +
                                        (close_reason.empty() ? "" : ": " + close_reason),
                                    state == state_t::closed ? close_state : connection_state::closed);
    }
    if (next_stream_id > 0xFFFFFFFD)
        throw net_connect_exception("stream ids of connection " + remote.to_string() + " are used up",
                                    connection_state::no_resource);
    u32 id = next_stream_id;
    next_stream_id += 2;
    auto stream = std::make_shared<stream_t>(shared_from_this(), id, false);
    streams[id] = stream;
    active_outgoing++;
    return stream;
}

std::shared_ptr<transport::stream_t> connection_t::accept_stream()
{
    std::unique_lock<std::mutex> lock(mutex);
    accept_cond.wait(lock, [this]() {
        return !incoming.empty() || state == state_t::draining || state == state_t::closed;
    });
    if (incoming.empty())
        return nullptr;
    auto stream = std::move(incoming.front());
    incoming.pop_front();
    return stream;
}

bool connection_t::is_open() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return state == state_t::open;
}

void connection_t::close()
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (state == state_t::closed || close_requested)
            return;
        close_requested = true;
        if (state == state_t::open)
            state = state_t::draining;
        accept_cond.notify_all();
        state_cond.notify_all();
        open_cond.notify_all();
    }
    wake_io();
}

state_t connection_t::get_state() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return state;
}

size_t connection_t::stream_count() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return streams.size();
}

connector_t::connector_t(event_context_t &context, std::shared_ptr<tls::context_t> tls_ctx, options_t options,
                         std::shared_ptr<thread_pool_t> resolver)
    : context(context)
    , tls_ctx(std::move(tls_ctx))
    , options(options)
    , resolver(std::move(resolver))
{
}

std::shared_ptr<transport::connection_t> connector_t::connect(const std::string &address)
{
    // getaddrinfo blocks
    auto addr = co::run_blocking(resolver.get(), [&address]() { return socket_addr_t::parse(address); });
    std::unique_ptr<socket_t> socket(new_tcp_socket());
    auto loop = event_loop_t::current_or_null();
    if (loop != nullptr && &loop->get_context() == &context)
        socket->bind_loop(*loop);
    else
        socket->bind_loop(context.select_loop());

    auto conn = std::make_shared<connection_t>(role_t::connector, std::move(socket), tls_ctx, options);
    conn->start(addr);
    conn->wait_established();
    return conn;
}

} // namespace piecenet::mux
