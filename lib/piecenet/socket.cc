#include "piecenet/socket.hpp"
#include <glog/logging.h>

namespace piecenet
{
socket_t::socket_t(int fd)
    : fd(fd)
    , is_connection_closed(true)
    , bound(false)
{
}

socket_t::~socket_t()
{
    if (bound)
        unbind_context();
    ::close(fd);
}

static void set_nonblock(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        ::close(fd);
        throw net_connect_exception("failed to set socket non-blocking", connection_state::no_resource);
    }
}

co::async_result_t<io_result> socket_t::transfer(co::paramter_t &param, socket_buffer_t &buffer, io_operation op)
{
    event_type_t wait_for = op == io_operation::write ? event_type::writable : event_type::readable;
    const char *name = op == io_operation::write ? "send" : "recv";
    if (param.is_stop())
    {
        if (param.get_times() > 0)
            remove_event(wait_for);
        return io_result::timeout;
    }
    if (is_connection_closed)
        throw net_connect_exception(std::string(name) + " on a closed socket", connection_state::closed);

    io_result ret = io_result::ok;
    while (ret == io_result::ok && buffer.get_length() > 0)
    {
        ssize_t len = op == io_operation::write
                          ? send(fd, buffer.get(), buffer.get_length(), MSG_DONTWAIT | MSG_NOSIGNAL)
                          : recv(fd, buffer.get(), buffer.get_length(), MSG_DONTWAIT);
        if (len > 0)
        {
            buffer.walk_step(len);
            continue;
        }
        int e = len == 0 ? 0 : errno;
        if (len == 0 || e == EPIPE)
            ret = io_result::closed;
        else if (e == WOULDBLOCK)
            ret = io_result::cont;
        else if (e == ECONNREFUSED)
            throw net_connect_exception(std::string(name) + " refused", connection_state::connection_refuse);
        else if (e == ECONNRESET)
            throw net_connect_exception(std::string(name) + " reset by peer", connection_state::close_by_peer);
        else if (e != EINTR)
            throw net_io_exception(std::string(name) + " failed, errno " + std::to_string(e), op);
    }

    if (ret == io_result::cont)
    {
        if (param.get_times() == 0)
            add_event(wait_for);
        return {};
    }
    if (ret == io_result::closed)
        is_connection_closed = true;
    if (param.get_times() > 0)
        remove_event(wait_for);
    buffer.finish_walk();
    return ret;
}

socket_addr_t socket_t::local_addr()
{
    sockaddr_in in;
    socklen_t len = sizeof(sockaddr_in);
    if (getsockname(fd, (sockaddr *)&in, &len) == 0)
    {
        local = in;
    }
    return local;
}

socket_addr_t socket_t::remote_addr()
{
    sockaddr_in in;
    socklen_t len = sizeof(sockaddr_in);
    if (getpeername(fd, (sockaddr *)&in, &len) == 0)
    {
        remote = in;
    }
    return remote;
}

void socket_t::on_event(event_context_t &context, event_type_t type)
{
    if (type & (event_type::readable | event_type::writable | event_type::error))
    {
        start();
    }
}

void socket_t::bind_context(event_context_t &context) { bind_loop(context.select_loop()); }

void socket_t::bind_loop(event_loop_t &loop)
{
    if (bound)
        unbind_context();
    set_loop(&loop);
    loop.add_event_handler(fd, this);
    bound = true;
}

void socket_t::unbind_context()
{
    if (!bound)
        return;
    get_loop()->remove_event_handler(fd, this);
    bound = false;
}

void socket_t::add_event(event_type_t type) { get_loop()->link(fd, type); }

void socket_t::remove_event(event_type_t type) { get_loop()->unlink(fd, type); }

co::async_result_t<io_result> socket_awrite(co::paramter_t &param, socket_t *socket, socket_buffer_t &buffer)
{
    return socket->transfer(param, buffer, io_operation::write);
}

co::async_result_t<io_result> socket_aread(co::paramter_t &param, socket_t *socket, socket_buffer_t &buffer)
{
    return socket->transfer(param, buffer, io_operation::read);
}

socket_t *new_tcp_socket()
{
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        throw net_connect_exception("failed to start socket.", connection_state::no_resource);
    set_nonblock(fd);
    return new socket_t(fd);
}

socket_t *reuse_addr_socket(socket_t *socket, bool reuse)
{
    int opt = reuse;
    if (setsockopt(socket->get_raw_handle(), SOL_SOCKET, SO_REUSEADDR, (char *)&opt, sizeof(opt)) != 0)
        LOG(WARNING) << "failed to set SO_REUSEADDR, errno " << errno;
    return socket;
}

socket_t *set_nodelay(socket_t *socket, bool nodelay)
{
    int opt = nodelay;
    if (setsockopt(socket->get_raw_handle(), IPPROTO_TCP, TCP_NODELAY, (char *)&opt, sizeof(opt)) != 0)
        LOG(WARNING) << "failed to set TCP_NODELAY, errno " << errno;
    return socket;
}

co::async_result_t<io_result> connect_to(co::paramter_t &param, socket_t *socket, socket_addr_t socket_to_addr)
{
    if (param.is_stop())
    {
        socket->remove_event(event_type::readable | event_type::writable);
        return io_result::timeout;
    }

    socklen_t len = sizeof(sockaddr_in);
    auto addr = socket_to_addr.get_raw_addr();

    if (connect(socket->get_raw_handle(), (sockaddr *)&addr, len) == 0)
    {
        socket->is_connection_closed = false;
        socket->remove_event(event_type::readable | event_type::writable);
        return co::async_result_t<io_result>(io_result::ok);
    }
    int e = errno;
    if (e == EINPROGRESS || e == EALREADY || e == EINTR)
    {
        socket->add_event(event_type::readable | event_type::writable);
        return co::async_result_t<io_result>();
    }
    else if (e == EISCONN)
    {
        socket->is_connection_closed = false;
        socket->remove_event(event_type::readable | event_type::writable);
        return co::async_result_t<io_result>(io_result::ok);
    }
    socket->remove_event(event_type::readable | event_type::writable);
    VLOG(1) << "connect to " << socket_to_addr.to_string() << " failed, errno " << e;
    if (e == ECONNREFUSED)
        throw net_connect_exception("failed to connect " + socket_to_addr.to_string(),
                                    connection_state::connection_refuse);
    return co::async_result_t<io_result>(io_result::failed);
}

socket_t *bind_at(socket_t *socket, socket_addr_t socket_to_addr)
{
    socklen_t len = sizeof(sockaddr_in);
    auto addr = socket_to_addr.get_raw_addr();
    if (bind(socket->get_raw_handle(), (sockaddr *)&addr, len) != 0)
    {
        throw net_connect_exception("failed to bind address " + socket_to_addr.to_string(),
                                    connection_state::address_in_used);
    }
    return socket;
}

socket_t *listen_from(socket_t *socket, int max_wait_client)
{
    if (listen(socket->get_raw_handle(), max_wait_client) != 0)
    {
        throw net_connect_exception("failed to listen server.", connection_state::no_resource);
    }
    return socket;
}

co::async_result_t<socket_t *> accept_from(co::paramter_t &param, socket_t *socket)
{
    if (param.is_stop())
    {
        socket->remove_event(event_type::readable);
        return nullptr;
    }

    int fd = accept4(socket->get_raw_handle(), 0, 0, SOCK_CLOEXEC);
    if (fd < 0)
    {
        int r = errno;
        if (r == WOULDBLOCK || r == EINTR || r == ECONNABORTED)
        {
            // wait
            socket->add_event(event_type::readable);
            return co::async_result_t<socket_t *>();
        }
        socket->remove_event(event_type::readable);

        throw net_connect_exception("failed to accept " + socket->local_addr().to_string(),
                                    connection_state::no_resource);
    }

    set_nonblock(fd);
    auto socket2 = new socket_t(fd);
    socket2->is_connection_closed = false;
    return socket2;
}

void close_socket(socket_t *socket) { delete socket; }

} // namespace piecenet
