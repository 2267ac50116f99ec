#include "piecenet/tcp.hpp"
#include "piecenet/socket.hpp"
#include <functional>
#include <glog/logging.h>

namespace piecenet::tcp
{

server_t::server_t()
    : server_socket(nullptr)
    , context(nullptr)
    , stopping(false)
{
}

server_t::~server_t() { close_server(); }

void server_t::wait_client()
{
    while (!stopping)
    {
        socket_t *socket;
        try
        {
            socket = co::await([this](co::paramter_t &param) -> co::async_result_t<socket_t *> {
                if (stopping)
                    return co::async_result_t<socket_t *>(nullptr);
                return accept_from(param, server_socket);
            });
        } catch (const net_connect_exception &e)
        {
            LOG(WARNING) << e.what();
            if (error_handler)
                error_handler(*this, e.get_state());
            /// out of descriptors, give the peers some time
            server_socket->sleep(make_timespan(0, 100));
            continue;
        }
        if (socket == nullptr)
            break;

        VLOG(2) << "accept client " << socket->remote_addr().to_string();
        if (join_handler)
            join_handler(*this, socket);
        else
            close_socket(socket);
    }
    server_socket->unbind_context();
    VLOG(1) << "acceptor " << server_socket->local_addr().to_string() << " stopped";
}

void server_t::listen(event_context_t &context, socket_addr_t address, int max_client, bool reuse_addr)
{
    if (server_socket != nullptr)
        return;
    this->context = &context;
    stopping = false;
    auto socket = new_tcp_socket();
    try
    {
        if (reuse_addr)
            reuse_addr_socket(socket, true);

        listen_from(bind_at(socket, address), max_client);
    } catch (const net_connect_exception &e)
    {
        close_socket(socket);
        throw;
    }
    server_socket = socket;

    server_socket->bind_context(context);
    server_socket->run(std::bind(&server_t::wait_client, this));
    server_socket->wake_up_thread();
}

void server_t::stop()
{
    stopping = true;
    if (server_socket == nullptr)
        return;
    server_socket->start();
    server_socket->wake_up_thread();
}

void server_t::close_server()
{
    if (!server_socket)
        return;
    close_socket(server_socket);
    server_socket = nullptr;
}

socket_addr_t server_t::local_addr()
{
    if (server_socket == nullptr)
        return socket_addr_t();
    return server_socket->local_addr();
}

server_t &server_t::on_client_join(handler_t handler)
{
    join_handler = std::move(handler);
    return *this;
}

server_t &server_t::on_client_error(error_handler_t handler)
{
    error_handler = std::move(handler);
    return *this;
}

} // namespace piecenet::tcp
