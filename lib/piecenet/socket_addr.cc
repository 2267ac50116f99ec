#include "piecenet/socket_addr.hpp"
#include <cstring>
#include <sstream>
#include <string>

namespace piecenet
{
socket_addr_t::socket_addr_t()
    : so_addr({})
{
    so_addr.sin_zero[0] = 1;
}

socket_addr_t::socket_addr_t(int port)
    : so_addr({})
{
    so_addr.sin_family = AF_INET;
    so_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    so_addr.sin_port = htons(port);
}

socket_addr_t::socket_addr_t(u32 addr, int port)
    : so_addr({})
{
    so_addr.sin_family = AF_INET;
    so_addr.sin_addr.s_addr = htonl(addr);
    so_addr.sin_port = htons(port);
}

socket_addr_t::socket_addr_t(sockaddr_in addr)
    : so_addr(addr)
{
}

socket_addr_t::socket_addr_t(std::string addr, int port)
    : so_addr({})
{
    so_addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, addr.c_str(), &so_addr.sin_addr) != 1)
        so_addr.sin_zero[0] = 1;
    so_addr.sin_port = htons(port);
}

std::string socket_addr_t::get_addr() const
{
    if (so_addr.sin_zero[0])
        return "invalid address";
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &so_addr.sin_addr, buf, sizeof(buf)) == nullptr)
        return "invalid address";
    return buf;
}

std::string socket_addr_t::to_string() const
{
    std::stringstream ss;
    ss << get_addr() << ":" << get_port();
    return ss.str();
}

int socket_addr_t::get_port() const { return ntohs(so_addr.sin_port); }

socket_addr_t socket_addr_t::resolve(const std::string &host, int port)
{
    socket_addr_t addr(host, port);
    if (addr.is_valid())
        return addr;

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *result = nullptr;
    int err = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (err != 0 || result == nullptr)
    {
        throw net_connect_exception("failed to resolve " + host + ": " + gai_strerror(err),
                                    connection_state::resolve_failed);
    }
    sockaddr_in in = *(sockaddr_in *)result->ai_addr;
    freeaddrinfo(result);
    in.sin_port = htons(port);
    return socket_addr_t(in);
}

socket_addr_t socket_addr_t::parse(const std::string &addr)
{
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= addr.size())
        throw net_param_exception("invalid address " + addr + ", expect host:port");
    auto port_str = addr.substr(pos + 1);
    for (auto c : port_str)
    {
        if (c < '0' || c > '9')
            throw net_param_exception("invalid port in address " + addr);
    }
    if (port_str.size() > 5)
        throw net_param_exception("invalid port in address " + addr);
    int port = std::stoi(port_str);
    if (port > 65535)
        throw net_param_exception("invalid port in address " + addr);
    return resolve(addr.substr(0, pos), port);
}

} // namespace piecenet
