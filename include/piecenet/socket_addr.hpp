/**
* \file socket_addr.hpp
* \author piecenet authors
* \brief IPv4 socket address, resolved from a host name or parsed from "host:port".
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
#include <string>
namespace piecenet
{
class socket_addr_t
{
    sockaddr_in so_addr;

  public:
    socket_addr_t();
    /// init address (any:port)
    socket_addr_t(int port);
    socket_addr_t(u32 addr, int port);
    socket_addr_t(sockaddr_in addr);
    socket_addr_t(std::string addr, int port);
    std::string to_string() const;
    std::string get_addr() const;
    int get_port() const;
    bool is_valid() const { return so_addr.sin_zero[0] == 0; }

    sockaddr_in get_raw_addr() const { return so_addr; }

    bool operator==(const socket_addr_t &addr) const
    {
        return addr.so_addr.sin_port == so_addr.sin_port && addr.so_addr.sin_family == so_addr.sin_family &&
               addr.so_addr.sin_addr.s_addr == so_addr.sin_addr.s_addr;
    }

    bool operator!=(const socket_addr_t &addr) const { return !operator==(addr); }

    /// resolve host name to the first IPv4 address
    ///\throw net_connect_exception with resolve_failed
    static socket_addr_t resolve(const std::string &host, int port);

    /// parse "host:port", the host may be a name
    ///\throw net_param_exception when the text is not host:port
    static socket_addr_t parse(const std::string &addr);
};
}; // namespace piecenet
