/**
* \file net_exception.hpp
* \author piecenet authors
* \brief Exceptions raised by the network layer. Connection failures carry a connection_state, stream io failures
carry the failed operation and protocol failures carry a protocol_error code.
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
#include <exception>
#include <string>
namespace piecenet
{
enum class connection_state
{
    closed,
    close_by_peer,
    connection_refuse,
    address_in_used,
    no_resource,
    timeout,
    secure_check_failed,
    invalid_request,
    resolve_failed,
    stream_refused,
};

static const char *connection_state_strings[] = {"the connection is closed unexpectedly",
                                                 "the connection is closed by peer",
                                                 "remote connection refused",
                                                 "local address is occupied",
                                                 "system resource limit, check system memory and file desces",
                                                 "connection timeout",
                                                 "security check failed",
                                                 "invalid data request",
                                                 "address resolution failed",
                                                 "stream refused by peer"};

inline const char *to_string(connection_state state) { return connection_state_strings[(int)state]; }

enum class io_operation
{
    read,
    write,
};

enum class protocol_error
{
    /// declared length exceeds the buffer or trailing bytes
    framing,
    bad_header,
    bad_payload,
    /// header message_size differs from the payload length prefix
    size_mismatch,
    /// payload variant not acceptable here
    unexpected_message,
    /// peer failed to service the request
    internal,
};

static const char *protocol_error_strings[] = {"framing error", "malformed header", "malformed payload",
                                               "payload size mismatch", "unexpected message", "internal error"};

inline const char *to_string(protocol_error error) { return protocol_error_strings[(int)error]; }

class net_exception : public std::exception
{
    std::string str;

  public:
    net_exception(std::string str)
        : str(std::move(str))
    {
    }

    const char *what() const noexcept override { return str.c_str(); }
};

class net_connect_exception : public net_exception
{
    connection_state state;

  public:
    net_connect_exception(std::string str, connection_state state)
        : net_exception(std::move(str))
        , state(state)
    {
    }

    connection_state get_state() const { return state; }
};

class net_param_exception : public net_exception
{
  public:
    net_param_exception(std::string str)
        : net_exception(std::move(str))
    {
    }
};

/// decode failures, variant mismatches and errors reported by the peer for one stream
class net_protocol_exception : public net_param_exception
{
    protocol_error error;

  public:
    net_protocol_exception(std::string str, protocol_error error)
        : net_param_exception(std::move(str))
        , error(error)
    {
    }

    protocol_error get_error() const { return error; }
};

class net_io_exception : public net_exception
{
    io_operation operation;

  public:
    net_io_exception(std::string str, io_operation operation)
        : net_exception(std::move(str))
        , operation(operation)
    {
    }

    io_operation get_operation() const { return operation; }
};

} // namespace piecenet
