/**
* \file tls.hpp
* \author piecenet authors
* \brief TLS contexts and non-blocking TLS sessions over a socket, built on OpenSSL.
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
#include <memory>
#include <openssl/ssl.h>
#include <string>

namespace piecenet::tls
{

enum class verify_mode
{
    /// accept any server certificate, development only
    trust_all,
    /// validate the chain and the host name
    verify_peer,
};

struct client_options_t
{
    verify_mode mode = verify_mode::trust_all;
    /// trusted CA in PEM, the system store is used when it is empty
    std::string ca_file;
    /// expected name in the server certificate, sent as SNI too
    std::string server_name = "localhost";
    /// client certificate for mutual authentication
    std::string cert_file;
    std::string key_file;
};

struct server_options_t
{
    std::string cert_file;
    std::string key_file;
    /// require and verify client certificates issued by this CA
    std::string client_ca_file;
    /// subject of the ephemeral certificate when cert_file/key_file are not set
    std::string self_signed_name = "localhost";
};

/// PEM encoded certificate and private key
struct certificate_t
{
    std::string cert_pem;
    std::string key_pem;
};

/// generate a self-signed P-256 certificate for name and 127.0.0.1
certificate_t make_self_signed(const std::string &name);

/// pop all errors of the openssl error queue of this thread
std::string last_error_string();

class context_t
{
    SSL_CTX *ctx;
    bool client;
    bool verify;
    std::string server_name;

    context_t(SSL_CTX *ctx, bool client);

  public:
    ~context_t();
    context_t(const context_t &) = delete;
    context_t &operator=(const context_t &) = delete;

    ///\throw net_param_exception when the files can't be loaded
    static std::shared_ptr<context_t> make_client(const client_options_t &options);
    static std::shared_ptr<context_t> make_server(const server_options_t &options);

    SSL_CTX *get() const { return ctx; }
    bool is_client() const { return client; }
    bool is_verify_peer() const { return verify; }
    const std::string &get_server_name() const { return server_name; }
};

/// non-blocking TLS session over fd, the fd is not owned
class session_t
{
    std::shared_ptr<context_t> ctx;
    SSL *ssl;
    bool established;
    std::string error;

    io_result map_error(int ret);

  public:
    session_t(std::shared_ptr<context_t> ctx, int fd);
    ~session_t();
    session_t(const session_t &) = delete;
    session_t &operator=(const session_t &) = delete;

    /// drive the handshake, cont means waiting for the socket
    io_result handshake();

    /// read at most len bytes, read_len is set when ok
    io_result read(byte *data, u64 len, u64 &read_len);

    /// write at most len bytes, written is set when ok
    io_result write(const byte *data, u64 len, u64 &written);

    /// send close_notify without waiting for the peer
    void shutdown();

    bool is_established() const { return established; }

    /// reason of the last failed result
    const std::string &get_error() const { return error; }
};

} // namespace piecenet::tls
