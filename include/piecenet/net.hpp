/**
* \file net.hpp
* \author piecenet authors
* \brief Platform headers, integer aliases and io results shared by the whole library.
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
/// linux headers
#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#define WOULDBLOCK EAGAIN

#include "net_exception.hpp"

typedef unsigned char byte;

namespace piecenet
{
using i64 = int64_t;
using u64 = uint64_t;
using i32 = int32_t;
using u32 = uint32_t;
using i16 = int16_t;
using u16 = uint16_t;
using i8 = int8_t;
using u8 = uint8_t;

/// Called before run event context. Ignores SIGPIPE and loads the TLS library.
void init_lib();

/// Called when the application is closed
void uninit_lib();

enum io_result
{
    ok,
    /// continue io request
    cont,
    /// connection is closed by peer/self
    closed,
    /// io request is timeout
    timeout,
    /// io request failed
    failed,
};
} // namespace piecenet
