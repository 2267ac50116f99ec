/**
* \file socket_buffer.hpp
* \author piecenet authors
* \brief Reference counted byte buffer with a walk offset, used by all reads and writes of sockets and streams.
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
#include <algorithm>
#include <atomic>
#include <google/protobuf/message_lite.h>
#include <string>

namespace piecenet
{

/// Copies share the bytes, the last owner frees them.
/// [0, valid length) holds data and the walk offset marks the part consumed by reads and writes.
class socket_buffer_t
{
    struct shared_block_t
    {
        std::atomic_int refs;
    };

    byte *ptr;
    shared_block_t *block;
    /// capacity
    u64 buffer_size;
    u64 valid_data_length;
    u64 walk_offset;

  private:
    void release();
    void share(const socket_buffer_t &rh);
    void steal(socket_buffer_t &rh);

  public:
    /// set the valid length before a read or a write
    struct except_buffer_helper_t
    {
        socket_buffer_t *buf;
        explicit except_buffer_helper_t(socket_buffer_t *buf)
            : buf(buf)
        {
        }

        /// valid length is len, grow when it exceeds the capacity
        except_buffer_helper_t length(u64 len);
        /// valid length is the capacity
        except_buffer_helper_t origin_length();

        socket_buffer_t &operator()() const { return *buf; }
    };

    /// empty, nothing allocated
    socket_buffer_t();
    /// len bytes of capacity, no valid data
    explicit socket_buffer_t(u64 len);
    explicit socket_buffer_t(const google::protobuf::MessageLite &msg)
        : socket_buffer_t(msg.ByteSizeLong())
    {
        msg.SerializeWithCachedSizesToArray(ptr);
        valid_data_length = buffer_size;
    }

    socket_buffer_t(const socket_buffer_t &rh);
    socket_buffer_t &operator=(const socket_buffer_t &rh);
    socket_buffer_t(socket_buffer_t &&rh) noexcept;
    socket_buffer_t &operator=(socket_buffer_t &&rh) noexcept;
    ~socket_buffer_t();

    static socket_buffer_t from_string(const std::string &str);

    byte *get_base_ptr() const { return ptr; }

    /// data at the walk offset
    byte *get() const { return ptr + walk_offset; }

    /// valid bytes after the walk offset
    u64 get_length() const { return valid_data_length - walk_offset; }

    /// the walked part becomes the valid data
    void finish_walk()
    {
        valid_data_length = walk_offset;
        walk_offset = 0;
    }

    except_buffer_helper_t expect() { return except_buffer_helper_t(this); }

    std::string to_string() const;

    void walk_step(u64 delta) { walk_offset = std::min(walk_offset + delta, valid_data_length); }

    /// grow the buffer to len bytes and keep the data and the offset
    ///\note a shared buffer is copied first
    void resize(u64 len);
};

} // namespace piecenet
