/**
* \file store.hpp
* \author piecenet authors
* \brief Content store consulted by the server, and an in-memory implementation.
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
#include "../net.hpp"
#include "piecenet.pb.h"
#include <exception>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace piecenet::p2p
{

/// failure inside a content store, never sent to peers
class storage_exception : public std::exception
{
    std::string str;

  public:
    storage_exception(const std::string &str)
        : str(str)
    {
    }
    const char *what() const noexcept override { return str.c_str(); }
};

struct piece_record_t
{
    /// "{task_id}-{number}"
    std::string id;
    std::string task_id;
    u32 number = 0;
    std::optional<std::string> parent_id;
    u64 offset = 0;
    u64 length = 0;
    std::string digest;
    std::optional<std::string> content;
    std::optional<proto::TrafficType> traffic_type;
    u64 cost = 0;
    /// seconds since epoch
    i64 created_at = 0;
    i64 updated_at = 0;

    /// storage layer only
    std::string storage_key;
    std::string storage_path;
};

struct range_t
{
    u64 start;
    u64 length;
};

struct task_record_t
{
    std::string id;
    std::string url;
    proto::TaskType type = proto::STANDARD;
    std::vector<std::string> filtered_query_params;
    std::map<std::string, std::string> request_header;
    std::optional<u64> piece_length;
    std::optional<u64> content_length;
    std::optional<u32> piece_count;
    std::optional<range_t> range;
    std::string state;
    u32 peer_count = 0;
    i64 created_at = 0;
    i64 updated_at = 0;

    /// storage layer only
    std::string storage_path;
};

/// lookups of the server, called from many coroutines and threads at the same time
///\note all functions throw storage_exception on failure, a miss is not a failure
class content_store_t
{
  public:
    virtual ~content_store_t(){};

    virtual std::optional<piece_record_t> lookup_piece(const std::string &piece_id) = 0;
    virtual std::optional<task_record_t> lookup_task(const std::string &task_id) = 0;
    /// pieces ordered by number, empty for unknown tasks
    virtual std::vector<piece_record_t> list_pieces(const std::string &task_id) = 0;
    virtual std::optional<piece_record_t> lookup_persistent_cache_piece(const std::string &piece_id) = 0;
};

std::string make_piece_id(const std::string &task_id, u32 number);

/// wire projection without the storage layer fields
proto::Piece to_wire(const piece_record_t &piece, bool with_content = true);

/// wire projection, pieces are listed without content
proto::Task to_wire(const task_record_t &task, const std::vector<piece_record_t> &pieces);

class memory_store_t : public content_store_t
{
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, task_record_t> tasks;
    std::unordered_map<std::string, piece_record_t> pieces;
    /// task id -> number -> piece id
    std::unordered_map<std::string, std::map<u32, std::string>> task_pieces;
    std::unordered_map<std::string, piece_record_t> cache_pieces;

  public:
    memory_store_t() = default;
    memory_store_t(const memory_store_t &) = delete;
    memory_store_t &operator=(const memory_store_t &) = delete;

    /// replace the task with the same id
    void add_task(task_record_t task);
    /// the id is generated when it is empty
    void add_piece(piece_record_t piece);
    void add_persistent_cache_piece(piece_record_t piece);

    /// register every regular file of dir as a task named after the file, split into pieces of piece_length with
    /// inline content
    ///\return task count
    ///\throw storage_exception when dir can't be read
    size_t load_directory(const std::string &dir, u64 piece_length);

    std::optional<piece_record_t> lookup_piece(const std::string &piece_id) override;
    std::optional<task_record_t> lookup_task(const std::string &task_id) override;
    std::vector<piece_record_t> list_pieces(const std::string &task_id) override;
    std::optional<piece_record_t> lookup_persistent_cache_piece(const std::string &piece_id) override;
};

/// "sha256:" + hex digest
std::string sha256_digest(const byte *data, u64 length);

} // namespace piecenet::p2p
