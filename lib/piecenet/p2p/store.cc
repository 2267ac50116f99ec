#include "piecenet/p2p/store.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <glog/logging.h>
#include <mutex>
#include <openssl/evp.h>
#include <sstream>

namespace piecenet::p2p
{
namespace fs = std::filesystem;

std::string make_piece_id(const std::string &task_id, u32 number) { return task_id + "-" + std::to_string(number); }

std::string sha256_digest(const byte *data, u64 length)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data, length, md, &md_len, EVP_sha256(), nullptr) != 1)
        throw storage_exception("failed to compute sha256 digest");
    static const char hex[] = "0123456789abcdef";
    std::string str = "sha256:";
    for (unsigned int i = 0; i < md_len; i++)
    {
        str += hex[md[i] >> 4];
        str += hex[md[i] & 0xF];
    }
    return str;
}

proto::Piece to_wire(const piece_record_t &piece, bool with_content)
{
    proto::Piece p;
    p.set_number(piece.number);
    if (piece.parent_id)
        p.set_parent_id(*piece.parent_id);
    p.set_offset(piece.offset);
    p.set_length(piece.length);
    p.set_digest(piece.digest);
    if (with_content && piece.content)
        p.set_content(*piece.content);
    if (piece.traffic_type)
        p.set_traffic_type(*piece.traffic_type);
    p.set_cost(piece.cost);
    p.set_created_at(piece.created_at);
    p.set_updated_at(piece.updated_at);
    return p;
}

proto::Task to_wire(const task_record_t &task, const std::vector<piece_record_t> &pieces)
{
    proto::Task t;
    t.set_id(task.id);
    t.set_url(task.url);
    t.set_type(task.type);
    for (auto &param : task.filtered_query_params)
        t.add_filtered_query_params(param);
    for (auto &it : task.request_header)
        (*t.mutable_request_header())[it.first] = it.second;
    if (task.piece_length)
        t.set_piece_length(*task.piece_length);
    if (task.content_length)
        t.set_content_length(*task.content_length);
    if (task.piece_count)
        t.set_piece_count(*task.piece_count);
    if (task.range)
    {
        t.mutable_range()->set_start(task.range->start);
        t.mutable_range()->set_length(task.range->length);
    }
    for (auto &piece : pieces)
        *t.add_pieces() = to_wire(piece, false);
    t.set_state(task.state);
    t.set_peer_count(task.peer_count);
    t.set_created_at(task.created_at);
    t.set_updated_at(task.updated_at);
    return t;
}

void memory_store_t::add_task(task_record_t task)
{
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto id = task.id;
    tasks[id] = std::move(task);
}

void memory_store_t::add_piece(piece_record_t piece)
{
    if (piece.id.empty())
        piece.id = make_piece_id(piece.task_id, piece.number);
    std::unique_lock<std::shared_mutex> lock(mutex);
    task_pieces[piece.task_id][piece.number] = piece.id;
    auto id = piece.id;
    pieces[id] = std::move(piece);
}

void memory_store_t::add_persistent_cache_piece(piece_record_t piece)
{
    if (piece.id.empty())
        piece.id = make_piece_id(piece.task_id, piece.number);
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto id = piece.id;
    cache_pieces[id] = std::move(piece);
}

size_t memory_store_t::load_directory(const std::string &dir, u64 piece_length)
{
    if (piece_length == 0)
        throw storage_exception("piece length must be greater than 0");

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
        throw storage_exception("failed to open directory " + dir + ": " + ec.message());

    auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                   .count();
    size_t count = 0;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            throw storage_exception("failed to read directory " + dir + ": " + ec.message());
        if (!it->is_regular_file())
            continue;

        auto path = it->path();
        std::ifstream file(path, std::ios::binary);
        if (!file)
            throw storage_exception("failed to open " + path.string());
        std::stringstream ss;
        ss << file.rdbuf();
        std::string data = ss.str();

        task_record_t task;
        task.id = path.filename().string();
        task.url = "file://" + fs::absolute(path).string();
        task.piece_length = piece_length;
        task.content_length = data.size();
        task.piece_count = (data.size() + piece_length - 1) / piece_length;
        task.state = "Succeeded";
        task.created_at = task.updated_at = now;
        task.storage_path = path.string();

        for (u32 number = 0; number < *task.piece_count; number++)
        {
            piece_record_t piece;
            piece.task_id = task.id;
            piece.number = number;
            piece.offset = (u64)number * piece_length;
            piece.length = std::min<u64>(piece_length, data.size() - piece.offset);
            piece.content = data.substr(piece.offset, piece.length);
            piece.digest = sha256_digest((const byte *)piece.content->data(), piece.length);
            piece.traffic_type = proto::LOCAL_PEER;
            piece.created_at = piece.updated_at = now;
            piece.storage_path = task.storage_path;
            piece.storage_key = make_piece_id(task.id, number);
            add_piece(std::move(piece));
        }
        LOG(INFO) << "load task " << task.id << " " << data.size() << " bytes, " << *task.piece_count << " pieces";
        add_task(std::move(task));
        count++;
    }
    return count;
}

std::optional<piece_record_t> memory_store_t::lookup_piece(const std::string &piece_id)
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = pieces.find(piece_id);
    if (it == pieces.end())
        return std::nullopt;
    return it->second;
}

std::optional<task_record_t> memory_store_t::lookup_task(const std::string &task_id)
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = tasks.find(task_id);
    if (it == tasks.end())
        return std::nullopt;
    return it->second;
}

std::vector<piece_record_t> memory_store_t::list_pieces(const std::string &task_id)
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<piece_record_t> result;
    auto it = task_pieces.find(task_id);
    if (it == task_pieces.end())
        return result;
    for (auto &number : it->second)
    {
        auto piece = pieces.find(number.second);
        if (piece != pieces.end())
            result.push_back(piece->second);
    }
    return result;
}

std::optional<piece_record_t> memory_store_t::lookup_persistent_cache_piece(const std::string &piece_id)
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = cache_pieces.find(piece_id);
    if (it == cache_pieces.end())
        return std::nullopt;
    return it->second;
}

} // namespace piecenet::p2p
