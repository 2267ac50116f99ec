#include "piecenet/socket_buffer.hpp"
#include <string.h>

namespace piecenet
{
socket_buffer_t::except_buffer_helper_t socket_buffer_t::except_buffer_helper_t::length(u64 len)
{
    if (len > buf->buffer_size)
        buf->resize(len);
    buf->valid_data_length = len;
    buf->walk_offset = 0;
    return *this;
}

socket_buffer_t::except_buffer_helper_t socket_buffer_t::except_buffer_helper_t::origin_length()
{
    return length(buf->buffer_size);
}

socket_buffer_t::socket_buffer_t()
    : ptr(nullptr)
    , block(nullptr)
    , buffer_size(0)
    , valid_data_length(0)
    , walk_offset(0)
{
}

socket_buffer_t::socket_buffer_t(u64 len)
    : ptr(new byte[len])
    , block(new shared_block_t())
    , buffer_size(len)
    , valid_data_length(0)
    , walk_offset(0)
{
    block->refs = 1;
}

socket_buffer_t socket_buffer_t::from_string(const std::string &str)
{
    socket_buffer_t buffer(str.size());
    memcpy(buffer.ptr, str.data(), str.size());
    buffer.valid_data_length = str.size();
    return buffer;
}

void socket_buffer_t::share(const socket_buffer_t &rh)
{
    ptr = rh.ptr;
    block = rh.block;
    buffer_size = rh.buffer_size;
    valid_data_length = rh.valid_data_length;
    walk_offset = rh.walk_offset;
    if (block)
        block->refs++;
}

void socket_buffer_t::steal(socket_buffer_t &rh)
{
    ptr = rh.ptr;
    block = rh.block;
    buffer_size = rh.buffer_size;
    valid_data_length = rh.valid_data_length;
    walk_offset = rh.walk_offset;
    rh.ptr = nullptr;
    rh.block = nullptr;
    rh.buffer_size = rh.valid_data_length = rh.walk_offset = 0;
}

socket_buffer_t::socket_buffer_t(const socket_buffer_t &rh) { share(rh); }

socket_buffer_t &socket_buffer_t::operator=(const socket_buffer_t &rh)
{
    if (&rh != this)
    {
        release();
        share(rh);
    }
    return *this;
}

socket_buffer_t::socket_buffer_t(socket_buffer_t &&rh) noexcept { steal(rh); }

socket_buffer_t &socket_buffer_t::operator=(socket_buffer_t &&rh) noexcept
{
    if (&rh != this)
    {
        release();
        steal(rh);
    }
    return *this;
}

void socket_buffer_t::release()
{
    if (block && --block->refs == 0)
    {
        delete[] ptr;
        delete block;
    }
    ptr = nullptr;
    block = nullptr;
}

socket_buffer_t::~socket_buffer_t() { release(); }

void socket_buffer_t::resize(u64 len)
{
    if (len <= buffer_size && block && block->refs == 1)
        return;
    auto size = std::max(len, buffer_size);
    byte *fresh = new byte[size];
    if (valid_data_length > 0)
        memcpy(fresh, ptr, valid_data_length);
    auto valid = valid_data_length, offset = walk_offset;
    release();
    ptr = fresh;
    block = new shared_block_t();
    block->refs = 1;
    buffer_size = size;
    valid_data_length = valid;
    walk_offset = offset;
}

std::string socket_buffer_t::to_string() const
{
    if (ptr == nullptr)
        return std::string();
    return std::string((const char *)get(), get_length());
}

} // namespace piecenet
