#include "piecenet/socket_buffer.hpp"
#include <gtest/gtest.h>
#include <string.h>
#include <utility>

using namespace piecenet;

TEST(SocketBufferTest, CopyShares)
{
    auto a = socket_buffer_t::from_string("abc");
    socket_buffer_t b = a;
    GTEST_ASSERT_EQ(a.get_base_ptr(), b.get_base_ptr());

    // shared bytes are copied before they can change
    b.resize(2);
    GTEST_ASSERT_NE(a.get_base_ptr(), b.get_base_ptr());
    GTEST_ASSERT_EQ(b.to_string(), "abc");
    b.get()[0] = 'x';
    GTEST_ASSERT_EQ(a.to_string(), "abc");
    GTEST_ASSERT_EQ(b.to_string(), "xbc");
}

TEST(SocketBufferTest, Move)
{
    auto a = socket_buffer_t::from_string("abc");
    auto base = a.get_base_ptr();
    socket_buffer_t b(std::move(a));
    GTEST_ASSERT_EQ(b.get_base_ptr(), base);
    GTEST_ASSERT_EQ(a.get_base_ptr(), nullptr);
    GTEST_ASSERT_EQ(a.to_string(), "");

    socket_buffer_t c;
    c = std::move(b);
    GTEST_ASSERT_EQ(c.to_string(), "abc");
}

TEST(SocketBufferTest, ResizeKeepsOffset)
{
    auto buffer = socket_buffer_t::from_string("hello world");
    buffer.walk_step(6);
    buffer.resize(64);
    GTEST_ASSERT_EQ(buffer.get_length(), 5);
    GTEST_ASSERT_EQ(buffer.to_string(), "world");
}

TEST(SocketBufferTest, Walk)
{
    auto buffer = socket_buffer_t::from_string("hello world");
    buffer.walk_step(100);
    GTEST_ASSERT_EQ(buffer.get_length(), 0);
    buffer.finish_walk();
    GTEST_ASSERT_EQ(buffer.to_string(), "hello world");

    buffer.walk_step(5);
    buffer.finish_walk();
    GTEST_ASSERT_EQ(buffer.to_string(), "hello");
}

TEST(SocketBufferTest, ExpectGrows)
{
    auto buffer = socket_buffer_t::from_string("abcd");
    buffer.expect().length(20);
    GTEST_ASSERT_EQ(buffer.get_length(), 20);
    GTEST_ASSERT_EQ(memcmp(buffer.get(), "abcd", 4), 0);

    buffer.expect().length(2);
    GTEST_ASSERT_EQ(buffer.to_string(), "ab");
    buffer.expect().origin_length();
    GTEST_ASSERT_EQ(buffer.get_length(), 20);
}
