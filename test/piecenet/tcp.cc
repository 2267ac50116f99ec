#include "piecenet/tcp.hpp"
#include "helper.hpp"
#include "piecenet/co.hpp"
#include "piecenet/event.hpp"
#include "piecenet/socket.hpp"
#include "piecenet/socket_buffer.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <memory>

using namespace piecenet;
static std::string test_data = "test string";

TEST(TCPTest, StreamConnection)
{
    event_context_t ctx(event_strategy::AUTO);
    tcp::server_t server;
    std::unique_ptr<socket_t> accepted;

    server.on_client_join([&accepted](tcp::server_t &s, socket_t *socket) {
        accepted.reset(socket);
        socket->bind_loop(event_loop_t::current());
        socket->run([socket]() {
            socket_buffer_t buffer = socket_buffer_t::from_string(test_data);
            buffer.expect().origin_length();
            GTEST_ASSERT_EQ(co::await(socket_awrite, socket, buffer), io_result::ok);

            buffer.expect().origin_length();
            GTEST_ASSERT_EQ(co::await(socket_aread, socket, buffer), io_result::ok);
            GTEST_ASSERT_EQ(buffer.to_string(), test_data);
        });
    });
    server.listen(ctx, socket_addr_t("127.0.0.1", 0), 1, true);
    auto addr = server.local_addr();
    GTEST_ASSERT_NE(addr.get_port(), 0);

    std::unique_ptr<socket_t> client(new_tcp_socket());
    client->bind_loop(event_loop_t::current());
    auto socket = client.get();
    socket->run([socket, addr, &ctx]() {
        GTEST_ASSERT_EQ(co::await(connect_to, socket, addr), io_result::ok);
        socket_buffer_t buffer(test_data.size());
        buffer.expect().origin_length();
        GTEST_ASSERT_EQ(co::await(socket_aread, socket, buffer), io_result::ok);
        GTEST_ASSERT_EQ(buffer.to_string(), test_data);
        buffer.expect().origin_length();
        GTEST_ASSERT_EQ(co::await(socket_awrite, socket, buffer), io_result::ok);
        ctx.exit_all(0);
    });

    test::fail_after(ctx, make_timespan(1, 500));
    GTEST_ASSERT_EQ(ctx.run(), 0);
    server.close_server();
}

TEST(TCPTest, StopAcceptor)
{
    event_context_t ctx(event_strategy::AUTO);
    tcp::server_t server;
    int joined = 0;

    server.on_client_join([&joined](tcp::server_t &s, socket_t *socket) {
        joined++;
        close_socket(socket);
    });
    server.listen(ctx, socket_addr_t("127.0.0.1", 0), 4, true);
    GTEST_ASSERT_EQ(server.get_socket()->is_running(), true);

    /// stop from another thread
    std::thread thd([&server]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        server.stop();
    });

    test::spawn([&server, &ctx]() {
        for (int i = 0; i < 100 && server.get_socket()->is_running(); i++)
            test::sleep_for(make_timespan(0, 10));
        ctx.exit_all(server.get_socket()->is_running() ? -1 : 0);
    });

    test::fail_after(ctx, make_timespan(2));
    GTEST_ASSERT_EQ(ctx.run(), 0);
    thd.join();
    GTEST_ASSERT_EQ(joined, 0);
    server.close_server();
    GTEST_ASSERT_EQ(server.get_socket(), nullptr);
}

TEST(TCPTest, ConnectRefused)
{
    event_context_t ctx(event_strategy::AUTO);

    /// find a free port and release it
    socket_addr_t addr;
    {
        tcp::server_t server;
        server.listen(ctx, socket_addr_t("127.0.0.1", 0), 1, true);
        addr = server.local_addr();
        server.close_server();
    }

    bool refused = false;
    std::unique_ptr<socket_t> client(new_tcp_socket());
    client->bind_loop(event_loop_t::current());
    auto socket = client.get();
    socket->run([socket, addr, &ctx, &refused]() {
        try
        {
            co::await(connect_to, socket, addr);
        } catch (net_connect_exception &e)
        {
            refused = e.get_state() == connection_state::connection_refuse;
        }
        ctx.exit_all(0);
    });

    test::fail_after(ctx, make_timespan(2));
    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(refused, true);
}
