#pragma once
#include "piecenet/event.hpp"
#include "piecenet/execute_context.hpp"
#include "piecenet/mux.hpp"
#include "piecenet/net_exception.hpp"
#include "piecenet/socket.hpp"
#include "piecenet/tcp.hpp"
#include "piecenet/timer.hpp"
#include "piecenet/tls.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace piecenet::test
{

/// exit the loops with -1 when the test hangs
inline void fail_after(event_context_t &ctx, microsecond_t span)
{
    event_loop_t::current().add_timer(make_timer(span, [&ctx]() {
        ctx.exit_all(-1);
        std::string str = "timeout";
        GTEST_ASSERT_EQ(str, "");
    }));
}

inline void spawn(std::function<void()> func) { execute_context_t::spawn(event_loop_t::current(), std::move(func)); }

inline void sleep_for(microsecond_t span) { execute_context_t::current()->sleep(span); }

/// accept multiplexed connections on 127.0.0.1 with a random port
class mux_acceptor_t
{
  public:
    using handler_t = std::function<void(std::shared_ptr<mux::connection_t>)>;

  private:
    tcp::server_t server;
    std::shared_ptr<tls::context_t> tls_ctx;
    mux::options_t options;
    handler_t handler;
    std::vector<std::shared_ptr<mux::connection_t>> connections;

  public:
    mux_acceptor_t(std::shared_ptr<tls::context_t> tls_ctx, mux::options_t options, handler_t handler)
        : tls_ctx(std::move(tls_ctx))
        , options(options)
        , handler(std::move(handler))
    {
    }

    ~mux_acceptor_t() { server.close_server(); }

    void listen(event_context_t &ctx)
    {
        server.on_client_join([this](tcp::server_t &s, socket_t *socket) {
            std::unique_ptr<socket_t> owner(socket);
            owner->bind_loop(event_loop_t::current());
            auto conn =
                std::make_shared<mux::connection_t>(mux::role_t::acceptor, std::move(owner), tls_ctx, options);
            connections.push_back(conn);
            conn->start(socket_addr_t());
            spawn([this, conn]() {
                try
                {
                    conn->wait_established();
                } catch (net_connect_exception &e)
                {
                    return;
                }
                handler(conn);
            });
        });
        server.listen(ctx, socket_addr_t("127.0.0.1", 0), 16, true);
    }

    void stop() { server.stop(); }

    std::string address() { return server.local_addr().to_string(); }

    const std::vector<std::shared_ptr<mux::connection_t>> &get_connections() const { return connections; }
};

} // namespace piecenet::test
