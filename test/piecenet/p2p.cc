#include "helper.hpp"
#include "piecenet/p2p/client.hpp"
#include "piecenet/p2p/server.hpp"
#include "piecenet/p2p/store.hpp"
#include "piecenet/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <glog/logging.h>
#include <gtest/gtest.h>
#include <limits>
#include <thread>
#include <vector>

using namespace piecenet;
using namespace piecenet::p2p;

namespace
{

/// count the connections opened by a client
class counting_connector_t : public transport::connector_t
{
    std::shared_ptr<transport::connector_t> inner;

  public:
    std::atomic_int count;

    explicit counting_connector_t(std::shared_ptr<transport::connector_t> inner)
        : inner(std::move(inner))
        , count(0)
    {
    }

    std::shared_ptr<transport::connection_t> connect(const std::string &address) override
    {
        count++;
        return inner->connect(address);
    }
};

/// a task of 3 pieces and a persistent cache piece
std::shared_ptr<memory_store_t> make_store()
{
    auto store = std::make_shared<memory_store_t>();
    task_record_t task;
    task.id = "task-1";
    task.url = "https://example.com/blob";
    task.piece_length = 4;
    task.content_length = 10;
    task.piece_count = 3;
    task.state = "Succeeded";
    store->add_task(task);

    std::string data = "abcdefghij";
    for (u32 number = 0; number < 3; number++)
    {
        piece_record_t piece;
        piece.task_id = task.id;
        piece.number = number;
        piece.offset = number * 4;
        piece.content = data.substr(piece.offset, 4);
        piece.length = piece.content->size();
        piece.digest = sha256_digest((const byte *)piece.content->data(), piece.length);
        store->add_piece(piece);
    }

    piece_record_t cache;
    cache.task_id = "cache-1";
    cache.number = 0;
    cache.length = 2;
    cache.content = "zz";
    cache.traffic_type = proto::REMOTE_PEER;
    store->add_persistent_cache_piece(cache);
    return store;
}

/// a server on a random port and a client of it in one context
struct pair_t
{
    event_context_t ctx;
    std::unique_ptr<server_t> server;
    std::shared_ptr<counting_connector_t> connector;
    std::unique_ptr<client_t> client;

    explicit pair_t(handler_table_t handlers, server_config_t server_config = server_config_t(),
                    client_config_t client_config = client_config_t())
        : ctx(event_strategy::AUTO)
    {
        server_config.listen_addr = "127.0.0.1:0";
        server = std::make_unique<server_t>(server_config, std::move(handlers));
        server->listen(ctx);

        client_config.addr = server->local_address().to_string();
        auto tls_ctx = tls::context_t::make_client(client_config.tls);
        connector = std::make_shared<counting_connector_t>(
            std::make_shared<mux::connector_t>(ctx, tls_ctx, client_config.mux_options()));
        client = std::make_unique<client_t>(client_config, connector);
    }

    /// run func in a coroutine and the loop until it returns
    int run(std::function<void()> func, microsecond_t timeout = make_timespan(5))
    {
        test::spawn([this, func]() {
            func();
            ctx.exit_all(0);
        });
        test::fail_after(ctx, timeout);
        return ctx.run();
    }
};

proto::DownloadPieceRequest piece_request(const std::string &piece_id)
{
    proto::DownloadPieceRequest request;
    request.set_task_id("task-1");
    request.set_piece_id(piece_id);
    return request;
}

} // namespace

TEST(P2PTest, HealthCheck)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    std::string status;
    auto ret = pair.run([&]() { status = pair.client->health_check(); });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(status, "OK");
}

TEST(P2PTest, StoreRequests)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    proto::DownloadPieceResponse piece;
    proto::DownloadTaskResponse task;
    proto::SyncPiecesResponse sync;
    proto::DownloadPersistentCachePieceResponse cache;

    auto ret = pair.run([&]() {
        piece = pair.client->download_piece(piece_request("task-1-1"));

        proto::DownloadTaskRequest task_request;
        task_request.set_task_id("task-1");
        task = pair.client->download_task(task_request);

        proto::SyncPiecesRequest sync_request;
        sync_request.set_task_id("task-1");
        sync = pair.client->sync_pieces(sync_request);

        proto::DownloadPersistentCachePieceRequest cache_request;
        cache_request.set_task_id("cache-1");
        cache_request.set_piece_id("cache-1-0");
        cache = pair.client->download_persistent_cache_piece(cache_request);
    });
    GTEST_ASSERT_EQ(ret, 0);

    GTEST_ASSERT_EQ(piece.has_piece(), true);
    GTEST_ASSERT_EQ(piece.piece().number(), 1u);
    GTEST_ASSERT_EQ(piece.piece().offset(), 4u);
    GTEST_ASSERT_EQ(piece.piece().content(), "efgh");
    GTEST_ASSERT_EQ(piece.piece().digest(), sha256_digest((const byte *)"efgh", 4));

    GTEST_ASSERT_EQ(task.has_task(), true);
    GTEST_ASSERT_EQ(task.task().id(), "task-1");
    GTEST_ASSERT_EQ(task.task().piece_count(), 3u);
    GTEST_ASSERT_EQ(task.task().pieces_size(), 3);
    GTEST_ASSERT_EQ(task.task().pieces(2).has_content(), false);

    GTEST_ASSERT_EQ(sync.pieces_size(), 3);
    for (int i = 0; i < 3; i++)
        GTEST_ASSERT_EQ(sync.pieces(i).number(), (u32)i);
    GTEST_ASSERT_EQ(sync.pieces(2).content(), "ij");

    GTEST_ASSERT_EQ(cache.has_piece(), true);
    GTEST_ASSERT_EQ(cache.piece().content(), "zz");
    GTEST_ASSERT_EQ(cache.piece().traffic_type(), proto::REMOTE_PEER);
}

TEST(P2PTest, NotFound)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    proto::DownloadPieceResponse piece;
    proto::DownloadTaskResponse task;
    proto::SyncPiecesResponse sync;

    auto ret = pair.run([&]() {
        piece = pair.client->download_piece(piece_request("task-1-9"));
        proto::DownloadTaskRequest task_request;
        task_request.set_task_id("task-9");
        task = pair.client->download_task(task_request);
        proto::SyncPiecesRequest sync_request;
        sync_request.set_task_id("task-9");
        sync = pair.client->sync_pieces(sync_request);
    });
    GTEST_ASSERT_EQ(ret, 0);

    GTEST_ASSERT_EQ(piece.has_piece(), false);
    GTEST_ASSERT_EQ(task.has_task(), false);
    GTEST_ASSERT_EQ(sync.pieces_size(), 0);
}

TEST(P2PTest, StoreThreads)
{
    thread_pool_t pool(2);
    pair_t pair(make_store_handlers(make_store(), &pool));
    proto::DownloadPieceResponse piece;
    auto ret = pair.run([&]() { piece = pair.client->download_piece(piece_request("task-1-2")); });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(piece.piece().content(), "ij");
}

TEST(P2PTest, WrongResponseVariant)
{
    /// every request is answered with a variant of another kind
    auto status = [](const proto::MessagePayload &) {
        proto::MessagePayload response;
        response.mutable_health_check_response()->set_status("OK");
        return response;
    };
    handler_table_t handlers;
    handlers.on(proto::MessagePayload::kDownloadPieceRequest, status)
        .on(proto::MessagePayload::kDownloadTaskRequest, status)
        .on(proto::MessagePayload::kSyncPiecesRequest, status)
        .on(proto::MessagePayload::kDownloadPersistentCachePieceRequest, status)
        .on(proto::MessagePayload::kHealthCheck, [](const proto::MessagePayload &) {
            proto::MessagePayload response;
            response.mutable_download_piece_response();
            return response;
        });
    pair_t pair(std::move(handlers));

    std::vector<std::function<void()>> requests = {
        [&]() { pair.client->download_piece(piece_request("task-1-0")); },
        [&]() { pair.client->download_task(proto::DownloadTaskRequest()); },
        [&]() { pair.client->sync_pieces(proto::SyncPiecesRequest()); },
        [&]() { pair.client->download_persistent_cache_piece(proto::DownloadPersistentCachePieceRequest()); },
        [&]() { pair.client->health_check(); },
    };
    int mismatched = 0;
    auto ret = pair.run([&]() {
        for (auto &request : requests)
        {
            try
            {
                request();
            } catch (net_protocol_exception &e)
            {
                if (e.get_error() == protocol_error::unexpected_message)
                    mismatched++;
            }
        }
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(mismatched, (int)requests.size());
}

TEST(P2PTest, HandlerTable)
{
    handler_table_t handlers;
    EXPECT_THROW(handlers.on(proto::MessagePayload::kHealthCheckResponse, handler_t()), net_param_exception);
    GTEST_ASSERT_EQ(handlers.has(proto::MessagePayload::kHealthCheck), false);

    proto::MessagePayload request;
    request.mutable_health_check();
    EXPECT_THROW(handlers.dispatch(request), net_protocol_exception);

    auto store_handlers = make_store_handlers(make_store(), nullptr);
    GTEST_ASSERT_EQ(store_handlers.has(proto::MessagePayload::kDownloadPieceRequest), true);
    GTEST_ASSERT_EQ(store_handlers.dispatch(request).health_check_response().status(), "OK");
}

TEST(P2PTest, RejectResponseAsRequest)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    std::string address = pair.server->local_address().to_string();
    mux::connector_t connector(pair.ctx, tls::context_t::make_client(tls::client_options_t()), mux::options_t());

    bool rejected = false;
    auto ret = pair.run([&]() {
        auto conn = connector.connect(address);
        auto stream = conn->open_stream();
        proto::MessagePayload payload;
        payload.mutable_health_check_response()->set_status("OK");
        auto buffer = encode(message_t::make(payload));
        stream->write_all(buffer);
        stream->finish();
        try
        {
            stream->read_to_end(default_max_message_size);
        } catch (net_protocol_exception &e)
        {
            rejected = e.get_error() == protocol_error::unexpected_message;
        }
        conn->close();
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(rejected, true);
}

TEST(P2PTest, StorageFailure)
{
    handler_table_t handlers;
    handlers.on(proto::MessagePayload::kDownloadPieceRequest,
                [](const proto::MessagePayload &) -> proto::MessagePayload {
                    throw storage_exception("disk is gone");
                });
    pair_t pair(std::move(handlers));

    bool internal = false;
    auto ret = pair.run([&]() {
        try
        {
            pair.client->download_piece(piece_request("task-1-0"));
        } catch (net_protocol_exception &e)
        {
            internal = e.get_error() == protocol_error::internal;
        }
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(internal, true);
}

TEST(P2PTest, ConnectionReuse)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    int before_invalidate = 0;

    auto ret = pair.run([&]() {
        for (int i = 0; i < 3; i++)
            pair.client->health_check();
        before_invalidate = pair.connector->count;

        pair.client->invalidate();
        pair.client->health_check();
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(before_invalidate, 1);
    GTEST_ASSERT_EQ(pair.connector->count.load(), 2);
}

TEST(P2PTest, ConcurrentRequests)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    const int count = 20;
    int done = 0, matched = 0;

    for (int i = 0; i < count; i++)
    {
        test::spawn([&, i]() {
            u32 number = i % 3;
            auto response = pair.client->download_piece(piece_request(make_piece_id("task-1", number)));
            if (response.piece().number() == number)
                matched++;
            if (++done == count)
                pair.ctx.exit_all(0);
        });
    }
    test::fail_after(pair.ctx, make_timespan(5));
    GTEST_ASSERT_EQ(pair.ctx.run(), 0);
    GTEST_ASSERT_EQ(matched, count);
    GTEST_ASSERT_EQ(pair.connector->count.load(), 1);
}

TEST(P2PTest, RequestsOverStreamLimit)
{
    handler_table_t handlers;
    handlers.on(proto::MessagePayload::kHealthCheck, [](const proto::MessagePayload &) {
        test::sleep_for(make_timespan(0, 50));
        proto::MessagePayload response;
        response.mutable_health_check_response()->set_status("OK");
        return response;
    });
    server_config_t server_config;
    server_config.max_concurrent_streams = 4;
    pair_t pair(std::move(handlers), server_config);

    const int count = 10;
    int done = 0, ok = 0, failed = 0;
    for (int i = 0; i < count; i++)
    {
        test::spawn([&]() {
            try
            {
                if (pair.client->health_check() == "OK")
                    ok++;
            } catch (net_exception &e)
            {
                failed++;
            }
            if (++done == count)
                pair.ctx.exit_all(0);
        });
    }
    test::fail_after(pair.ctx, make_timespan(5));
    GTEST_ASSERT_EQ(pair.ctx.run(), 0);
    GTEST_ASSERT_EQ(failed, 0);
    GTEST_ASSERT_EQ(ok, count);
    GTEST_ASSERT_EQ(pair.connector->count.load(), 1);
}

TEST(P2PTest, UnlimitedMessageSize)
{
    server_config_t server_config;
    server_config.max_message_size = std::numeric_limits<u64>::max();
    client_config_t client_config;
    client_config.max_message_size = std::numeric_limits<u64>::max();
    pair_t pair(make_store_handlers(make_store(), nullptr), server_config, client_config);

    std::string status;
    proto::DownloadPieceResponse piece;
    auto ret = pair.run([&]() {
        status = pair.client->health_check();
        piece = pair.client->download_piece(piece_request("task-1-0"));
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(status, "OK");
    GTEST_ASSERT_EQ(piece.piece().content(), "abcd");
}

TEST(P2PTest, ConnectFailure)
{
    event_context_t ctx(event_strategy::AUTO);
    std::string address;
    {
        tcp::server_t server;
        server.listen(ctx, socket_addr_t("127.0.0.1", 0), 1, true);
        address = server.local_addr().to_string();
        server.close_server();
    }

    client_config_t config;
    config.addr = address;
    auto client = client_t::create(ctx, config);
    bool failed = false;
    test::spawn([&]() {
        try
        {
            client->health_check();
        } catch (net_connect_exception &e)
        {
            failed = true;
        }
        ctx.exit_all(0);
    });
    test::fail_after(ctx, make_timespan(5));
    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(failed, true);
}

TEST(P2PTest, GracefulStop)
{
    handler_table_t handlers;
    handlers.on(proto::MessagePayload::kHealthCheck, [](const proto::MessagePayload &) {
        /// slow enough to be in flight when the server stops
        test::sleep_for(make_timespan(0, 300));
        proto::MessagePayload response;
        response.mutable_health_check_response()->set_status("OK");
        return response;
    });
    client_config_t client_config;
    client_config.connect_timeout = make_timespan(0, 500);
    pair_t pair(std::move(handlers), server_config_t(), client_config);

    std::string status;
    bool drained = false, refused = false;
    test::spawn([&]() {
        test::sleep_for(make_timespan(0, 100));
        pair.server->stop();
    });
    auto ret = pair.run([&]() {
        status = pair.client->health_check();
        for (int i = 0; i < 100 && pair.server->connection_count() > 0; i++)
            test::sleep_for(make_timespan(0, 10));
        drained = pair.server->connection_count() == 0;

        /// no new connection is served after stop
        try
        {
            pair.client->health_check();
        } catch (net_connect_exception &e)
        {
            refused = true;
        }
    });
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(status, "OK");
    GTEST_ASSERT_EQ(drained, true);
    GTEST_ASSERT_EQ(refused, true);
}

TEST(P2PTest, StopWhileConnecting)
{
    pair_t pair(make_store_handlers(make_store(), nullptr));
    client_config_t config;
    config.addr = pair.server->local_address().to_string();
    config.connect_timeout = make_timespan(0, 300);
    config.resolve_threads = 0;

    /// clients reconnect in a loop so that accepts race with stop
    const int count = 8;
    std::vector<std::unique_ptr<client_t>> clients;
    for (int i = 0; i < count; i++)
        clients.push_back(client_t::create(pair.ctx, config));

    std::atomic_bool stopped = false;
    int finished = 0;
    for (auto &client : clients)
    {
        auto c = client.get();
        test::spawn([&, c]() {
            while (!stopped)
            {
                try
                {
                    c->health_check();
                } catch (net_exception &e)
                {
                    VLOG(1) << "request failed: " << e.what();
                }
                /// keep the last connection, a connection served after stop stays counted
                if (!stopped)
                    c->invalidate();
            }
            finished++;
        });
    }
    std::thread stopper([&pair, &stopped]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pair.server->stop();
        stopped = true;
    });

    bool drained = false;
    auto ret = pair.run([&]() {
        for (int i = 0; i < 300 && finished < count; i++)
            test::sleep_for(make_timespan(0, 10));
        for (int i = 0; i < 100 && pair.server->connection_count() > 0; i++)
            test::sleep_for(make_timespan(0, 10));
        drained = pair.server->connection_count() == 0;
    });
    stopper.join();
    GTEST_ASSERT_EQ(ret, 0);
    GTEST_ASSERT_EQ(finished, count);
    GTEST_ASSERT_EQ(drained, true);
}
