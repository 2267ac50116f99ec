#include "piecenet/p2p/server.hpp"
#include "piecenet/co_sync.hpp"
#include "piecenet/event.hpp"
#include "piecenet/execute_context.hpp"
#include "piecenet/net_exception.hpp"
#include "piecenet/socket.hpp"
#include <glog/logging.h>

namespace piecenet::p2p
{

handler_table_t &handler_table_t::on(payload_case_t request, handler_t handler)
{
    if (!is_request(request))
        throw net_param_exception(std::string("can't handle ") + payload_name(request));
    handlers[(int)request] = std::move(handler);
    return *this;
}

bool handler_table_t::has(payload_case_t request) const { return handlers.count((int)request) != 0; }

proto::MessagePayload handler_table_t::dispatch(const proto::MessagePayload &request) const
{
    auto payload_case = request.payload_case();
    if (!is_request(payload_case))
        throw net_protocol_exception(std::string("unexpected ") + payload_name(payload_case),
                                     protocol_error::unexpected_message);
    auto it = handlers.find((int)payload_case);
    if (it == handlers.end())
        throw net_protocol_exception(std::string("no handler of ") + payload_name(payload_case),
                                     protocol_error::unexpected_message);
    return it->second(request);
}

handler_table_t make_store_handlers(std::shared_ptr<content_store_t> store, thread_pool_t *pool)
{
    handler_table_t table;
    table.on(proto::MessagePayload::kDownloadPieceRequest, [store, pool](const proto::MessagePayload &payload) {
        auto &request = payload.download_piece_request();
        VLOG(1) << "handling download piece request " << request.piece_id() << " of task " << request.task_id();
        auto piece = co::run_blocking(pool, [&store, &request]() { return store->lookup_piece(request.piece_id()); });
        proto::MessagePayload response;
        auto body = response.mutable_download_piece_response();
        if (piece)
            *body->mutable_piece() = to_wire(*piece);
        return response;
    });

    table.on(proto::MessagePayload::kDownloadTaskRequest, [store, pool](const proto::MessagePayload &payload) {
        auto &request = payload.download_task_request();
        VLOG(1) << "handling download task request " << request.task_id();
        auto task = co::run_blocking(pool, [&store, &request]() -> std::optional<proto::Task> {
            auto task = store->lookup_task(request.task_id());
            if (!task)
                return std::nullopt;
            return to_wire(*task, store->list_pieces(request.task_id()));
        });
        proto::MessagePayload response;
        auto body = response.mutable_download_task_response();
        if (task)
            *body->mutable_task() = std::move(*task);
        return response;
    });

    table.on(proto::MessagePayload::kSyncPiecesRequest, [store, pool](const proto::MessagePayload &payload) {
        auto &request = payload.sync_pieces_request();
        VLOG(1) << "handling sync pieces request of task " << request.task_id();
        auto pieces = co::run_blocking(pool, [&store, &request]() { return store->list_pieces(request.task_id()); });
        proto::MessagePayload response;
        auto body = response.mutable_sync_pieces_response();
        for (auto &piece : pieces)
            *body->add_pieces() = to_wire(piece);
        return response;
    });

    table.on(proto::MessagePayload::kDownloadPersistentCachePieceRequest,
             [store, pool](const proto::MessagePayload &payload) {
                 auto &request = payload.download_persistent_cache_piece_request();
                 VLOG(1) << "handling download persistent cache piece request " << request.piece_id() << " of task "
                         << request.task_id();
                 auto piece = co::run_blocking(
                     pool, [&store, &request]() { return store->lookup_persistent_cache_piece(request.piece_id()); });
                 proto::MessagePayload response;
                 auto body = response.mutable_download_persistent_cache_piece_response();
                 if (piece)
                     *body->mutable_piece() = to_wire(*piece);
                 return response;
             });

    table.on(proto::MessagePayload::kHealthCheck, [](const proto::MessagePayload &payload) {
        VLOG(1) << "handling health check request";
        proto::MessagePayload response;
        response.mutable_health_check_response()->set_status("OK");
        return response;
    });
    return table;
}

server_t::server_t(server_config_t config, handler_table_t handlers)
    : config(std::move(config))
    , handlers(std::move(handlers))
    , context(nullptr)
    , stopping(false)
{
    auto tls_options = this->config.tls;
    if (!this->config.cert_path.empty())
        tls_options.cert_file = this->config.cert_path;
    if (!this->config.key_path.empty())
        tls_options.key_file = this->config.key_path;
    tls_ctx = tls::context_t::make_server(tls_options);
    options = this->config.mux_options();

    acceptor.on_client_join(std::bind(&server_t::on_accept, this, std::placeholders::_1, std::placeholders::_2))
        .on_client_error([](tcp::server_t &s, connection_state state) {
            LOG(ERROR) << "accept failed: " << to_string(state);
        });
}

server_t::~server_t() { acceptor.close_server(); }

void server_t::listen(event_context_t &context)
{
    this->context = &context;
    auto addr = socket_addr_t::parse(config.listen_addr);
    acceptor.listen(context, addr, config.backlog, config.reuse_addr);
    LOG(INFO) << "server listen at " << acceptor.local_addr().to_string();
}

void server_t::stop()
{
    std::vector<std::shared_ptr<mux::connection_t>> live;
    {
        // an accepted connection is either in the snapshot or dropped by on_accept
        std::unique_lock<std::mutex> lock(mutex);
        if (stopping)
            return;
        stopping = true;
        for (auto &it : connections)
            live.push_back(it.second);
    }
    LOG(INFO) << "stop server " << acceptor.local_addr().to_string();
    acceptor.stop();
    for (auto &conn : live)
        conn->close();
}

socket_addr_t server_t::local_address() { return acceptor.local_addr(); }

size_t server_t::connection_count()
{
    std::unique_lock<std::mutex> lock(mutex);
    return connections.size();
}

void server_t::on_accept(tcp::server_t &server, socket_t *socket)
{
    std::unique_ptr<socket_t> owner(socket);
    auto remote = owner->remote_addr();
    set_nodelay(owner.get(), true);

    auto &loop = context->select_loop();
    owner->bind_loop(loop);
    auto conn = std::make_shared<mux::connection_t>(mux::role_t::acceptor, std::move(owner), tls_ctx, options);
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (stopping)
        {
            VLOG(1) << "server is stopping, close " << remote.to_string();
            return;
        }
        if (connections.size() >= config.max_concurrent_connections)
        {
            LOG(WARNING) << "too many connections (" << connections.size() << "), close " << remote.to_string();
            lock.unlock();
            return;
        }
        connections.emplace(conn->id(), conn);
    }
    LOG(INFO) << "accept connection " << conn->id() << " from " << remote.to_string();
    conn->start(socket_addr_t());
    execute_context_t::spawn(loop, [this, conn]() { connection_main(conn); });
}

void server_t::connection_main(std::shared_ptr<mux::connection_t> conn)
{
    auto remote = conn->remote_address();
    try
    {
        conn->wait_established();
        while (auto stream = conn->accept_stream())
        {
            execute_context_t::spawn(event_loop_t::current(),
                                     [this, stream, remote]() { stream_main(stream, remote); });
        }
        conn->wait_closed();
        LOG(INFO) << "connection " << conn->id() << " from " << remote.to_string() << " closed";
    } catch (net_connect_exception &e)
    {
        LOG(ERROR) << "connection " << conn->id() << " from " << remote.to_string() << " failed: " << e.what();
    }
    std::unique_lock<std::mutex> lock(mutex);
    connections.erase(conn->id());
}

void server_t::stream_main(std::shared_ptr<transport::stream_t> stream, socket_addr_t remote)
{
    try
    {
        auto data = stream->read_to_end(config.max_message_size);
        auto request = decode(data);
        VLOG(1) << payload_name(request.payload_case()) << " " << request.get_header().message_id() << " on stream "
                << stream->id() << " from " << remote.to_string();

        auto response = message_t::make(handlers.dispatch(request.get_payload()));
        auto buffer = encode(response);
        stream->write_all(buffer);
        stream->finish();
    } catch (net_protocol_exception &e)
    {
        LOG(WARNING) << "reject stream " << stream->id() << " from " << remote.to_string() << ": " << e.what();
        stream->reset(e.get_error() == protocol_error::internal ? transport::reset_code::internal
                                                                : transport::reset_code::protocol);
    } catch (storage_exception &e)
    {
        LOG(ERROR) << "storage failed on stream " << stream->id() << " from " << remote.to_string() << ": "
                   << e.what();
        stream->reset(transport::reset_code::internal);
    } catch (net_exception &e)
    {
        LOG(WARNING) << "stream " << stream->id() << " from " << remote.to_string() << " failed: " << e.what();
        stream->reset(transport::reset_code::cancelled);
    } catch (std::exception &e)
    {
        LOG(ERROR) << "stream " << stream->id() << " from " << remote.to_string() << " aborted: " << e.what();
        stream->reset(transport::reset_code::internal);
    }
}

} // namespace piecenet::p2p
