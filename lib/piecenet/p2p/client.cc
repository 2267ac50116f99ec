#include "piecenet/p2p/client.hpp"
#include "piecenet/mux.hpp"
#include "piecenet/net_exception.hpp"
#include <glog/logging.h>

namespace piecenet::p2p
{

client_t::client_t(client_config_t config, std::shared_ptr<transport::connector_t> connector)
    : config(std::move(config))
    , connector(std::move(connector))
{
}

client_t::~client_t()
{
    std::shared_ptr<transport::connection_t> old;
    {
        std::unique_lock<std::mutex> lock(mutex);
        old = std::move(conn);
    }
    if (old)
        old->close();
}

std::unique_ptr<client_t> client_t::create(event_context_t &context, client_config_t config)
{
    auto tls_ctx = tls::context_t::make_client(config.tls);
    std::shared_ptr<thread_pool_t> resolver;
    if (config.resolve_threads > 0)
        resolver = std::make_shared<thread_pool_t>(config.resolve_threads);
    auto connector = std::make_shared<mux::connector_t>(context, tls_ctx, config.mux_options(), std::move(resolver));
    return std::make_unique<client_t>(std::move(config), std::move(connector));
}

std::shared_ptr<transport::connection_t> client_t::connect()
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (conn && conn->is_open())
            return conn;
    }

    std::lock_guard<co::mutex_t> guard(connect_mutex);
    std::shared_ptr<transport::connection_t> old;
    {
        std::unique_lock<std::mutex> lock(mutex);
        // connected by another request while waiting
        if (conn && conn->is_open())
            return conn;
        old = std::move(conn);
    }
    if (old)
    {
        LOG(INFO) << "connection " << old->id() << " to " << config.addr << " is not open, reconnect";
        old->close();
    }

    auto fresh = connector->connect(config.addr);
    LOG(INFO) << "connect to " << config.addr << " connection " << fresh->id();
    {
        std::unique_lock<std::mutex> lock(mutex);
        conn = fresh;
    }
    return fresh;
}

void client_t::invalidate()
{
    std::shared_ptr<transport::connection_t> old;
    {
        std::unique_lock<std::mutex> lock(mutex);
        old = std::move(conn);
    }
    if (old)
    {
        VLOG(1) << "invalidate connection " << old->id() << " to " << config.addr;
        old->close();
    }
}

proto::MessagePayload client_t::request(proto::MessagePayload payload)
{
    auto request_case = payload.payload_case();
    auto expect = expected_response(request_case);

    auto connection = connect();
    auto stream = connection->open_stream();

    auto message = message_t::make(std::move(payload));
    VLOG(1) << "send " << payload_name(request_case) << " " << message.get_header().message_id() << " to "
            << config.addr << " on stream " << stream->id();
    auto buffer = encode(message);
    stream->write_all(buffer);
    stream->finish();

    auto data = stream->read_to_end(config.max_message_size);
    auto response = decode(data);
    if (response.payload_case() != expect)
        throw net_protocol_exception(std::string("expect ") + payload_name(expect) + " but received " +
                                         payload_name(response.payload_case()),
                                     protocol_error::unexpected_message);
    return response.get_payload();
}

proto::DownloadPieceResponse client_t::download_piece(const proto::DownloadPieceRequest &request)
{
    proto::MessagePayload payload;
    *payload.mutable_download_piece_request() = request;
    return this->request(std::move(payload)).download_piece_response();
}

proto::DownloadTaskResponse client_t::download_task(const proto::DownloadTaskRequest &request)
{
    proto::MessagePayload payload;
    *payload.mutable_download_task_request() = request;
    return this->request(std::move(payload)).download_task_response();
}

proto::SyncPiecesResponse client_t::sync_pieces(const proto::SyncPiecesRequest &request)
{
    proto::MessagePayload payload;
    *payload.mutable_sync_pieces_request() = request;
    return this->request(std::move(payload)).sync_pieces_response();
}

proto::DownloadPersistentCachePieceResponse
client_t::download_persistent_cache_piece(const proto::DownloadPersistentCachePieceRequest &request)
{
    proto::MessagePayload payload;
    *payload.mutable_download_persistent_cache_piece_request() = request;
    return this->request(std::move(payload)).download_persistent_cache_piece_response();
}

std::string client_t::health_check()
{
    proto::MessagePayload payload;
    payload.mutable_health_check();
    return request(std::move(payload)).health_check_response().status();
}

} // namespace piecenet::p2p
