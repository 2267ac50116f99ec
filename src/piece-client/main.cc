#include "piecenet/event.hpp"
#include "piecenet/execute_context.hpp"
#include "piecenet/net_exception.hpp"
#include "piecenet/p2p/client.hpp"
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <iostream>

DEFINE_string(addr, "127.0.0.1:8080", "server address host:port");
DEFINE_string(action, "health", "one of health, task, piece, sync, cache_piece");
DEFINE_string(task_id, "", "task id");
DEFINE_string(piece_id, "", "piece id, {task_id}-{number}");
DEFINE_bool(verify, false, "verify the server certificate");
DEFINE_string(ca_file, "", "trusted CA in PEM, the system store is used when it is empty");
DEFINE_string(server_name, "localhost", "expected name of the server certificate");
DEFINE_uint32(timeout, 30, "connect timeout (s)");

static void atexit_func() { google::ShutdownGoogleLogging(); }

static void print_piece(const piecenet::proto::Piece &piece)
{
    std::cout << "piece " << piece.number() << " offset " << piece.offset() << " length " << piece.length()
              << " digest " << piece.digest();
    if (piece.has_parent_id())
        std::cout << " parent " << piece.parent_id();
    if (piece.has_content())
        std::cout << " content " << piece.content().size() << " bytes";
    std::cout << std::endl;
}

static void print_task(const piecenet::proto::Task &task)
{
    std::cout << "task " << task.id() << std::endl;
    std::cout << "  url " << task.url() << std::endl;
    std::cout << "  type " << piecenet::proto::TaskType_Name(task.type()) << std::endl;
    std::cout << "  state " << task.state() << std::endl;
    if (task.has_content_length())
        std::cout << "  content length " << task.content_length() << std::endl;
    if (task.has_piece_length())
        std::cout << "  piece length " << task.piece_length() << std::endl;
    if (task.has_piece_count())
        std::cout << "  piece count " << task.piece_count() << std::endl;
    for (auto &piece : task.pieces())
    {
        std::cout << "  ";
        print_piece(piece);
    }
}

static int run_action(piecenet::p2p::client_t &client)
{
    if (FLAGS_action == "health")
    {
        std::cout << "status " << client.health_check() << std::endl;
    }
    else if (FLAGS_action == "task")
    {
        piecenet::proto::DownloadTaskRequest request;
        request.set_task_id(FLAGS_task_id);
        auto response = client.download_task(request);
        if (!response.has_task())
        {
            std::cout << "task " << FLAGS_task_id << " not found" << std::endl;
            return 2;
        }
        print_task(response.task());
    }
    else if (FLAGS_action == "piece")
    {
        piecenet::proto::DownloadPieceRequest request;
        request.set_task_id(FLAGS_task_id);
        request.set_piece_id(FLAGS_piece_id);
        auto response = client.download_piece(request);
        if (!response.has_piece())
        {
            std::cout << "piece " << FLAGS_piece_id << " not found" << std::endl;
            return 2;
        }
        print_piece(response.piece());
    }
    else if (FLAGS_action == "sync")
    {
        piecenet::proto::SyncPiecesRequest request;
        request.set_task_id(FLAGS_task_id);
        auto response = client.sync_pieces(request);
        std::cout << response.pieces_size() << " pieces" << std::endl;
        for (auto &piece : response.pieces())
            print_piece(piece);
    }
    else if (FLAGS_action == "cache_piece")
    {
        piecenet::proto::DownloadPersistentCachePieceRequest request;
        request.set_task_id(FLAGS_task_id);
        request.set_piece_id(FLAGS_piece_id);
        auto response = client.download_persistent_cache_piece(request);
        if (!response.has_piece())
        {
            std::cout << "persistent cache piece " << FLAGS_piece_id << " not found" << std::endl;
            return 2;
        }
        print_piece(response.piece());
    }
    else
    {
        LOG(ERROR) << "unknown action " << FLAGS_action;
        return 1;
    }
    return 0;
}

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);
    google::ParseCommandLineFlags(&argc, &argv, false);
    google::SetLogDestination(google::GLOG_FATAL, "./piece-client.log");
    google::SetLogDestination(google::GLOG_ERROR, "./piece-client.log");
    google::SetLogDestination(google::GLOG_INFO, "./piece-client.log");
    google::SetLogDestination(google::GLOG_WARNING, "./piece-client.log");
    google::SetStderrLogging(google::GLOG_WARNING);

    atexit(atexit_func);
    piecenet::init_lib();

    piecenet::event_context_t context(piecenet::event_strategy::epoll);

    piecenet::p2p::client_config_t config;
    config.addr = FLAGS_addr;
    config.connect_timeout = piecenet::make_timespan(FLAGS_timeout);
    config.tls.mode = FLAGS_verify ? piecenet::tls::verify_mode::verify_peer : piecenet::tls::verify_mode::trust_all;
    config.tls.ca_file = FLAGS_ca_file;
    config.tls.server_name = FLAGS_server_name;

    std::unique_ptr<piecenet::p2p::client_t> client;
    try
    {
        client = piecenet::p2p::client_t::create(context, config);
    } catch (piecenet::net_exception &e)
    {
        LOG(ERROR) << e.what();
        return 1;
    }

    int ret = 0;
    piecenet::execute_context_t::spawn(piecenet::event_loop_t::current(), [&context, &client, &ret]() {
        try
        {
            ret = run_action(*client);
        } catch (piecenet::net_exception &e)
        {
            LOG(ERROR) << FLAGS_action << " request to " << FLAGS_addr << " failed: " << e.what();
            ret = 1;
        }
        client->invalidate();
        context.exit_all(ret);
    });
    context.run();
    piecenet::uninit_lib();
    return ret;
}
