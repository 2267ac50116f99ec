#include "piecenet/event.hpp"
#include "piecenet/net_exception.hpp"
#include "piecenet/p2p/server.hpp"
#include "piecenet/p2p/store.hpp"
#include "piecenet/thread_pool.hpp"
#include <chrono>
#include <csignal>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <thread>

DEFINE_string(listen, "0.0.0.0:8080", "listen address host:port");
DEFINE_uint32(threads, 0, "thread count");
DEFINE_string(cert, "", "certificate chain in PEM, a self-signed certificate is generated when it is empty");
DEFINE_string(key, "", "private key in PEM");
DEFINE_string(client_ca, "", "require client certificates issued by this CA");
DEFINE_uint32(max_connections, 1000, "max concurrent connections");
DEFINE_uint32(max_streams, 100, "max concurrent streams per connection");
DEFINE_uint32(request_timeout, 30, "tls handshake timeout (s)");
DEFINE_uint32(idle_timeout, 180, "close connections idle for it (s)");
DEFINE_uint32(store_threads, 0, "threads running store lookups, 0 runs them in the event loops");
DEFINE_string(serve_dir, "", "serve every file of this directory as a task");
DEFINE_uint64(piece_length, 4 * 1024 * 1024, "piece length of the served files");
DEFINE_bool(reuse, true, "reuse address");
DEFINE_uint32(drain_timeout, 30, "wait for live streams at exit (s)");

piecenet::event_context_t *app_context;

void thread_main() { app_context->run(); }

static void atexit_func()
{
    LOG(INFO) << "exit server...";
    google::ShutdownGoogleLogging();
}

/// wait for SIGINT/SIGTERM, then drain the server and exit the loops
static void signal_main(sigset_t set, piecenet::p2p::server_t *server)
{
    int sig = 0;
    if (sigwait(&set, &sig) != 0)
    {
        LOG(ERROR) << "sigwait failed";
        return;
    }
    LOG(INFO) << "receive signal " << sig << ", drain connections";
    server->stop();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(FLAGS_drain_timeout);
    while (server->connection_count() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (server->connection_count() > 0)
        LOG(WARNING) << server->connection_count() << " connections are still alive at exit";
    app_context->exit_all(0);
}

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);
    google::ParseCommandLineFlags(&argc, &argv, false);
    google::SetLogDestination(google::GLOG_FATAL, "./piece-server.log");
    google::SetLogDestination(google::GLOG_ERROR, "./piece-server.log");
    google::SetLogDestination(google::GLOG_INFO, "./piece-server.log");
    google::SetLogDestination(google::GLOG_WARNING, "./piece-server.log");
    google::SetStderrLogging(google::GLOG_INFO);

    atexit(atexit_func);

    /// all threads inherit the mask, the signal thread takes them
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    LOG(INFO) << "init piecenet";
    piecenet::init_lib();

    auto store = std::make_shared<piecenet::p2p::memory_store_t>();
    if (!FLAGS_serve_dir.empty())
    {
        try
        {
            auto count = store->load_directory(FLAGS_serve_dir, FLAGS_piece_length);
            LOG(INFO) << "serve " << count << " tasks from " << FLAGS_serve_dir;
        } catch (piecenet::p2p::storage_exception &e)
        {
            LOG(ERROR) << e.what();
            return 1;
        }
    }

    std::unique_ptr<piecenet::thread_pool_t> pool;
    if (FLAGS_store_threads > 0)
        pool = std::make_unique<piecenet::thread_pool_t>(FLAGS_store_threads);

    LOG(INFO) << "create application context";
    piecenet::event_context_t context(piecenet::event_strategy::epoll);
    app_context = &context;

    if (FLAGS_threads == 0)
    {
        FLAGS_threads = 4;
    }
    LOG(INFO) << "thread detect " << FLAGS_threads;

    piecenet::p2p::server_config_t config;
    config.listen_addr = FLAGS_listen;
    config.cert_path = FLAGS_cert;
    config.key_path = FLAGS_key;
    config.tls.client_ca_file = FLAGS_client_ca;
    config.max_concurrent_connections = FLAGS_max_connections;
    config.max_concurrent_streams = FLAGS_max_streams;
    config.request_timeout = piecenet::make_timespan(FLAGS_request_timeout);
    config.idle_timeout = piecenet::make_timespan(FLAGS_idle_timeout);
    config.reuse_addr = FLAGS_reuse;

    std::unique_ptr<piecenet::p2p::server_t> server;
    try
    {
        server = std::make_unique<piecenet::p2p::server_t>(config,
                                                           piecenet::p2p::make_store_handlers(store, pool.get()));
        server->listen(context);
    } catch (piecenet::net_exception &e)
    {
        LOG(ERROR) << "failed to start server: " << e.what();
        return 1;
    }

    for (int i = 0; i < FLAGS_threads - 1; i++)
    {
        std::thread thd(thread_main);
        thd.detach();
    }
    std::thread signal_thread(signal_main, set, server.get());
    signal_thread.detach();

    LOG(INFO) << "run event loop";
    auto ret = app_context->run();
    piecenet::uninit_lib();
    return ret;
}
