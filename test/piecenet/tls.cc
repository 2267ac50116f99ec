#include "piecenet/tls.hpp"
#include "helper.hpp"
#include "piecenet/mux.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace piecenet;

namespace
{

/// answer one stream with its own data
void echo_once(std::shared_ptr<mux::connection_t> conn)
{
    auto stream = conn->accept_stream();
    if (!stream)
        return;
    auto data = stream->read_to_end(1024);
    stream->write_all(data);
    stream->finish();
}

/// write a self-signed certificate of localhost to a temporary directory
struct cert_files_t
{
    std::filesystem::path dir;
    std::string cert;
    std::string key;

    cert_files_t()
    {
        dir = std::filesystem::temp_directory_path() / ("piecenet-tls-" + std::to_string(getpid()));
        std::filesystem::create_directories(dir);
        auto pair = tls::make_self_signed("localhost");
        cert = (dir / "cert.pem").string();
        key = (dir / "key.pem").string();
        std::ofstream(cert) << pair.cert_pem;
        std::ofstream(key) << pair.key_pem;
    }

    ~cert_files_t()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

/// connect with client options, the result is "ok" or the failed connection state
std::string try_connect(const tls::server_options_t &server_options, const tls::client_options_t &client_options,
                        std::string &reply)
{
    event_context_t ctx(event_strategy::AUTO);
    test::mux_acceptor_t acceptor(tls::context_t::make_server(server_options), mux::options_t(), echo_once);
    acceptor.listen(ctx);

    mux::connector_t connector(ctx, tls::context_t::make_client(client_options), mux::options_t());
    std::string result;
    test::spawn([&]() {
        try
        {
            auto conn = connector.connect(acceptor.address());
            auto stream = conn->open_stream();
            auto buffer = socket_buffer_t::from_string("hello tls");
            stream->write_all(buffer);
            stream->finish();
            reply = stream->read_to_end(1024).to_string();
            conn->close();
            result = "ok";
        } catch (net_connect_exception &e)
        {
            result = to_string(e.get_state());
        }
        ctx.exit_all(0);
    });

    test::fail_after(ctx, make_timespan(5));
    if (ctx.run() != 0)
        return "hang";
    return result;
}

} // namespace

TEST(TLSTest, SelfSigned)
{
    auto pair = tls::make_self_signed("localhost");
    GTEST_ASSERT_NE(pair.cert_pem.find("BEGIN CERTIFICATE"), std::string::npos);
    GTEST_ASSERT_NE(pair.key_pem.find("PRIVATE KEY"), std::string::npos);
}

TEST(TLSTest, TrustAll)
{
    std::string reply;
    GTEST_ASSERT_EQ(try_connect(tls::server_options_t(), tls::client_options_t(), reply), "ok");
    GTEST_ASSERT_EQ(reply, "hello tls");
}

TEST(TLSTest, VerifyUnknownIssuer)
{
    tls::client_options_t options;
    options.mode = tls::verify_mode::verify_peer;
    std::string reply;
    GTEST_ASSERT_EQ(try_connect(tls::server_options_t(), options, reply),
                    to_string(connection_state::secure_check_failed));
}

TEST(TLSTest, VerifyTrustedCa)
{
    cert_files_t files;
    tls::server_options_t server_options;
    server_options.cert_file = files.cert;
    server_options.key_file = files.key;

    tls::client_options_t options;
    options.mode = tls::verify_mode::verify_peer;
    options.ca_file = files.cert;
    options.server_name = "localhost";
    std::string reply;
    GTEST_ASSERT_EQ(try_connect(server_options, options, reply), "ok");
    GTEST_ASSERT_EQ(reply, "hello tls");
}

TEST(TLSTest, VerifyWrongName)
{
    cert_files_t files;
    tls::server_options_t server_options;
    server_options.cert_file = files.cert;
    server_options.key_file = files.key;

    tls::client_options_t options;
    options.mode = tls::verify_mode::verify_peer;
    options.ca_file = files.cert;
    options.server_name = "example.com";
    std::string reply;
    GTEST_ASSERT_EQ(try_connect(server_options, options, reply), to_string(connection_state::secure_check_failed));
}

TEST(TLSTest, MissingCertificate)
{
    tls::server_options_t options;
    options.cert_file = "/nonexistent/cert.pem";
    options.key_file = "/nonexistent/key.pem";
    EXPECT_THROW(tls::context_t::make_server(options), net_param_exception);
}
