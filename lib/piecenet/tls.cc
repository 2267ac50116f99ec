#include "piecenet/tls.hpp"
#include <glog/logging.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace piecenet::tls
{
namespace
{
struct x509_deleter
{
    void operator()(X509 *p) const { X509_free(p); }
};
struct pkey_deleter
{
    void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct bio_deleter
{
    void operator()(BIO *p) const { BIO_free(p); }
};
using x509_ptr = std::unique_ptr<X509, x509_deleter>;
using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;
using bio_ptr = std::unique_ptr<BIO, bio_deleter>;

void add_extension(X509 *x509, int nid, const std::string &value)
{
    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, x509, x509, nullptr, nullptr, 0);
    X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value.c_str());
    if (ext == nullptr)
        throw net_param_exception("failed to create certificate extension: " + last_error_string());
    int ok = X509_add_ext(x509, ext, -1);
    X509_EXTENSION_free(ext);
    if (!ok)
        throw net_param_exception("failed to add certificate extension: " + last_error_string());
}

std::pair<x509_ptr, pkey_ptr> generate(const std::string &name)
{
    pkey_ptr pkey(EVP_EC_gen("P-256"));
    if (!pkey)
        throw net_param_exception("failed to generate key: " + last_error_string());

    x509_ptr x509(X509_new());
    if (!x509)
        throw net_param_exception("failed to create certificate: " + last_error_string());

    u64 serial = 0;
    if (RAND_bytes((unsigned char *)&serial, sizeof(serial)) != 1)
        throw net_param_exception("failed to generate serial: " + last_error_string());
    serial &= 0x7FFFFFFFFFFFFFFFULL;

    X509_set_version(x509.get(), 2);
    ASN1_INTEGER_set_uint64(X509_get_serialNumber(x509.get()), serial);
    X509_gmtime_adj(X509_getm_notBefore(x509.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(x509.get()), 365L * 24 * 3600);
    X509_set_pubkey(x509.get(), pkey.get());

    X509_NAME *subject = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(subject, "CN", MBSTRING_ASC, (const unsigned char *)name.c_str(), -1, -1, 0);
    X509_set_issuer_name(x509.get(), subject);

    add_extension(x509.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_extension(x509.get(), NID_subject_alt_name, "DNS:" + name + ",IP:127.0.0.1");

    if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) == 0)
        throw net_param_exception("failed to sign certificate: " + last_error_string());

    return std::make_pair(std::move(x509), std::move(pkey));
}

std::string bio_to_string(BIO *bio)
{
    char *data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return std::string(data, len);
}

void load_cert_key(SSL_CTX *ctx, const std::string &cert_file, const std::string &key_file)
{
    if (SSL_CTX_use_certificate_chain_file(ctx, cert_file.c_str()) <= 0)
        throw net_param_exception("failed to load certificate " + cert_file + ": " + last_error_string());
    if (SSL_CTX_use_PrivateKey_file(ctx, key_file.c_str(), SSL_FILETYPE_PEM) <= 0)
        throw net_param_exception("failed to load private key " + key_file + ": " + last_error_string());
    if (!SSL_CTX_check_private_key(ctx))
        throw net_param_exception("private key " + key_file + " does not match certificate " + cert_file);
}

SSL_CTX *new_ctx(const SSL_METHOD *method)
{
    SSL_CTX *ctx = SSL_CTX_new(method);
    if (ctx == nullptr)
        throw net_param_exception("failed to create SSL context: " + last_error_string());
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    return ctx;
}

} // namespace

std::string last_error_string()
{
    std::string str;
    unsigned long e;
    while ((e = ERR_get_error()) != 0)
    {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!str.empty())
            str += "; ";
        str += buf;
    }
    if (str.empty())
        str = "unknown tls error";
    return str;
}

certificate_t make_self_signed(const std::string &name)
{
    auto pair = generate(name);
    bio_ptr cert_bio(BIO_new(BIO_s_mem()));
    bio_ptr key_bio(BIO_new(BIO_s_mem()));
    if (!cert_bio || !key_bio)
        throw net_param_exception("failed to allocate memory bio");
    if (!PEM_write_bio_X509(cert_bio.get(), pair.first.get()))
        throw net_param_exception("failed to write certificate: " + last_error_string());
    if (!PEM_write_bio_PrivateKey(key_bio.get(), pair.second.get(), nullptr, nullptr, 0, nullptr, nullptr))
        throw net_param_exception("failed to write private key: " + last_error_string());
    return {bio_to_string(cert_bio.get()), bio_to_string(key_bio.get())};
}

context_t::context_t(SSL_CTX *ctx, bool client)
    : ctx(ctx)
    , client(client)
    , verify(false)
{
}

context_t::~context_t() { SSL_CTX_free(ctx); }

std::shared_ptr<context_t> context_t::make_client(const client_options_t &options)
{
    std::shared_ptr<context_t> context(new context_t(new_ctx(TLS_client_method()), true));
    SSL_CTX *ctx = context->ctx;
    context->server_name = options.server_name;

    if (options.mode == verify_mode::verify_peer)
    {
        if (!options.ca_file.empty())
        {
            if (SSL_CTX_load_verify_locations(ctx, options.ca_file.c_str(), nullptr) != 1)
                throw net_param_exception("failed to load CA " + options.ca_file + ": " + last_error_string());
        }
        else if (SSL_CTX_set_default_verify_paths(ctx) != 1)
        {
            throw net_param_exception("failed to load system CA store: " + last_error_string());
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        context->verify = true;
    }
    else
    {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
        LOG(WARNING) << "tls client trusts any server certificate, use verify_peer outside of development";
    }

    if (!options.cert_file.empty() || !options.key_file.empty())
        load_cert_key(ctx, options.cert_file, options.key_file);

    return context;
}

std::shared_ptr<context_t> context_t::make_server(const server_options_t &options)
{
    std::shared_ptr<context_t> context(new context_t(new_ctx(TLS_server_method()), false));
    SSL_CTX *ctx = context->ctx;

    if (!options.cert_file.empty() && !options.key_file.empty())
    {
        load_cert_key(ctx, options.cert_file, options.key_file);
        LOG(INFO) << "tls server uses certificate " << options.cert_file;
    }
    else
    {
        auto pair = generate(options.self_signed_name);
        if (SSL_CTX_use_certificate(ctx, pair.first.get()) != 1 ||
            SSL_CTX_use_PrivateKey(ctx, pair.second.get()) != 1)
            throw net_param_exception("failed to use self-signed certificate: " + last_error_string());
        LOG(WARNING) << "tls server uses an ephemeral self-signed certificate for " << options.self_signed_name
                     << ", provide cert_path and key_path outside of development";
    }

    if (!options.client_ca_file.empty())
    {
        if (SSL_CTX_load_verify_locations(ctx, options.client_ca_file.c_str(), nullptr) != 1)
            throw net_param_exception("failed to load client CA " + options.client_ca_file + ": " +
                                      last_error_string());
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
        context->verify = true;
    }
    return context;
}

session_t::session_t(std::shared_ptr<context_t> context, int fd)
    : ctx(std::move(context))
    , ssl(nullptr)
    , established(false)
{
    ssl = SSL_new(ctx->get());
    if (ssl == nullptr)
        throw net_connect_exception("failed to create tls session: " + last_error_string(),
                                    connection_state::no_resource);
    if (SSL_set_fd(ssl, fd) != 1)
    {
        SSL_free(ssl);
        throw net_connect_exception("failed to attach tls session: " + last_error_string(),
                                    connection_state::no_resource);
    }
    if (ctx->is_client())
    {
        auto &name = ctx->get_server_name();
        if (!name.empty())
        {
            if (SSL_set_tlsext_host_name(ssl, name.c_str()) != 1 ||
                (ctx->is_verify_peer() && SSL_set1_host(ssl, name.c_str()) != 1))
            {
                SSL_free(ssl);
                throw net_connect_exception("invalid tls server name " + name, connection_state::invalid_request);
            }
        }
        SSL_set_connect_state(ssl);
    }
    else
    {
        SSL_set_accept_state(ssl);
    }
}

session_t::~session_t() { SSL_free(ssl); }

io_result session_t::map_error(int ret)
{
    int e = SSL_get_error(ssl, ret);
    switch (e)
    {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return io_result::cont;
        case SSL_ERROR_ZERO_RETURN:
            return io_result::closed;
        case SSL_ERROR_SYSCALL:
            if (ERR_peek_error() == 0)
            {
                if (errno == 0 || errno == EPIPE || errno == ECONNRESET)
                {
                    error = "connection closed by peer";
                    return io_result::closed;
                }
                error = "tls system error, errno " + std::to_string(errno);
                return io_result::failed;
            }
            error = last_error_string();
            return io_result::failed;
        default:
        {
            long verify_result = SSL_get_verify_result(ssl);
            if (verify_result != X509_V_OK)
            {
                error = std::string("certificate verify failed: ") + X509_verify_cert_error_string(verify_result);
                ERR_clear_error();
            }
            else
            {
                error = last_error_string();
            }
            return io_result::failed;
        }
    }
}

io_result session_t::handshake()
{
    if (established)
        return io_result::ok;
    ERR_clear_error();
    errno = 0;
    int ret = SSL_do_handshake(ssl);
    if (ret == 1)
    {
        established = true;
        return io_result::ok;
    }
    auto r = map_error(ret);
    if (r == io_result::closed)
    {
        /// the peer hung up in the middle of the handshake
        if (error.empty())
            error = "connection closed during handshake";
        return io_result::failed;
    }
    return r;
}

io_result session_t::read(byte *data, u64 len, u64 &read_len)
{
    read_len = 0;
    ERR_clear_error();
    errno = 0;
    size_t n = 0;
    if (SSL_read_ex(ssl, data, len, &n) == 1)
    {
        read_len = n;
        return io_result::ok;
    }
    return map_error(0);
}

io_result session_t::write(const byte *data, u64 len, u64 &written)
{
    written = 0;
    ERR_clear_error();
    errno = 0;
    size_t n = 0;
    if (SSL_write_ex(ssl, data, len, &n) == 1)
    {
        written = n;
        return io_result::ok;
    }
    return map_error(0);
}

void session_t::shutdown()
{
    if (!established)
        return;
    ERR_clear_error();
    if (SSL_shutdown(ssl) < 0)
    {
        VLOG(2) << "tls shutdown not completed: " << last_error_string();
    }
}

} // namespace piecenet::tls
