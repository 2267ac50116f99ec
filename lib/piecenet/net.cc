#include "piecenet/net.hpp"
#include <glog/logging.h>
#include <openssl/ssl.h>

namespace piecenet
{
void init_lib()
{
    signal(SIGPIPE, SIG_IGN);
    if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr) != 1)
    {
        LOG(FATAL) << "failed to initialize openssl";
    }
}

/// openssl releases its global state at exit
void uninit_lib() {}
} // namespace piecenet
