#ifndef SSHC_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER
#define SSHC_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER

#include "sshc/crypto/crypto_context.hpp"

namespace securepath::sshc::nettle {

crypto_context create_nettle_context();

}

#endif
