#ifndef SSHC_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER
#define SSHC_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER

#include "random.hpp"
#include "sshc/common/logger.hpp"

namespace securepath::sshc {

/// Context that is passed to crypto construct functions
struct crypto_call_context {
	logger& log;
	random& rand;
};

}

#endif
