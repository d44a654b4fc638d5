#include "crypto_context.hpp"
#include "sshc/crypto/nettle/crypto_context.hpp"

namespace securepath::sshc {

crypto_context default_crypto_context() {
	return nettle::create_nettle_context();
}

}
