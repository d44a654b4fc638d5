#ifndef SSHC_CRYPTO_KEY_EXCHANGE_HEADER
#define SSHC_CRYPTO_KEY_EXCHANGE_HEADER

#include "ids.hpp"
#include "sshc/common/types.hpp"

namespace securepath::sshc {

class key_exchange {
public:
	virtual ~key_exchange() = default;

	virtual key_exchange_type type() const = 0;

	/// public part that is sent to the remote side, the format depends on the key exchange
	virtual const_span public_key() const = 0;

	/// calculate shared secret, returns empty vector if remote public is not acceptable
	virtual byte_vector agree(const_span remote_public) = 0;
};

// 2048-bit MODP Group from RFC 3526
const_span modp_group_14_modulus();
const_span modp_group_14_generator();

// 4096-bit MODP Group from RFC 3526
const_span modp_group_16_modulus();
const_span modp_group_16_generator();

}

#endif
