#ifndef SSHC_CRYPTO_CRYPTO_CONTEXT_HEADER
#define SSHC_CRYPTO_CRYPTO_CONTEXT_HEADER

#include "ids.hpp"
#include "crypto_call_context.hpp"
#include "cipher.hpp"
#include "mac.hpp"
#include "public_key.hpp"
#include "private_key.hpp"
#include "key_exchange.hpp"
#include "hash.hpp"

#include <functional>
#include <memory>

namespace securepath::sshc {

template<typename Ptr, typename... ExtraParams>
using ctor = std::function<Ptr (ExtraParams const&..., crypto_call_context const&)>;

/// Factory functions used to construct all crypto objects
struct crypto_context {

	/// random number generator suitable for cryptographic usage, nullptr if it cannot be seeded
	std::function<std::unique_ptr<random>()> construct_random{};

	/// cipher from type, direction, secret key and iv
	ctor<std::unique_ptr<cipher>, cipher_type, cipher_dir, const_span, const_span> construct_cipher{};
	/// mac from type and secret key
	ctor<std::unique_ptr<mac>, mac_type, const_span> construct_mac{};
	/// public key from public key data (the data is copied)
	ctor<std::shared_ptr<public_key>, public_key_data> construct_public_key{};
	/// private key from private key data (the data is copied)
	ctor<std::shared_ptr<private_key>, private_key_data> construct_private_key{};
	/// key agreement with freshly generated ephemeral key
	ctor<std::unique_ptr<key_exchange>, key_exchange_type> construct_key_exchange{};
	ctor<std::unique_ptr<hash>, hash_type> construct_hash{};
};

crypto_context default_crypto_context();

}

#endif
