#ifndef SSHC_CRYPTO_NETTLE_HELPER_HEADER
#define SSHC_CRYPTO_NETTLE_HELPER_HEADER

#include "sshc/common/types.hpp"
#include "sshc/crypto/random.hpp"

#include <nettle/bignum.h>

namespace securepath::sshc::nettle {

/// RAII wrapper for gmp integer
struct integer {
	integer() {
		mpz_init(handle);
	}

	integer(unsigned long int value) {
		mpz_init_set_ui(handle, value);
	}

	integer(const_span data) {
		nettle_mpz_init_set_str_256_u(handle, data.size(), to_uint8_ptr(data));
	}

	~integer() {
		mpz_clear(handle);
	}

	integer(integer const& i) {
		mpz_init_set(handle, i.handle);
	}

	integer& operator=(integer const& i) {
		mpz_set(handle, i.handle);
		return *this;
	}

	operator mpz_t const&() const {
		return handle;
	}

	operator mpz_t&() {
		return handle;
	}

	byte_vector to_bytes() const {
		byte_vector res(nettle_mpz_sizeinbase_256_u(handle));
		nettle_mpz_get_str_256(res.size(), to_uint8_ptr(res), handle);
		return res;
	}

	mpz_t handle;
};

// decode 32 random bytes as an integer scalar (RFC 7748)
inline void clamp25519(span key) {
	if(key.size() == 32) {
		key[0]  &= std::byte{248};
		key[31] &= std::byte{127};
		key[31] |= std::byte{64};
	}
}

// nettle_random_func adaptor for our random interface
inline void extract_rand(void* ctx, std::size_t length, std::uint8_t* dst) {
	auto& r = *static_cast<sshc::random*>(ctx);
	r.random_bytes(span(reinterpret_cast<std::byte*>(dst), length));
}

}

#endif
