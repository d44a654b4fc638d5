#ifndef SSHC_CRYPTO_RANDOM_HEADER
#define SSHC_CRYPTO_RANDOM_HEADER

#include "sshc/common/types.hpp"

namespace securepath::sshc {

/// Source of random values for padding, cookies and key generation
class random {
public:
	virtual ~random() = default;

	// returns random std::size_t between [min, max] range
	virtual std::size_t random_uint(std::size_t min, std::size_t max) = 0;

	// fills the given span with random bytes
	virtual void random_bytes(span output) = 0;
};

/// read entropy from the operating system, returns false if not available
bool system_entropy(span output);

}

#endif
