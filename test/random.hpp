#ifndef SSHC_TEST_RANDOM_HEADER
#define SSHC_TEST_RANDOM_HEADER

#include "sshc/crypto/random.hpp"

#include <cstdlib>
#include <cstring>

namespace securepath::sshc::test {

/// Predictable random for the framing tests, never used for keys
class trandom : public random {
public:
	// returns random std::size_t between [min, max] range
	std::size_t random_uint(std::size_t min, std::size_t max) override {
		return min + (std::rand() % (max-min+1));
	}

	// fills the given span with zero bytes
	void random_bytes(span output) override {
		std::memset(output.data(), 0, output.size());
	}
};

inline trandom test_rand;

}

#endif
