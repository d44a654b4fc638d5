#ifndef SSHC_TEST_CRYPTO_HEADER
#define SSHC_TEST_CRYPTO_HEADER

#include "log.hpp"
#include "sshc/crypto/crypto_context.hpp"
#include "sshc/core/ssh_private_key.hpp"
#include <catch2/catch.hpp>

namespace securepath::sshc::test {

// fixed test keys, the public parts and fingerprints are in crypto.cpp
extern std::string const ed25519_fprint;
extern std::string const ed25519_pubkey;
extern std::string const ed25519_privkey;

extern std::string const rsa_fprint;
extern std::string const rsa_pubkey;
extern std::string const rsa_privkey;

struct crypto_test_context : crypto_context {
	crypto_test_context(logger& log = test_log(), crypto_context cc = default_crypto_context())
	: crypto_context(std::move(cc))
	, rand(construct_random())
	, call(log, *rand)
	{
		REQUIRE(rand);
	}

	std::unique_ptr<random> rand;
	crypto_call_context call;

public:
	ssh_private_key test_ed25519_private_key() const;
	ssh_private_key test_rsa_private_key() const;
};

}

#endif
