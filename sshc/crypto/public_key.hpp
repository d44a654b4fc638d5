#ifndef SSHC_CRYPTO_PUBLIC_KEY_HEADER
#define SSHC_CRYPTO_PUBLIC_KEY_HEADER

#include "ids.hpp"

namespace securepath::sshc {

struct public_key_data {
	virtual key_type type() const = 0;
protected:
	~public_key_data() = default;
};

class public_key {
public:
	virtual ~public_key() = default;

	virtual key_type type() const = 0;

	/// verify raw signature (without the ssh signature blob framing)
	virtual bool verify(const_span msg, const_span signature) const = 0;

	// the data must point to the same type as the public key
	virtual bool fill_data(public_key_data& data) const = 0;
};

struct ed25519_public_key_data : public_key_data {
	ed25519_public_key_data() = default;
	ed25519_public_key_data(const_span v)
	: pubkey(v)
	{}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	const_span pubkey;
};

struct rsa_public_key_data : public_key_data {
	rsa_public_key_data() = default;
	rsa_public_key_data(const_mpint_span e, const_mpint_span n, key_type sig = key_type::rsa_sha2_256)
	: e(e)
	, n(n)
	, sig_type(sig)
	{
	}

	const_mpint_span e;
	const_mpint_span n;
	// rsa variant selecting the signature hash
	key_type sig_type{key_type::rsa_sha2_256};

	key_type type() const override {
		return sig_type;
	}
};

}

#endif
