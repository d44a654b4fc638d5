#ifndef SSHC_CRYPTO_PRIVATE_KEY_HEADER
#define SSHC_CRYPTO_PRIVATE_KEY_HEADER

#include "ids.hpp"
#include <memory>
#include <optional>

namespace securepath::sshc {

class public_key;

struct private_key_data {
	virtual key_type type() const = 0;
protected:
	~private_key_data() = default;
};

class private_key {
public:
	virtual ~private_key() = default;

	virtual key_type type() const = 0;
	virtual std::shared_ptr<sshc::public_key> public_key() const = 0;

	virtual std::size_t signature_size() const = 0;
	virtual bool sign(const_span in, span out) const = 0;

	byte_vector sign(const_span in) const {
		byte_vector res;
		res.resize(signature_size());
		if(sign(in, res)) {
			return res;
		}
		return {};
	}

	// the data must point to the same type as the private key
	virtual bool fill_data(private_key_data& data) const = 0;
};

struct ed25519_private_key_data : private_key_data {
	ed25519_private_key_data() = default;
	ed25519_private_key_data(const_span priv, std::optional<const_span> pub = std::nullopt)
	: privkey(priv)
	, pubkey(pub)
	{}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	const_span privkey;
	std::optional<const_span> pubkey;
};

struct rsa_private_key_data : private_key_data {
	rsa_private_key_data() = default;
	rsa_private_key_data(const_mpint_span e, const_mpint_span n, const_mpint_span d, const_mpint_span p, const_mpint_span q, key_type sig = key_type::rsa_sha2_256)
	: e(e), n(n), d(d), p(p), q(q), sig_type(sig)
	{
	}

	const_mpint_span e;
	const_mpint_span n;
	const_mpint_span d;
	const_mpint_span p;
	const_mpint_span q;
	key_type sig_type{key_type::rsa_sha2_256};

	key_type type() const override {
		return sig_type;
	}
};

}

#endif
