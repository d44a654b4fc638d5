#include "nettle_helper.hpp"
#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/public_key.hpp"
#include "sshc/crypto/ids.hpp"

#include <memory>

#include <nettle/eddsa.h>
#include <nettle/rsa.h>
#include <nettle/sha1.h>
#include <nettle/sha2.h>

namespace securepath::sshc::nettle {

class ed25519_public_key : public public_key {
public:
	ed25519_public_key(ed25519_public_key_data const& d)
	: pubkey_(d.pubkey.begin(), d.pubkey.end())
	{
	}

	bool valid() const {
		return pubkey_.size() == ED25519_KEY_SIZE;
	}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	bool verify(const_span msg, const_span signature) const override {
		if(signature.size() != ED25519_SIGNATURE_SIZE) {
			return false;
		}

		return nettle_ed25519_sha512_verify(
			to_uint8_ptr(pubkey_),
			msg.size(),
			to_uint8_ptr(msg),
			to_uint8_ptr(signature) ) == 1;
	}

	bool fill_data(public_key_data& data) const override {
		bool ret = data.type() == type();
		if(ret) {
			auto& d = static_cast<ed25519_public_key_data&>(data);
			d.pubkey = const_span(pubkey_);
		}
		return ret;
	}

private:
	byte_vector pubkey_;
};

/// PKCS#1 v1.5 signatures, the hash is selected by the rsa variant
class rsa_public_key : public public_key {
public:
	rsa_public_key(rsa_public_key_data const& d)
	: type_(d.sig_type)
	, e_(d.e.data.begin(), d.e.data.end())
	, n_(d.n.data.begin(), d.n.data.end())
	{
		nettle_rsa_public_key_init(&public_key_);
		nettle_mpz_set_str_256_u(public_key_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(public_key_.n, d.n.data.size(), to_uint8_ptr(d.n.data));
		is_valid_ = nettle_rsa_public_key_prepare(&public_key_) == 1;
	}

	~rsa_public_key() {
		nettle_rsa_public_key_clear(&public_key_);
	}

	rsa_public_key(rsa_public_key const&) = delete;
	rsa_public_key& operator=(rsa_public_key const&) = delete;

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return type_;
	}

	bool verify(const_span in, const_span signature) const override {
		// signature is always the modulus length
		if(signature.size() != public_key_.size) {
			return false;
		}

		integer sig(signature);

		using enum key_type;
		if(type_ == ssh_rsa) {
			sha1_ctx h;
			nettle_sha1_init(&h);
			nettle_sha1_update(&h, in.size(), to_uint8_ptr(in));
			return nettle_rsa_sha1_verify(&public_key_, &h, sig) == 1;
		} else if(type_ == rsa_sha2_256) {
			sha256_ctx h;
			nettle_sha256_init(&h);
			nettle_sha256_update(&h, in.size(), to_uint8_ptr(in));
			return nettle_rsa_sha256_verify(&public_key_, &h, sig) == 1;
		} else if(type_ == rsa_sha2_512) {
			sha512_ctx h;
			nettle_sha512_init(&h);
			nettle_sha512_update(&h, in.size(), to_uint8_ptr(in));
			return nettle_rsa_sha512_verify(&public_key_, &h, sig) == 1;
		}
		return false;
	}

	bool fill_data(public_key_data& data) const override {
		bool ret = same_key_format(data.type(), type());
		if(ret) {
			auto& d = static_cast<rsa_public_key_data&>(data);
			d.e.data = const_span(e_);
			d.n.data = const_span(n_);
		}
		return ret;
	}

private:
	key_type type_;
	bool is_valid_{};
	byte_vector e_;
	byte_vector n_;
	::rsa_public_key public_key_;
};

std::shared_ptr<sshc::public_key> create_public_key(public_key_data const& d, crypto_call_context const& call) {
	using enum key_type;
	key_type t = d.type();
	if(t == ssh_ed25519) {
		auto key = std::make_shared<ed25519_public_key>(static_cast<ed25519_public_key_data const&>(d));
		if(key->valid()) {
			return key;
		}
	} else if(t == ssh_rsa || t == rsa_sha2_256 || t == rsa_sha2_512) {
		auto key = std::make_shared<rsa_public_key>(static_cast<rsa_public_key_data const&>(d));
		if(key->valid()) {
			return key;
		}
	}
	call.log.log(logger::debug, "invalid public key data for {}", to_string(t));
	return nullptr;
}

}
