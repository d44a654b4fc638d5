#include "nettle_helper.hpp"
#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/private_key.hpp"
#include "sshc/crypto/public_key.hpp"
#include "sshc/crypto/ids.hpp"

#include <cstring>
#include <memory>

#include <nettle/eddsa.h>
#include <nettle/rsa.h>
#include <nettle/sha1.h>
#include <nettle/sha2.h>

namespace securepath::sshc::nettle {

std::shared_ptr<sshc::public_key> create_public_key(public_key_data const&, crypto_call_context const&);

class ed25519_private_key : public private_key {
public:
	ed25519_private_key(ed25519_private_key_data const& d, crypto_call_context call)
	: privkey_(d.privkey.begin(), d.privkey.end())
	, call_(call)
	{
		if(d.pubkey) {
			pubkey_.insert(pubkey_.end(), d.pubkey->begin(), d.pubkey->end());
		} else if(valid()) {
			pubkey_.resize(ed25519_key_size);
			nettle_ed25519_sha512_public_key(to_uint8_ptr(pubkey_), to_uint8_ptr(privkey_));
		}
	}

	bool valid() const {
		return privkey_.size() == ED25519_KEY_SIZE;
	}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	std::shared_ptr<sshc::public_key> public_key() const override {
		ed25519_public_key_data data{pubkey_};
		return create_public_key(data, call_);
	}

	std::size_t signature_size() const override {
		return ED25519_SIGNATURE_SIZE;
	}

	bool sign(const_span in, span out) const override {
		if(out.size() < ED25519_SIGNATURE_SIZE) {
			return false;
		}

		nettle_ed25519_sha512_sign(
			to_uint8_ptr(pubkey_),
			to_uint8_ptr(privkey_),
			in.size(),
			to_uint8_ptr(in),
			to_uint8_ptr(out) );

		return true;
	}

	bool fill_data(private_key_data& data) const override {
		bool ret = data.type() == type();
		if(ret) {
			auto& d = static_cast<ed25519_private_key_data&>(data);
			d.privkey = privkey_;
			d.pubkey = pubkey_;
		}
		return ret;
	}

private:
	byte_vector privkey_;
	byte_vector pubkey_;
	crypto_call_context call_;
};

class rsa_private_key : public private_key {
public:
	rsa_private_key(rsa_private_key_data const& d, crypto_call_context const& call)
	: call_(call)
	, type_(d.sig_type)
	, e_(d.e.data.begin(), d.e.data.end())
	, n_(d.n.data.begin(), d.n.data.end())
	, d_(d.d.data.begin(), d.d.data.end())
	, p_(d.p.data.begin(), d.p.data.end())
	, q_(d.q.data.begin(), d.q.data.end())
	{
		nettle_rsa_public_key_init(&public_key_);
		nettle_mpz_set_str_256_u(public_key_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(public_key_.n, d.n.data.size(), to_uint8_ptr(d.n.data));

		nettle_rsa_private_key_init(&key_);
		nettle_mpz_set_str_256_u(key_.d, d.d.data.size(), to_uint8_ptr(d.d.data));
		nettle_mpz_set_str_256_u(key_.p, d.p.data.size(), to_uint8_ptr(d.p.data));
		nettle_mpz_set_str_256_u(key_.q, d.q.data.size(), to_uint8_ptr(d.q.data));

		// crt members: a = d mod (p-1), b = d mod (q-1), c = q^-1 mod p
		integer p_1, q_1;
		mpz_sub_ui(p_1, key_.p, 1);
		mpz_sub_ui(q_1, key_.q, 1);
		mpz_mod(key_.a, key_.d, p_1);
		mpz_mod(key_.b, key_.d, q_1);

		is_valid_ = mpz_invert(key_.c, key_.q, key_.p) != 0
			&& nettle_rsa_public_key_prepare(&public_key_) == 1
			&& nettle_rsa_private_key_prepare(&key_) == 1;
	}

	~rsa_private_key() {
		nettle_rsa_private_key_clear(&key_);
		nettle_rsa_public_key_clear(&public_key_);
	}

	rsa_private_key(rsa_private_key const&) = delete;
	rsa_private_key& operator=(rsa_private_key const&) = delete;

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return type_;
	}

	std::shared_ptr<sshc::public_key> public_key() const override {
		rsa_public_key_data data{to_umpint(e_), to_umpint(n_), type_};
		return create_public_key(data, call_);
	}

	std::size_t signature_size() const override {
		return public_key_.size;
	}

	bool sign(const_span in, span out) const override {
		if(out.size() < signature_size()) {
			return false;
		}

		integer sig;
		bool res = false;

		using enum key_type;
		if(type_ == ssh_rsa) {
			sha1_ctx h;
			nettle_sha1_init(&h);
			nettle_sha1_update(&h, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha1_sign_tr(&public_key_, &key_, &call_.rand, extract_rand, &h, sig) == 1;
		} else if(type_ == rsa_sha2_256) {
			sha256_ctx h;
			nettle_sha256_init(&h);
			nettle_sha256_update(&h, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha256_sign_tr(&public_key_, &key_, &call_.rand, extract_rand, &h, sig) == 1;
		} else if(type_ == rsa_sha2_512) {
			sha512_ctx h;
			nettle_sha512_init(&h);
			nettle_sha512_update(&h, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha512_sign_tr(&public_key_, &key_, &call_.rand, extract_rand, &h, sig) == 1;
		}

		if(res) {
			std::size_t size = nettle_mpz_sizeinbase_256_u(sig);
			// PKCS#1 signatures are always modulus length, pad zeroes in front (I2OSP)
			std::size_t padding = signature_size()-size;
			if(padding) {
				std::memset(out.data(), 0, padding);
			}
			nettle_mpz_get_str_256(size, to_uint8_ptr(out)+padding, sig);
		}
		return res;
	}

	bool fill_data(private_key_data& data) const override {
		bool ret = same_key_format(data.type(), type());
		if(ret) {
			auto& d = static_cast<rsa_private_key_data&>(data);
			d.e.data = const_span(e_);
			d.n.data = const_span(n_);
			d.d.data = const_span(d_);
			d.p.data = const_span(p_);
			d.q.data = const_span(q_);
		}
		return ret;
	}

private:
	crypto_call_context call_;
	key_type type_;
	bool is_valid_{};
	::rsa_public_key public_key_;
	::rsa_private_key key_;

	byte_vector e_;
	byte_vector n_;
	byte_vector d_;
	byte_vector p_;
	byte_vector q_;
};

std::shared_ptr<sshc::private_key> create_private_key(private_key_data const& d, crypto_call_context const& call) {
	using enum key_type;
	key_type t = d.type();
	if(t == ssh_ed25519) {
		auto key = std::make_shared<ed25519_private_key>(static_cast<ed25519_private_key_data const&>(d), call);
		if(key->valid()) {
			return key;
		}
	} else if(t == ssh_rsa || t == rsa_sha2_256 || t == rsa_sha2_512) {
		auto key = std::make_shared<rsa_private_key>(static_cast<rsa_private_key_data const&>(d), call);
		if(key->valid()) {
			return key;
		}
	}
	call.log.log(logger::debug, "invalid private key data for {}", to_string(t));
	return nullptr;
}

}
