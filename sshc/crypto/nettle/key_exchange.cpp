#include "nettle_helper.hpp"
#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/ids.hpp"
#include "sshc/crypto/key_exchange.hpp"

#include <memory>

#include <nettle/curve25519.h>

namespace securepath::sshc::nettle {

class X25519_key_exchange : public key_exchange {
public:
	X25519_key_exchange(crypto_call_context const& c)
	: context_(c)
	{
		context_.log.log(logger::debug_trace, "constructing X25519_key_exchange");

		priv_.resize(CURVE25519_SIZE);
		context_.rand.random_bytes(priv_);
		clamp25519(priv_);

		pub_.resize(CURVE25519_SIZE);
		nettle_curve25519_mul_g(to_uint8_ptr(pub_), to_uint8_ptr(priv_));
	}

	key_exchange_type type() const override {
		return key_exchange_type::X25519;
	}

	const_span public_key() const override {
		return pub_;
	}

	byte_vector agree(const_span remote_public) override {
		if(remote_public.size() != CURVE25519_SIZE) {
			return {};
		}

		byte_vector res;
		res.resize(CURVE25519_SIZE);
		nettle_curve25519_mul(
			to_uint8_ptr(res),
			to_uint8_ptr(priv_),
			to_uint8_ptr(remote_public));

		// all zero output means the remote point had small order (RFC 7748 section 6.1)
		std::byte acc{};
		for(auto b : res) {
			acc |= b;
		}
		if(acc == std::byte{}) {
			return {};
		}

		return res;
	}

private:
	crypto_call_context context_;
	byte_vector pub_;
	byte_vector priv_;
};

class dh_key_exchange : public key_exchange {
public:
	dh_key_exchange(key_exchange_type t, crypto_call_context const& c, const_span modulus, const_span generator)
	: context_(c)
	, type_(t)
	, p_(modulus)
	{
		context_.log.log(logger::debug_trace, "constructing dh_key_exchange for {}", to_string(t));

		integer g(generator);

		// q = (p - 1) / 2 is the order of the subgroup
		integer q(p_);
		mpz_sub_ui(q, q, 1);
		mpz_div_ui(q, q, 2);

		// random 1 <= y < q
		mpz_sub_ui(q, q, 1);
		nettle_mpz_random(y_, &context_.rand, extract_rand, q);
		mpz_add_ui(y_, y_, 1);

		// e = g^y mod p
		integer e;
		mpz_powm(e, g, y_, p_);

		is_valid_ = check_valid_public_key(e);
		if(is_valid_) {
			pubkey_ = e.to_bytes();
		}
	}

	bool is_valid() const {
		return is_valid_;
	}

	key_exchange_type type() const override {
		return type_;
	}

	const_span public_key() const override {
		return pubkey_;
	}

	byte_vector agree(const_span remote_public) override {
		if(remote_public.empty()) {
			return {};
		}

		integer f(remote_public);
		if(!check_valid_public_key(f)) {
			return {};
		}

		// k = f^y mod p
		integer k;
		mpz_powm(k, f, y_, p_);
		return k.to_bytes();
	}

private:
	// 1 < e < p-1
	bool check_valid_public_key(mpz_t const e) const {
		integer p_1(p_);
		mpz_sub_ui(p_1, p_1, 1);
		return mpz_cmp_ui(e, 1) > 0 && mpz_cmp(e, p_1) < 0;
	}

private:
	crypto_call_context context_;
	key_exchange_type type_;
	bool is_valid_{};
	integer p_;
	integer y_;
	byte_vector pubkey_;
};

std::unique_ptr<sshc::key_exchange> create_key_exchange(key_exchange_type t, crypto_call_context const& c) {
	using enum key_exchange_type;
	std::unique_ptr<dh_key_exchange> dh;
	if(t == X25519) {
		return std::make_unique<X25519_key_exchange>(c);
	} else if(t == dh_group14) {
		dh = std::make_unique<dh_key_exchange>(t, c, modp_group_14_modulus(), modp_group_14_generator());
	} else if(t == dh_group16) {
		dh = std::make_unique<dh_key_exchange>(t, c, modp_group_16_modulus(), modp_group_16_generator());
	}
	if(dh && dh->is_valid()) {
		return dh;
	}
	c.log.log(logger::error, "failed to create key exchange {}", to_string(t));
	return nullptr;
}

}
