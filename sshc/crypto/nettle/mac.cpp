#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/ids.hpp"
#include "sshc/crypto/mac.hpp"

#include <algorithm>
#include <memory>

#include <nettle/hmac.h>

namespace securepath::sshc::nettle {

class hmac_sha2_256 : public mac {
public:
	hmac_sha2_256(const_span secret)
	: mac(SHA256_DIGEST_SIZE)
	{
		nettle_hmac_sha256_set_key(&ctx_, secret.size(), to_uint8_ptr(secret));
	}

	void process(const_span in) override {
		nettle_hmac_sha256_update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void result(span out) override {
		nettle_hmac_sha256_digest(&ctx_, std::min<std::size_t>(SHA256_DIGEST_SIZE, out.size()), to_uint8_ptr(out));
	}

private:
	hmac_sha256_ctx ctx_;
};

class hmac_sha2_512 : public mac {
public:
	hmac_sha2_512(const_span secret)
	: mac(SHA512_DIGEST_SIZE)
	{
		nettle_hmac_sha512_set_key(&ctx_, secret.size(), to_uint8_ptr(secret));
	}

	void process(const_span in) override {
		nettle_hmac_sha512_update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void result(span out) override {
		nettle_hmac_sha512_digest(&ctx_, std::min<std::size_t>(SHA512_DIGEST_SIZE, out.size()), to_uint8_ptr(out));
	}

private:
	hmac_sha512_ctx ctx_;
};

std::unique_ptr<sshc::mac> create_mac(mac_type type, const_span secret, crypto_call_context const& call) {
	if(secret.size() != mac_key_size(type)) {
		call.log.log(logger::error, "invalid key size for {}", to_string(type));
		return nullptr;
	}
	if(type == mac_type::hmac_sha2_256) {
		return std::make_unique<hmac_sha2_256>(secret);
	} else if(type == mac_type::hmac_sha2_512) {
		return std::make_unique<hmac_sha2_512>(secret);
	}
	return nullptr;
}

}
