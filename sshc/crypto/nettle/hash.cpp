#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/hash.hpp"
#include "sshc/crypto/ids.hpp"

#include <algorithm>
#include <memory>

#include <nettle/sha1.h>
#include <nettle/sha2.h>

namespace securepath::sshc::nettle {

template<typename Ctx, std::size_t DigestSize, auto Init, auto Update, auto Digest>
class nettle_hash : public hash {
public:
	nettle_hash()
	: hash(DigestSize)
	{
		Init(&ctx_);
	}

	void process(const_span in) override {
		Update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void digest(span out) override {
		SSHC_ASSERT(out.size() >= DigestSize, "invalid out buffer size");
		Digest(&ctx_, std::min<std::size_t>(DigestSize, out.size()), to_uint8_ptr(out));
	}

private:
	Ctx ctx_;
};

using sha1_hash = nettle_hash<sha1_ctx, SHA1_DIGEST_SIZE, nettle_sha1_init, nettle_sha1_update, nettle_sha1_digest>;
using sha2_256_hash = nettle_hash<sha256_ctx, SHA256_DIGEST_SIZE, nettle_sha256_init, nettle_sha256_update, nettle_sha256_digest>;
using sha2_512_hash = nettle_hash<sha512_ctx, SHA512_DIGEST_SIZE, nettle_sha512_init, nettle_sha512_update, nettle_sha512_digest>;

std::unique_ptr<sshc::hash> create_hash(hash_type t, crypto_call_context const& call) {
	using enum hash_type;
	if(t == sha1) {
		return std::make_unique<sha1_hash>();
	} else if(t == sha2_256) {
		return std::make_unique<sha2_256_hash>();
	} else if(t == sha2_512) {
		return std::make_unique<sha2_512_hash>();
	}
	call.log.log(logger::error, "unsupported hash type {}", to_string(t));
	return nullptr;
}

}
