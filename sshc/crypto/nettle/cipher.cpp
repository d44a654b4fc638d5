#include "sshc/common/util.hpp"
#include "sshc/crypto/crypto_call_context.hpp"
#include "sshc/crypto/cipher.hpp"
#include "sshc/crypto/ids.hpp"

#include <cstring>
#include <memory>

#include <nettle/aes.h>
#include <nettle/ctr.h>
#include <nettle/gcm.h>

namespace securepath::sshc::nettle {

static_assert(GCM_IV_SIZE == 12, "invalid iv size");

struct gcm_aes128_ops {
	using ctx_type = gcm_aes128_ctx;
	static constexpr std::size_t key_size = AES128_KEY_SIZE;
	static void set_key(ctx_type* c, std::uint8_t const* k) { nettle_gcm_aes128_set_key(c, k); }
	static void set_iv(ctx_type* c, std::uint8_t const* iv) { nettle_gcm_aes128_set_iv(c, GCM_IV_SIZE, iv); }
	static void update(ctx_type* c, std::size_t s, std::uint8_t const* d) { nettle_gcm_aes128_update(c, s, d); }
	static void encrypt(ctx_type* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) { nettle_gcm_aes128_encrypt(c, s, o, i); }
	static void decrypt(ctx_type* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) { nettle_gcm_aes128_decrypt(c, s, o, i); }
	static void digest(ctx_type* c, std::size_t s, std::uint8_t* o) { nettle_gcm_aes128_digest(c, s, o); }
};

struct gcm_aes256_ops {
	using ctx_type = gcm_aes256_ctx;
	static constexpr std::size_t key_size = AES256_KEY_SIZE;
	static void set_key(ctx_type* c, std::uint8_t const* k) { nettle_gcm_aes256_set_key(c, k); }
	static void set_iv(ctx_type* c, std::uint8_t const* iv) { nettle_gcm_aes256_set_iv(c, GCM_IV_SIZE, iv); }
	static void update(ctx_type* c, std::size_t s, std::uint8_t const* d) { nettle_gcm_aes256_update(c, s, d); }
	static void encrypt(ctx_type* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) { nettle_gcm_aes256_encrypt(c, s, o, i); }
	static void decrypt(ctx_type* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) { nettle_gcm_aes256_decrypt(c, s, o, i); }
	static void digest(ctx_type* c, std::size_t s, std::uint8_t* o) { nettle_gcm_aes256_digest(c, s, o); }
};

/// aes-gcm as used by openssh, the packet length is authenticated but not encrypted
template<typename Ops>
class aes_gcm_cipher : public aead_cipher {
public:
	aes_gcm_cipher(cipher_dir dir, const_span secret, const_span iv)
	: aead_cipher(GCM_BLOCK_SIZE, GCM_DIGEST_SIZE)
	, dir_(dir)
	{
		SSHC_ASSERT(iv.size() == GCM_IV_SIZE, "invalid iv size");
		SSHC_ASSERT(secret.size() == Ops::key_size, "invalid key size");

		std::memcpy(iv_, iv.data(), GCM_IV_SIZE);

		Ops::set_key(&ctx_, to_uint8_ptr(secret));
		Ops::set_iv(&ctx_, iv_);
	}

	bool process(const_span in, span out) override {
		SSHC_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		if(in.size() <= out.size()) {
			if(dir_ == cipher_dir::encrypt) {
				Ops::encrypt(&ctx_, in.size(), to_uint8_ptr(out), to_uint8_ptr(in));
			} else {
				Ops::decrypt(&ctx_, in.size(), to_uint8_ptr(out), to_uint8_ptr(in));
			}
			return true;
		}
		return false;
	}

	void process_auth(const_span in) override {
		Ops::update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void tag(span out) override {
		SSHC_ASSERT(out.size() == GCM_DIGEST_SIZE, "invalid digest size");

		Ops::digest(&ctx_, out.size(), to_uint8_ptr(out));

		// 4 bytes fixed field and 8 bytes big endian invocation counter (RFC 5647)
		int i = sizeof(iv_)-1;
		while(i > 3 && ++iv_[i] == 0) {
			--i;
		}
		Ops::set_iv(&ctx_, iv_);
	}

private:
	cipher_dir dir_;
	typename Ops::ctx_type ctx_;
	std::uint8_t iv_[GCM_IV_SIZE];
};

struct aes128_ops {
	using ctx_type = aes128_ctx;
	static constexpr std::size_t key_size = AES128_KEY_SIZE;
	static void set_key(ctx_type* c, std::uint8_t const* k) { nettle_aes128_set_encrypt_key(c, k); }
	static void encrypt(void const* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) {
		nettle_aes128_encrypt(static_cast<ctx_type const*>(c), s, o, i);
	}
};

struct aes256_ops {
	using ctx_type = aes256_ctx;
	static constexpr std::size_t key_size = AES256_KEY_SIZE;
	static void set_key(ctx_type* c, std::uint8_t const* k) { nettle_aes256_set_encrypt_key(c, k); }
	static void encrypt(void const* c, std::size_t s, std::uint8_t* o, std::uint8_t const* i) {
		nettle_aes256_encrypt(static_cast<ctx_type const*>(c), s, o, i);
	}
};

/// aes in counter mode (RFC 4344), encryption and decryption are the same operation
template<typename Ops>
class aes_ctr_cipher : public cipher {
public:
	aes_ctr_cipher(const_span secret, const_span iv)
	: cipher(AES_BLOCK_SIZE, false)
	{
		SSHC_ASSERT(iv.size() == AES_BLOCK_SIZE, "invalid iv size");
		SSHC_ASSERT(secret.size() == Ops::key_size, "invalid key size");

		std::memcpy(ctr_, iv.data(), AES_BLOCK_SIZE);
		Ops::set_key(&ctx_, to_uint8_ptr(secret));
	}

	bool process(const_span in, span out) override {
		SSHC_ASSERT(same_source_or_non_overlapping(in, out), "invalid in/out");
		// keystream is only continuous across calls for whole blocks
		if(in.size() <= out.size() && in.size() % AES_BLOCK_SIZE == 0) {
			nettle_ctr_crypt(&ctx_, Ops::encrypt, AES_BLOCK_SIZE, ctr_, in.size(), to_uint8_ptr(out), to_uint8_ptr(in));
			return true;
		}
		return false;
	}

private:
	typename Ops::ctx_type ctx_;
	std::uint8_t ctr_[AES_BLOCK_SIZE];
};

std::unique_ptr<sshc::cipher> create_cipher(cipher_type t, cipher_dir dir, const_span secret, const_span iv, crypto_call_context const& call) {
	if(secret.size() != cipher_key_size(t) || iv.size() != cipher_iv_size(t)) {
		call.log.log(logger::error, "invalid key or iv size for {}", to_string(t));
		return nullptr;
	}

	using enum cipher_type;
	switch(t) {
		case openssh_aes_256_gcm: return std::make_unique<aes_gcm_cipher<gcm_aes256_ops>>(dir, secret, iv);
		case openssh_aes_128_gcm: return std::make_unique<aes_gcm_cipher<gcm_aes128_ops>>(dir, secret, iv);
		case aes_256_ctr: return std::make_unique<aes_ctr_cipher<aes256_ops>>(secret, iv);
		case aes_128_ctr: return std::make_unique<aes_ctr_cipher<aes128_ops>>(secret, iv);
		default: break;
	}
	return nullptr;
}

}
