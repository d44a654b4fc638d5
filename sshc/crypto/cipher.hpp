#ifndef SSHC_CRYPTO_CIPHER_HEADER
#define SSHC_CRYPTO_CIPHER_HEADER

#include "sshc/common/types.hpp"

namespace securepath::sshc {

class cipher {
public:
	cipher(std::size_t bsize, bool aead)
	: block_size_(bsize)
	, aead_(aead)
	{}

	virtual ~cipher() = default;

	/// cipher block size in bytes
	std::size_t block_size() const { return block_size_; }

	/// true if this is authenticated encryption with associated data (AEAD).
	bool is_aead() const { return aead_; }

	/// encrypt/decrypt, in and out can be the same range but must not otherwise overlap
	virtual bool process(const_span in, span out) = 0;

private:
	std::size_t const block_size_;
	bool const aead_;
};

class aead_cipher : public cipher {
public:
	aead_cipher(std::size_t bsize, std::size_t tag_size)
	: cipher(bsize, true)
	, tag_size_(tag_size)
	{}

	/// size of the authentication tag in bytes
	std::size_t tag_size() const { return tag_size_; }

	/// associated data that is authenticated but not encrypted
	virtual void process_auth(const_span in) = 0;

	/// output tag and move to the next nonce
	virtual void tag(span out) = 0;

private:
	std::size_t const tag_size_;
};

}

#endif
