#ifndef SSHC_CORE_SSH_PUBLIC_KEY_HEADER
#define SSHC_CORE_SSH_PUBLIC_KEY_HEADER

#include "sshc/crypto/crypto_context.hpp"
#include "sshc/crypto/public_key.hpp"
#include <memory>

namespace securepath::sshc {

class binout;

/** \brief SSH Public Key that is used for signature checking
 *
 *  The type is the signature algorithm, for rsa keys this selects the hash
 */
class ssh_public_key {
public:
	ssh_public_key() = default;
	ssh_public_key(std::shared_ptr<public_key>);

	key_type type() const;
	bool valid() const;

	// signature needs to be ssh encoded signature blob of the same algorithm
	bool verify(const_span msg, const_span signature) const;

	// serialise in ssh public key blob format
	bool serialise(binout&) const;

	// "SHA256:" + unpadded base64 of the sha256 hash of the key blob
	std::string fingerprint(crypto_context const& crypto, crypto_call_context const& call) const;

	std::shared_ptr<public_key> const& crypto_key() const { return key_impl_; }
private:
	std::shared_ptr<public_key> key_impl_;
};

/// load key blob, for rsa keys the signature algorithm can be given (defaults to rsa-sha2-256)
ssh_public_key load_ssh_public_key(const_span data, crypto_context const&, crypto_call_context const&, key_type algorithm = key_type::unknown);
ssh_public_key load_base64_ssh_public_key(std::string_view data, crypto_context const&, crypto_call_context const&);

byte_vector to_byte_vector(ssh_public_key const&);

}

#endif
