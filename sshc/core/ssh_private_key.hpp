#ifndef SSHC_CORE_SSH_PRIVATE_KEY_HEADER
#define SSHC_CORE_SSH_PRIVATE_KEY_HEADER

#include "ssh_public_key.hpp"
#include "sshc/crypto/crypto_context.hpp"
#include "sshc/crypto/private_key.hpp"
#include <memory>

namespace securepath::sshc {

class ssh_bf_reader;

/** \brief SSH Private Key that is used for client authentication (and host key of the test peer)
 */
class ssh_private_key {
public:
	ssh_private_key() = default;
	ssh_private_key(std::shared_ptr<private_key>, std::string_view comment = "");

	key_type type() const;
	ssh_public_key public_key() const;

	bool valid() const;

	// this will return encoded ssh signature
	byte_vector sign(const_span in) const;

	void set_comment(std::string s) { comment_ = std::move(s); }
	std::string const& comment() const { return comment_; }

private:
	std::shared_ptr<private_key> key_impl_;
	std::string comment_;
};

/** \brief Load the key fields in the same layout as inside openssh private key section
 *
 *  string type, key type specific fields, string comment
 */
ssh_private_key load_raw_ssh_private_key(ssh_bf_reader&, crypto_context const&, crypto_call_context const&);
ssh_private_key load_raw_ssh_private_key(const_span data, crypto_context const&, crypto_call_context const&);
ssh_private_key load_raw_base64_ssh_private_key(std::string_view data, crypto_context const&, crypto_call_context const&);

/// load unencrypted "openssh-key-v1" armored private key
ssh_private_key load_openssh_private_key(std::string_view data, crypto_context const&, crypto_call_context const&);

}

#endif
