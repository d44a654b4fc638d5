#ifndef SSHC_CRYPTO_IDS_HEADER
#define SSHC_CRYPTO_IDS_HEADER

#include "sshc/common/algo_list.hpp"
#include <string_view>

namespace securepath::sshc {

enum class cipher_type {
	unknown = 0,
	openssh_aes_256_gcm,
	openssh_aes_128_gcm,
	aes_256_ctr,
	aes_128_ctr
};

std::string_view to_string(cipher_type);
cipher_type from_string(type_tag<cipher_type>, std::string_view);

enum class cipher_dir {
	encrypt,
	decrypt
};

std::size_t cipher_iv_size(cipher_type);
std::size_t cipher_key_size(cipher_type);
// authenticated encryption, no separate mac is negotiated for these
bool is_aead(cipher_type);

enum class mac_type {
	unknown = 0,
	implicit,         // place holder for aead ciphers, never added to the supported macs
	hmac_sha2_256,
	hmac_sha2_512
};

std::string_view to_string(mac_type);
mac_type from_string(type_tag<mac_type>, std::string_view);

std::size_t mac_key_size(mac_type);

// no compression supported
enum class compress_type {
	unknown = 0,
	none
};

std::string_view to_string(compress_type);
compress_type from_string(type_tag<compress_type>, std::string_view);

/** \brief Public key algorithms
 *
 *  The rsa variants share the same "ssh-rsa" key format and differ by the signature hash
 */
enum class key_type {
	unknown = 0,
	ssh_rsa,
	rsa_sha2_256,
	rsa_sha2_512,
	ssh_ed25519,
	end_of_list
};

enum key_capability {
	no_capability = 0,
	encryption_capable = 1,
	signature_capable = 2,
	both_capable = encryption_capable | signature_capable
};

key_capability constexpr key_capabilities[] {
	no_capability,
	both_capable,
	both_capable,
	both_capable,
	signature_capable
};

static_assert(sizeof(key_capabilities)/sizeof(key_capability) == std::size_t(key_type::end_of_list));

std::size_t const ed25519_key_size = 32;

std::string_view to_string(key_type);
key_type from_string(type_tag<key_type>, std::string_view);

/// name used in the serialised key blob, "ssh-rsa" for all rsa variants
std::string_view key_format_name(key_type);

/// true if both algorithms use same key format
bool same_key_format(key_type, key_type);

enum class hash_type {
	unknown = 0,
	sha1,
	sha2_256,
	sha2_512
};

std::string_view to_string(hash_type);
hash_type from_string(type_tag<hash_type>, std::string_view);

/// hash used by the signature algorithm
hash_type signature_hash(key_type);

enum class key_exchange_type {
	unknown = 0,
	X25519,
	dh_group14,
	dh_group16
};

std::string_view to_string(key_exchange_type);
key_exchange_type from_string(type_tag<key_exchange_type>, std::string_view);

}

#endif
