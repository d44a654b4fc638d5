#include "crypto_context.hpp"

namespace securepath::sshc::nettle {

std::unique_ptr<sshc::random> create_random();
std::unique_ptr<sshc::cipher> create_cipher(cipher_type, cipher_dir, const_span secret, const_span iv, crypto_call_context const&);
std::unique_ptr<sshc::mac> create_mac(mac_type, const_span secret, crypto_call_context const&);
std::shared_ptr<sshc::public_key> create_public_key(public_key_data const&, crypto_call_context const&);
std::shared_ptr<sshc::private_key> create_private_key(private_key_data const&, crypto_call_context const&);
std::unique_ptr<sshc::key_exchange> create_key_exchange(key_exchange_type, crypto_call_context const&);
std::unique_ptr<sshc::hash> create_hash(hash_type, crypto_call_context const&);

crypto_context create_nettle_context() {
	return crypto_context{
			create_random,
			create_cipher,
			create_mac,
			create_public_key,
			create_private_key,
			create_key_exchange,
			create_hash
		};
}

}
