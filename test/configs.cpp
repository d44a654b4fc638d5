#include "configs.hpp"

namespace securepath::sshc::test {

void set_test_algorithms(ssh_config& c, kex_type kex, cipher_type cipher, mac_type mac) {
	c.algorithms.kexes = {kex};
	c.algorithms.client_server_ciphers = {cipher};
	c.algorithms.server_client_ciphers = {cipher};
	c.algorithms.client_server_macs = {mac};
	c.algorithms.server_client_macs = {mac};
}

client_config test_client_config() {
	client_config c;
	c.side = transport_side::client;
	c.algorithms.host_keys = {key_type::ssh_ed25519};
	set_test_algorithms(c, kex_type::curve25519_sha256, cipher_type::openssh_aes_256_gcm, mac_type::hmac_sha2_256);
	return c;
}

ssh_config test_server_config() {
	ssh_config c;
	c.side = transport_side::server;
	c.my_version.software = "sshc_test_server";
	set_test_algorithms(c, kex_type::curve25519_sha256, cipher_type::openssh_aes_256_gcm, mac_type::hmac_sha2_256);
	// the test server holds the ed25519 and rsa test keys
	c.algorithms.host_keys = {key_type::ssh_ed25519};
	return c;
}

client_config test_client_aes_ctr_config() {
	auto c = test_client_config();
	set_test_algorithms(c, kex_type::curve25519_sha256, cipher_type::aes_256_ctr, mac_type::hmac_sha2_256);
	return c;
}

ssh_config test_server_aes_ctr_config() {
	auto c = test_server_config();
	set_test_algorithms(c, kex_type::curve25519_sha256, cipher_type::aes_256_ctr, mac_type::hmac_sha2_256);
	return c;
}

client_config test_client_dh_kex_config() {
	auto c = test_client_config();
	c.algorithms.kexes = {kex_type::dh_group16_sha512};
	return c;
}

ssh_config test_server_dh_kex_config() {
	auto c = test_server_config();
	c.algorithms.kexes = {kex_type::dh_group16_sha512};
	return c;
}

}
