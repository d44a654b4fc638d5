#include "supported_algorithms.hpp"
#include "protocol_helpers.hpp"

#include "sshc/common/logger.hpp"

namespace securepath::sshc {

std::string_view to_string(method_type t) {
	using enum method_type;
	switch(t) {
		case kex: return "kex";
		case host_key: return "host_key";
		case crypt_cs: return "crypt_cs";
		case crypt_sc: return "crypt_sc";
		case mac_cs: return "mac_cs";
		case mac_sc: return "mac_sc";
		case comp_cs: return "comp_cs";
		case comp_sc: return "comp_sc";
	}
	return "unknown";
}

bool supported_algorithms::valid() const {
	return !host_keys.empty()
		&& !kexes.empty()
		&& !client_server_ciphers.empty()
		&& !server_client_ciphers.empty()
		&& !client_server_macs.empty()
		&& !server_client_macs.empty()
		&& !client_server_compress.empty()
		&& !server_client_compress.empty();
}

void supported_algorithms::dump(std::string_view tag, logger& l) const {
	l.log(logger::debug_verbose, "{}: supported_algorithms:\n"
		"\thost_keys={}\n"
		"\tkexes={}\n"
		"\tclient_server_ciphers={}\n"
		"\tserver_client_ciphers={}\n"
		"\tclient_server_macs={}\n"
		"\tserver_client_macs={}\n"
		"\tclient_server_compress={}\n"
		"\tserver_client_compress={}",
		tag,
		host_keys.name_list_string(), kexes.name_list_string(), client_server_ciphers.name_list_string(),
		server_client_ciphers.name_list_string(), client_server_macs.name_list_string(), server_client_macs.name_list_string(),
		client_server_compress.name_list_string(), server_client_compress.name_list_string());
}

template<typename Type>
static bool set_list(algo_list<Type>& list, std::string_view names) {
	std::vector<std::string_view> name_vec;
	if(!parse_string_list(names, name_vec)) {
		return false;
	}
	auto res = algo_list_from_string_list<Type>(name_vec);
	if(res.empty()) {
		return false;
	}
	list = std::move(res);
	return true;
}

bool supported_algorithms::set_preference(method_type t, std::string_view names) {
	using enum method_type;
	switch(t) {
		case kex: return set_list(kexes, names);
		case host_key: return set_list(host_keys, names);
		case crypt_cs: return set_list(client_server_ciphers, names);
		case crypt_sc: return set_list(server_client_ciphers, names);
		case mac_cs: return set_list(client_server_macs, names);
		case mac_sc: return set_list(server_client_macs, names);
		case comp_cs: return set_list(client_server_compress, names);
		case comp_sc: return set_list(server_client_compress, names);
	}
	return false;
}

std::string supported_algorithms::preference(method_type t) const {
	using enum method_type;
	switch(t) {
		case kex: return kexes.name_list_string();
		case host_key: return host_keys.name_list_string();
		case crypt_cs: return client_server_ciphers.name_list_string();
		case crypt_sc: return server_client_ciphers.name_list_string();
		case mac_cs: return client_server_macs.name_list_string();
		case mac_sc: return server_client_macs.name_list_string();
		case comp_cs: return client_server_compress.name_list_string();
		case comp_sc: return server_client_compress.name_list_string();
	}
	return {};
}

supported_algorithms all_supported_algorithms() {
	cipher_list ciphers{cipher_type::openssh_aes_256_gcm, cipher_type::openssh_aes_128_gcm, cipher_type::aes_256_ctr, cipher_type::aes_128_ctr};
	mac_list macs{mac_type::hmac_sha2_256, mac_type::hmac_sha2_512};

	supported_algorithms res;
	res.kexes = kex_list{kex_type::curve25519_sha256, kex_type::libssh_curve25519_sha256, kex_type::dh_group16_sha512, kex_type::dh_group14_sha256};
	res.host_keys = key_list{key_type::ssh_ed25519, key_type::rsa_sha2_512, key_type::rsa_sha2_256, key_type::ssh_rsa};
	res.client_server_ciphers = ciphers;
	res.server_client_ciphers = ciphers;
	res.client_server_macs = macs;
	res.server_client_macs = macs;
	return res;
}

std::vector<std::string_view> supported_algorithm_names(method_type t) {
	auto all = all_supported_algorithms();
	using enum method_type;
	switch(t) {
		case kex: return all.kexes.name_list();
		case host_key: return all.host_keys.name_list();
		case crypt_cs: return all.client_server_ciphers.name_list();
		case crypt_sc: return all.server_client_ciphers.name_list();
		case mac_cs: return all.client_server_macs.name_list();
		case mac_sc: return all.server_client_macs.name_list();
		case comp_cs: return all.client_server_compress.name_list();
		case comp_sc: return all.server_client_compress.name_list();
	}
	return {};
}

}
