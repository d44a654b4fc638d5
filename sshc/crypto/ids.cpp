#include "ids.hpp"

namespace securepath::sshc {

std::string_view to_string(cipher_type t) {
	using enum cipher_type;
	if(t == openssh_aes_256_gcm) return "aes256-gcm@openssh.com";
	if(t == openssh_aes_128_gcm) return "aes128-gcm@openssh.com";
	if(t == aes_256_ctr) return "aes256-ctr";
	if(t == aes_128_ctr) return "aes128-ctr";
	return "unknown";
}

cipher_type from_string(type_tag<cipher_type>, std::string_view s) {
	using enum cipher_type;
	if(s == "aes256-gcm@openssh.com") return openssh_aes_256_gcm;
	if(s == "aes128-gcm@openssh.com") return openssh_aes_128_gcm;
	if(s == "aes256-ctr") return aes_256_ctr;
	if(s == "aes128-ctr") return aes_128_ctr;
	return unknown;
}

std::size_t cipher_iv_size(cipher_type t) {
	using enum cipher_type;
	if(t == openssh_aes_256_gcm || t == openssh_aes_128_gcm) return 12;
	if(t == aes_256_ctr || t == aes_128_ctr) return 16;
	return 0;
}

std::size_t cipher_key_size(cipher_type t) {
	using enum cipher_type;
	if(t == openssh_aes_256_gcm || t == aes_256_ctr) return 32;
	if(t == openssh_aes_128_gcm || t == aes_128_ctr) return 16;
	return 0;
}

bool is_aead(cipher_type t) {
	return t == cipher_type::openssh_aes_256_gcm || t == cipher_type::openssh_aes_128_gcm;
}

std::string_view to_string(mac_type t) {
	using enum mac_type;
	if(t == implicit) return "implicit";
	if(t == hmac_sha2_256) return "hmac-sha2-256";
	if(t == hmac_sha2_512) return "hmac-sha2-512";
	return "unknown";
}

mac_type from_string(type_tag<mac_type>, std::string_view s) {
	using enum mac_type;
	if(s == "hmac-sha2-256") return hmac_sha2_256;
	if(s == "hmac-sha2-512") return hmac_sha2_512;
	return unknown;
}

std::size_t mac_key_size(mac_type t) {
	using enum mac_type;
	if(t == hmac_sha2_256) return 32;
	if(t == hmac_sha2_512) return 64;
	return 0;
}

std::string_view to_string(compress_type t) {
	using enum compress_type;
	if(t == none) return "none";
	return "unknown";
}

compress_type from_string(type_tag<compress_type>, std::string_view s) {
	using enum compress_type;
	if(s == "none") return none;
	return unknown;
}

std::string_view to_string(key_type t) {
	using enum key_type;
	if(t == ssh_rsa) return "ssh-rsa";
	if(t == rsa_sha2_256) return "rsa-sha2-256";
	if(t == rsa_sha2_512) return "rsa-sha2-512";
	if(t == ssh_ed25519) return "ssh-ed25519";
	return "unknown";
}

key_type from_string(type_tag<key_type>, std::string_view s) {
	using enum key_type;
	if(s == "ssh-rsa") return ssh_rsa;
	if(s == "rsa-sha2-256") return rsa_sha2_256;
	if(s == "rsa-sha2-512") return rsa_sha2_512;
	if(s == "ssh-ed25519") return ssh_ed25519;
	return unknown;
}

std::string_view key_format_name(key_type t) {
	using enum key_type;
	if(t == ssh_rsa || t == rsa_sha2_256 || t == rsa_sha2_512) return "ssh-rsa";
	return to_string(t);
}

bool same_key_format(key_type t1, key_type t2) {
	return t1 != key_type::unknown && key_format_name(t1) == key_format_name(t2);
}

std::string_view to_string(hash_type t) {
	using enum hash_type;
	if(t == sha1) return "sha1";
	if(t == sha2_256) return "sha2-256";
	if(t == sha2_512) return "sha2-512";
	return "unknown";
}

hash_type from_string(type_tag<hash_type>, std::string_view s) {
	using enum hash_type;
	if(s == "sha1") return sha1;
	if(s == "sha2-256") return sha2_256;
	if(s == "sha2-512") return sha2_512;
	return unknown;
}

hash_type signature_hash(key_type t) {
	using enum key_type;
	switch(t) {
		case ssh_rsa: return hash_type::sha1;
		case rsa_sha2_256: return hash_type::sha2_256;
		case rsa_sha2_512: return hash_type::sha2_512;
		// ed25519 hashes internally with sha512
		case ssh_ed25519: return hash_type::sha2_512;
		default: break;
	}
	return hash_type::unknown;
}

std::string_view to_string(key_exchange_type t) {
	using enum key_exchange_type;
	if(t == X25519) return "X25519";
	if(t == dh_group14) return "dh-group14";
	if(t == dh_group16) return "dh-group16";
	return "unknown";
}

key_exchange_type from_string(type_tag<key_exchange_type>, std::string_view s) {
	using enum key_exchange_type;
	if(s == "X25519") return X25519;
	if(s == "dh-group14") return dh_group14;
	if(s == "dh-group16") return dh_group16;
	return unknown;
}

}
