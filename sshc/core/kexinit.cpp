#include "kexinit.hpp"
#include "supported_algorithms.hpp"
#include "sshc/common/logger.hpp"

#include <algorithm>
#include <ostream>

namespace securepath::sshc {

std::string_view to_string(kex_type t) {
	using enum kex_type;
	if(t == curve25519_sha256) return "curve25519-sha256";
	if(t == libssh_curve25519_sha256) return "curve25519-sha256@libssh.org";
	if(t == dh_group14_sha256) return "diffie-hellman-group14-sha256";
	if(t == dh_group16_sha512) return "diffie-hellman-group16-sha512";
	return "unknown";
}

kex_type from_string(type_tag<kex_type>, std::string_view s) {
	using enum kex_type;
	if(s == "curve25519-sha256") return curve25519_sha256;
	if(s == "curve25519-sha256@libssh.org") return libssh_curve25519_sha256;
	if(s == "diffie-hellman-group14-sha256") return dh_group14_sha256;
	if(s == "diffie-hellman-group16-sha512") return dh_group16_sha512;
	return unknown;
}

std::ostream& operator<<(std::ostream& out, crypto_configuration const& c) {
	return out << "kex=" << to_string(c.kex) << " host_key=" << to_string(c.host_key)
		<< " in={cipher=" << to_string(c.in.cipher) << " mac=" << to_string(c.in.mac) << " compress=" << to_string(c.in.compress)
		<< "} out={cipher=" << to_string(c.out.cipher) << " mac=" << to_string(c.out.mac) << " compress=" << to_string(c.out.compress)
		<< "}";
}

bool crypto_configuration::valid() const {
	return kex != kex_type::unknown && host_key != key_type::unknown &&
		in.cipher != cipher_type::unknown && in.mac != mac_type::unknown && in.compress != compress_type::unknown &&
		out.cipher != cipher_type::unknown && out.mac != mac_type::unknown && out.compress != compress_type::unknown;
}

std::optional<std::string_view> negotiate(std::vector<std::string_view> const& initiator, std::vector<std::string_view> const& responder) {
	for(auto&& v : initiator) {
		if(std::find(responder.begin(), responder.end(), v) != responder.end()) {
			return v;
		}
	}
	return std::nullopt;
}

// all our kex methods need host key that can sign the exchange hash
static bool is_compatible(kex_type kex, key_type key) {
	return kex != kex_type::unknown
		&& key != key_type::unknown
		&& (key_capabilities[std::size_t(key)] & signature_capable);
}

static bool is_supported_kex(kex_type client_kex, supported_algorithms const& client, supported_algorithms const& server, key_type& ktype) {
	if(server.kexes.supports(client_kex)) {
		for(auto&& client_hkey : client.host_keys) {
			if(is_compatible(client_kex, client_hkey) && server.host_keys.supports(client_hkey)) {
				ktype = client_hkey;
				return true;
			}
		}
	}
	return false;
}

template<typename IdType>
static bool find_suitable(algo_list<IdType> const& client, algo_list<IdType> const& server, IdType& res) {
	auto it = std::find_if(client.begin(), client.end(), [&](auto&& v) { return server.supports(v); });
	if(it != client.end()) {
		res = *it;
		return true;
	}
	return false;
}

kexinit_agreement::kexinit_agreement(logger& logger, supported_algorithms const& client)
: logger_(logger)
, client_(client)
{}

bool kexinit_agreement::fail(std::string_view category) {
	failed_category_ = category;
	logger_.log(logger::debug, "SSH failed to find common {} algorithm", category);
	return false;
}

bool kexinit_agreement::agree(supported_algorithms const& server) {
	// the client is always the initiator of the selection
	supported_algorithms const& client = client_;

	crypto_configuration res;

	for(auto&& ckex : client.kexes) {
		if(is_supported_kex(ckex, client, server, res.host_key)) {
			res.kex = ckex;
			break;
		}
	}

	if(res.kex == kex_type::unknown) {
		return fail("kex/host_key");
	}

	if(!find_suitable(client.client_server_ciphers, server.client_server_ciphers, res.out.cipher)) {
		return fail("client->server cipher");
	}
	if(!find_suitable(client.server_client_ciphers, server.server_client_ciphers, res.in.cipher)) {
		return fail("server->client cipher");
	}

	// mac is not negotiated for authenticated encryption
	if(is_aead(res.out.cipher)) {
		res.out.mac = mac_type::implicit;
	} else if(!find_suitable(client.client_server_macs, server.client_server_macs, res.out.mac)) {
		return fail("client->server mac");
	}
	if(is_aead(res.in.cipher)) {
		res.in.mac = mac_type::implicit;
	} else if(!find_suitable(client.server_client_macs, server.server_client_macs, res.in.mac)) {
		return fail("server->client mac");
	}

	if(!find_suitable(client.client_server_compress, server.client_server_compress, res.out.compress)) {
		return fail("client->server compression");
	}
	if(!find_suitable(client.server_client_compress, server.server_client_compress, res.in.compress)) {
		return fail("server->client compression");
	}

	guess_was_correct_ = !client.kexes.empty() && !server.kexes.empty()
		&& client.kexes.preferred() == res.kex && server.kexes.preferred() == res.kex
		&& !client.host_keys.empty() && !server.host_keys.empty()
		&& client.host_keys.preferred() == res.host_key && server.host_keys.preferred() == res.host_key;

	agreed_ = res;
	return true;
}

bool kexinit_agreement::was_guess_correct() const {
	return guess_was_correct_;
}

crypto_configuration kexinit_agreement::agreed_configuration() const {
	SSHC_ASSERT(agreed_, "invalid state");
	return *agreed_;
}

}
