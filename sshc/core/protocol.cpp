#include "protocol.hpp"
#include "packet_ser_impl.hpp"

namespace securepath::sshc {

bool serialise_kexinit(byte_vector& out, const_span cookie, supported_algorithms const& algs, bool first_kex_packet_follows) {
	if(cookie.size() != cookie_size) {
		return false;
	}
	return ser::serialise_to_vector<ser::kexinit>(out,
		std::span<std::byte const, cookie_size>(cookie.data(), cookie_size),
		algs.kexes.name_list(),
		algs.host_keys.name_list(),
		algs.client_server_ciphers.name_list(),
		algs.server_client_ciphers.name_list(),
		algs.client_server_macs.name_list(),
		algs.server_client_macs.name_list(),
		algs.client_server_compress.name_list(),
		algs.server_client_compress.name_list(),
		ser::name_list_t(),
		ser::name_list_t(),
		first_kex_packet_follows,
		std::uint32_t(0));
}

template<typename Type>
static Type first_of(ser::name_list_t const& list) {
	return list.empty() ? Type{} : from_string(type_tag<Type>{}, list.front());
}

std::optional<kexinit_offer> parse_kexinit(const_span payload) {
	ser::kexinit::load packet(ser::match_type_t, payload);
	if(!packet) {
		return std::nullopt;
	}

	auto& [
		cookie,
		kexes,
		host_keys,
		cs_ciphers,
		sc_ciphers,
		cs_macs,
		sc_macs,
		cs_compress,
		sc_compress,
		cs_languages,
		sc_languages,
		first_packet_follows,
		reserved
			] = packet;

	kexinit_offer offer;
	offer.algorithms = supported_algorithms{
		algo_list_from_string_list<kex_type>(kexes),
		algo_list_from_string_list<key_type>(host_keys),
		algo_list_from_string_list<cipher_type>(cs_ciphers),
		algo_list_from_string_list<cipher_type>(sc_ciphers),
		algo_list_from_string_list<mac_type>(cs_macs),
		algo_list_from_string_list<mac_type>(sc_macs),
		algo_list_from_string_list<compress_type>(cs_compress),
		algo_list_from_string_list<compress_type>(sc_compress)};
	offer.first_kex = first_of<kex_type>(kexes);
	offer.first_host_key = first_of<key_type>(host_keys);
	offer.first_kex_packet_follows = first_packet_follows;
	return offer;
}

}
