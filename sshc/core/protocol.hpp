#ifndef SSHC_CORE_PROTOCOL_HEADER
#define SSHC_CORE_PROTOCOL_HEADER

#include "packet_ser.hpp"
#include "ssh_constants.hpp"
#include "supported_algorithms.hpp"

#include <optional>

namespace securepath::sshc {
namespace ser {

// transport layer messages (RFC 4253), the fields after the message number are listed above each

// reason code, description, language tag
using disconnect = ssh_packet_ser<ssh_disconnect, uint32, string, string>;

// data
using ignore = ssh_packet_ser<ssh_ignore, string>;

// always display, message, language tag
using debug = ssh_packet_ser<ssh_debug, boolean, string, string>;

// sequence number of the rejected packet
using unimplemented = ssh_packet_ser<ssh_unimplemented, uint32>;

// service name ("ssh-userauth" and "ssh-connection" for us)
using service_request = ssh_packet_ser<ssh_service_request, string>;
using service_accept = ssh_packet_ser<ssh_service_accept, string>;

/*
	cookie, then ten name-lists in this order:
		kex, host key,
		cipher c->s, cipher s->c, mac c->s, mac s->c,
		compression c->s, compression s->c,
		language c->s, language s->c
	followed by first_kex_packet_follows and a reserved uint32 (always 0)
*/
using kexinit = ssh_packet_ser
<
	ssh_kexinit,
	bytes<cookie_size>,
	name_list, name_list,
	name_list, name_list, name_list, name_list,
	name_list, name_list,
	name_list, name_list,
	boolean,
	uint32
>;

using newkeys = ssh_packet_ser<ssh_newkeys>;

}

/// Algorithms the peer offered in its kexinit
struct kexinit_offer {
	// only the names we implement, in the peer's order
	supported_algorithms algorithms;
	// the first names in the peer's lists, unknown if we don't implement them (or the list was empty)
	kex_type first_kex{kex_type::unknown};
	key_type first_host_key{key_type::unknown};
	bool first_kex_packet_follows{};
};

/// kexinit payload offering our algorithms, we never offer languages
bool serialise_kexinit(byte_vector& out, const_span cookie, supported_algorithms const&, bool first_kex_packet_follows);

/// parse kexinit payload (starting with the message number), nullopt if the packet is malformed
std::optional<kexinit_offer> parse_kexinit(const_span payload);

}

#endif
