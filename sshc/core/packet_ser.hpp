#ifndef SSHC_CORE_PACKET_SER_HEADER
#define SSHC_CORE_PACKET_SER_HEADER

#include "packet_types.hpp"

#include <string_view>
#include <vector>

namespace securepath::sshc::ser {

// field type tags for packet serialisation (rfc4251 section 5)
struct boolean;
struct byte;
struct uint32;
struct uint64;
struct mpint;
struct string;
struct name_list;
using name_list_t = std::vector<std::string_view>;

template<std::size_t size>
struct bytes;

/// Packet definition: message number followed by the fields
template<std::uint8_t PacketType, typename... TypeTags>
struct ssh_packet_ser;

/// Serialise packet into the byte vector, the vector is resized to the exact packet size
template<typename Packet, typename... Args>
bool serialise_to_vector(std::vector<std::byte>& out, Args&&... args) {
	typename Packet::save packet(std::forward<Args>(args)...);
	out.resize(packet.size());
	bool ret = packet.write(out);
	if(ret) {
		out.resize(packet.serialised_size());
	}
	return ret;
}

}

#endif
