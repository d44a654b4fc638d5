#include "ssh_config.hpp"

namespace securepath::sshc {

bool ssh_config::valid() const {
	return algorithms.valid()
		&& max_in_packet_size > packet_header_size + maximum_padding_size
		&& max_out_packet_size > packet_header_size + maximum_padding_size
		&& max_out_buffer_size >= max_out_packet_size;
}

}
