#ifndef SSHC_CORE_SSH_CONFIG_HEADER
#define SSHC_CORE_SSH_CONFIG_HEADER

#include "ssh_constants.hpp"
#include "supported_algorithms.hpp"

#include <chrono>

namespace securepath::sshc {

using namespace std::literals;

/** \brief SSH Version 2 Configuration
 */
struct ssh_config {
	transport_side side{transport_side::client};

	// software name and version
	ssh_version my_version{.ssh="2.0", .software="sshc_0.1"};

	// supported algorithms
	supported_algorithms algorithms{all_supported_algorithms()};

	// re-key interval in bytes per direction (== 0 means no rekeying on data)
	std::uint64_t rekey_data_interval{1024ULL*1024*1024};

	// re-key interval in time (zero duration means no rekeying on time)
	std::chrono::steady_clock::duration rekey_time_interval{1h};

	// maximum payload bytes buffered while re-keying, after this upper layer sends would block
	std::uint32_t max_rekey_queue_size{256*1024};

	// add random size of padding for each packet
	bool random_packet_padding{true};

	// maximum output buffer size (should be at least max_out_packet_size)
	std::uint32_t max_out_buffer_size{256*1024};

	// size to shrink the output buffer after handling output packet
	std::uint32_t shrink_out_buffer_size{std::uint32_t(-1)};

	// maximum size of incoming packet without mac, 64 KiB payload with maximum padding
	std::uint32_t max_in_packet_size{64*1024 + packet_header_size + maximum_padding_size};

	// maximum size of outgoing packet without mac
	std::uint32_t max_out_packet_size{64*1024 + packet_header_size + maximum_padding_size};

	// send initial guess of kex before receiving remote side kex-init packet
	bool guess_kex_packet{false};

	struct {
		// default maximum channel packet size
		std::uint32_t max_packet_size{32*1024};
		// default initial window size for channel
		std::uint32_t initial_window_size{2*1024*1024};
	} channel;

public:
	// simple check that we have at least one kexes, cipher and so on (does not check if the algorithms are compatible)
	bool valid() const;
};

}

#endif
