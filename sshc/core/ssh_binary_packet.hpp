#ifndef SSHC_CORE_SSH_BINARY_PACKET_HEADER
#define SSHC_CORE_SSH_BINARY_PACKET_HEADER

#include "errors.hpp"
#include "packet_types.hpp"
#include "ssh_config.hpp"
#include "ssh_constants.hpp"
#include "transport_base.hpp"
#include "sshc/common/buffers.hpp"
#include "sshc/common/logger.hpp"
#include "sshc/crypto/cipher.hpp"
#include "sshc/crypto/mac.hpp"
#include "sshc/crypto/random.hpp"

#include <memory>
#include <optional>

namespace securepath::sshc {

/// Crypto state and counters of one direction
struct stream_crypto {
	/// sequence number of packet, incremented after every binary packet and never reset (wraps at 2^32)
	std::uint32_t packet_sequence{};
	std::uint32_t block_size{minimum_block_size};

	std::unique_ptr<sshc::cipher> cipher;
	// this is only used if !cipher->is_aead()
	std::unique_ptr<sshc::mac> mac;

	// mac->size() or aead_cipher->tag_size() once encrypting, otherwise 0
	std::uint32_t integrity_size{};

	// bytes transferred with the current keys
	std::uint64_t transferred_bytes{};
};

enum class in_packet_status {
	waiting_header, // not enough data for the first block
	waiting_data,   // packet length is known
	data_ready      // whole packet is decrypted and verified
};

struct in_packet_info {
	in_packet_status status{in_packet_status::waiting_header};
	std::size_t packet_size{}; // size of the whole packet including mac, known after the header
	std::size_t data_size{};   // size of the payload
	span payload{};            // decrypted payload to be handled
	std::uint32_t sequence{};  // sequence number of the packet

	void clear() {
		*this = in_packet_info{};
	}
};

struct stream_in_crypto : public stream_crypto {
	in_packet_info current_packet;
	// buffer for calculating tag, always integrity_size
	byte_vector tag_buffer;
};

struct stream_out_crypto : public stream_crypto {
	// encrypted packets that did not fit to the output buffer
	byte_vector buffer;
	// the unsent portion of buffer, always from the start of the buffer
	span data;
};

enum class decode_result {
	packet,          // payload of the current packet is available
	need_more_data,
	frame_error      // fatal, the stream cannot be resynchronised
};

std::string_view to_string(decode_result);

/** \brief SSH binary packet protocol framing (RFC 4253 section 6)
 *
 *  Encrypts/decrypts packets for both directions, the keys of each direction are
 *  replaced independently when new keys are taken into use.
 */
class ssh_binary_packet {
public:
	ssh_binary_packet(ssh_config const& config, logger& logger);

	ssh_error_code error() const;
	std::string error_message() const;

	void set_error(ssh_error_code code, std::string_view message = {});

	ssh_config const& config() const;

	std::uint32_t in_sequence() const { return stream_in_.packet_sequence; }
	std::uint32_t out_sequence() const { return stream_out_.packet_sequence; }

	/// true if there is encrypted output that was not yet written to the out_buffer
	bool has_pending_output() const { return !stream_out_.data.empty(); }
public: //input
	void set_random(random&);
	void set_input_crypto(std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac);
	void set_output_crypto(std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac);

	/** \brief Try to decode next packet from the data
	 *
	 *  Decrypts in place. On packet the payload is in current_packet() until packet_handled
	 *  is called. Partially decoded input must stay in the buffer between calls.
	 */
	decode_result decode(span in_data);

	in_packet_info const& current_packet() const { return stream_in_.current_packet; }

	/// consumes the current packet from input
	void packet_handled(in_buffer&);

public: //output
	std::optional<out_packet_record> alloc_out_packet(std::size_t data_size, out_buffer&);
	bool create_out_packet(out_packet_record const&, out_buffer&);

	/// try to send pending data out from the buffers, returns true if nothing is left
	bool send_pending(out_buffer&);

protected: //input
	decode_result try_decode_header(span in_data);
	span decrypt_packet(span data);
	span decrypt_aead(aead_cipher& cip, span data);
	span decrypt_with_mac(span data);
	span check_padding(span packet);

protected: //output
	std::size_t minimum_padding(std::size_t header_payload_size) const;
	void aead_encrypt(aead_cipher& cip, const_span data, span out);
	void encrypt_with_mac(const_span data, span out);
	void encrypt_packet(const_span data, span out);

private:
	void set_crypto(stream_crypto&, std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac);
	bool resize_out_buffer(std::size_t);
	void shrink_out_buffer();

protected:
	ssh_config const& config_;
	logger& logger_;
	random* random_{};

	ssh_error_code error_{};
	std::string error_msg_;

	stream_in_crypto  stream_in_;
	stream_out_crypto stream_out_;
};

}

#endif
