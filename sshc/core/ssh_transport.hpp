#ifndef SSHC_CORE_SSH_TRANSPORT_HEADER
#define SSHC_CORE_SSH_TRANSPORT_HEADER

#include "kex.hpp"
#include "packet_types.hpp"
#include "protocol.hpp"
#include "ssh_config.hpp"
#include "ssh_binary_packet.hpp"
#include "ssh_state.hpp"

#include "sshc/common/logger.hpp"
#include "sshc/crypto/crypto_context.hpp"

#include <chrono>
#include <deque>
#include <iosfwd>

namespace securepath::sshc {

class in_buffer;
class out_buffer;

enum class transport_op {
	want_read_more,
	want_write_more,
	pending_action, // we are waiting for some action that is async (e.g. asking user about host key)
	disconnected
};

std::string_view to_string(transport_op);

/// reason the remote side gave in its disconnect packet
struct disconnect_info {
	std::uint32_t code{};
	std::string description;
};

/// algorithms picked from the local and the remote kexinit
struct kexinit_result {
	// in and out are from our point of view, not set if nothing common was found
	std::optional<crypto_configuration> conf;
	// the remote's guessed kex packet (if any) is usable
	bool guess_correct{};
	std::string_view failed_category;
};

/** \brief SSH Version 2 transport layer
 *
 *  Sans-IO: process() consumes the in_buffer and writes to the out_buffer given at construction.
 */
class ssh_transport : public transport_base, private ssh_binary_packet {
public:
	ssh_transport(ssh_config const&, logger&, out_buffer&, crypto_context);
	~ssh_transport();

	/// This is the main driving function, reads from in_buffer and writes to out_buffer
	transport_op process(in_buffer&);

	void disconnect(std::uint32_t = ssh_disconnect_by_application, std::string_view message = {}, std::string_view lang = {});

	ssh_state state() const;
	void set_state(ssh_state, std::optional<ssh_error_code> = std::nullopt);

	out_buffer& output_buffer() { return output_; }

	void send_ignore(std::size_t size);

	/// start key re-exchange, only possible after the first kex is done and no kex is running
	bool request_rekey();

	/// key exchange after the first one is in progress
	bool rekeying() const;

	/// the peer identification, valid after version exchange
	ssh_version const& remote_version() const { return kex_data_.remote_ver; }

	/// lines the server sent before its identification line
	std::vector<std::string> const& remote_pre_version_lines() const { return pre_version_lines_; }

	/// algorithms of the last completed (or currently agreed) key exchange
	std::optional<crypto_configuration> const& negotiated_configuration() const { return negotiated_; }

	/// server host key blob of the last completed key exchange
	byte_vector const& server_host_key_blob() const { return host_key_blob_; }

	std::optional<disconnect_info> const& remote_disconnect() const { return remote_disconnect_; }

	std::uint32_t in_sequence() const { return ssh_binary_packet::in_sequence(); }
	std::uint32_t out_sequence() const { return ssh_binary_packet::out_sequence(); }

	/// payload bytes waiting for the re-key to finish
	std::size_t rekey_queue_size() const { return rekey_queue_bytes_; }

	/// number of completed key exchanges
	std::size_t kex_count() const { return kex_count_; }

	/// framed packets not yet moved to the output buffer
	bool output_pending() const { return has_pending_output(); }

	crypto_context const& crypto() const final { return crypto_; }
	crypto_call_context call_context() const final { return crypto_call_context{logger_, *rand_}; }

	const_span session_id() const override;

	void set_error_and_disconnect(ssh_error_code, std::string_view message = {}) override;
	ssh_config const& config() const final { return config_; }
	ssh_error_code error() const final { return ssh_binary_packet::error(); }
	std::string error_message() const final { return ssh_binary_packet::error_message(); }
	void set_error(ssh_error_code code, std::string_view message = {}) override;

	bool send_would_block() const override;

protected:
	virtual void on_version_exchange(ssh_version const&);
	virtual bool handle_basic_packets(ssh_packet_type, const_span payload);
	virtual handler_result handle_kex_done(kex const&);
	virtual handler_result handle_transport_packet(ssh_packet_type, const_span payload) = 0;
	virtual void on_state_change(ssh_state, ssh_state) {}
	/// give upper layers chance to send buffered data, returns true if there is still more to send
	virtual bool flush() { return false; }

	/// we offer the client list, the remote offer is the server list
	virtual kexinit_result agree_algorithms(kexinit_offer const& remote);
	/// exchange for the agreed kex, the default runs the client side
	virtual std::unique_ptr<kex> create_kex(kex_type, kex_context);

	std::optional<out_packet_record> alloc_out_packet(std::size_t data_size) override;
	bool write_alloced_out_packet(out_packet_record const&) override;
	std::uint32_t max_in_packet_size() const override;
	std::uint32_t max_out_packet_size() const override;

protected:
	using ssh_binary_packet::config_;
	using ssh_binary_packet::logger_;

private: // init & generic packet handling
	void handle_version_exchange(in_buffer& in);
	handler_result handle_binary_packet(in_buffer& in);
	handler_result handle_kex_packet(ssh_packet_type type, const_span payload);
	handler_result handle_raw_kex_packet(ssh_packet_type type, const_span payload);
	void handle_kexinit_packet(const_span payload);
	void handle_remote_newkeys();
	void kex_set_done();

	void start_kex();
	bool do_rekeying();
	bool send_kex_init(bool send_first_packet);
	void send_kex_guess();

	bool queue_output() const;
	bool send_payload_now(const_span payload);
	bool flush_rekey_queue();

private: // input
	handler_result process_transport_payload(span payload);
	handler_result do_handle_transport_packet(ssh_packet_type type, const_span payload);

private: // data
	crypto_context crypto_;
	out_buffer& output_;

	ssh_state state_{ssh_state::none};

	bool remote_version_received_{};
	std::vector<std::string> pre_version_lines_;

	std::unique_ptr<random> rand_;

	// kex data
	bool kexinit_received_{};
	bool kexinit_sent_{};
	byte_vector kex_cookie_;

	kex_init_data kex_data_;
	bool ignore_next_kex_packet_{};
	bool local_kex_done_{};
	bool remote_kex_done_{};
	std::unique_ptr<kex> kex_;
	std::size_t kex_count_{};

	std::optional<crypto_configuration> negotiated_;
	byte_vector host_key_blob_;

	std::chrono::steady_clock::time_point rekey_time_{};

	// upper layer payloads while re-keying
	byte_vector staging_;
	std::deque<byte_vector> rekey_queue_;
	std::size_t rekey_queue_bytes_{};

	std::optional<disconnect_info> remote_disconnect_;

	bool flush_service_{};
};

}

#endif
