#ifndef SSHC_CORE_CONNECTION_CHANNEL_HEADER
#define SSHC_CORE_CONNECTION_CHANNEL_HEADER

#include "conn_protocol.hpp"

#include "sshc/common/logger.hpp"
#include "sshc/common/types.hpp"
#include "sshc/core/ssh_binary_util.hpp"
#include "sshc/core/transport_base.hpp"

#include <deque>
#include <map>
#include <optional>
#include <set>

namespace securepath::sshc {

using channel_id = std::uint32_t;
using send_id = std::uint64_t;
using request_id = std::uint64_t;

// this is either the local or remote side of the channel
struct channel_side_info {
	channel_id id{};
	std::uint32_t window_size{};
	std::uint32_t max_packet_size{};
};

enum class channel_state {
	init,
	open_pending,  //we have sent open and waiting for open confirmation or failure
	established,   //we have established a connection, data flows
	close_pending, //waiting to close the connection (flushing data or waiting for the remote close)
	closed
};
std::string_view to_string(channel_state);

struct open_failure_info {
	std::uint32_t code{};
	std::string description;
};

struct pty_settings {
	std::string term{"vt100"};
	std::uint32_t columns{80};
	std::uint32_t rows{24};
	std::uint32_t width_px{};
	std::uint32_t height_px{};
	// encoded terminal modes (RFC 4254 section 8)
	std::string modes;
};

struct exit_signal_info {
	std::string name;
	bool core_dumped{};
	std::string message;
};

enum class request_status {
	unknown,
	pending,
	succeeded,
	failed
};
std::string_view to_string(request_status);

/** \brief One logical channel of the connection protocol
 *
 *  Outbound data goes through a queue of pending sends, each send is fragmented to
 *  min(remote window, remote max packet size) and the rest waits for window adjust.
 *  Inbound data is accepted only within the local window. The local window is restored
 *  with window adjust once the consumed but not yet acknowledged bytes reach half of the
 *  initial window. By default data is consumed when it arrives, derived classes that
 *  buffer data call consumed() when the data is taken by the application.
 */
class channel {
public:
	channel(transport_base& transport, channel_side_info local);
	virtual ~channel();

	channel_id id() const { return local_info_.id; }
	channel_state state() const { return state_; }
	std::string const& type() const { return type_; }

	channel_side_info const& local_info() const { return local_info_; }
	channel_side_info const& remote_info() const { return remote_info_; }

	/// how much we can still send before the remote adjusts the window
	std::uint32_t out_window() const { return out_window_; }
	/// how much the remote can still send to us
	std::uint32_t in_window() const { return in_window_; }
	/// maximum data size in one packet we send
	std::uint32_t max_out_size() const { return max_out_size_; }

	std::optional<open_failure_info> const& open_failure() const { return open_failure_; }

	bool eof_sent() const { return sent_eof_; }
	bool eof_received() const { return received_eof_; }
	bool close_sent() const { return sent_close_; }
	bool close_received() const { return received_close_; }

	std::optional<std::uint32_t> const& exit_status() const { return exit_status_; }
	std::optional<exit_signal_info> const& exit_signal() const { return exit_signal_; }

public: //out
	/// send the channel open packet with type specific data
	bool send_open(std::string_view type, const_span extra_data = {});

	/// queue data (data_type 0) or extended data and send as much as the window allows
	std::optional<send_id> send_data(const_span, std::uint32_t data_type = 0);

	/// drop the unsent part of the queued send, returns false if it was already sent
	bool cancel_send(send_id);

	/// the queued send has been fully written to the transport (or cancelled)
	bool send_done(send_id) const;

	/// the queued send was dropped unsent because the channel closed, reported only once per send
	bool send_dropped(send_id);

	/// bytes in the pending send queue
	std::size_t pending_bytes() const;

	/// send eof after the pending data, after this nothing is sent but data can still be received
	bool send_eof();

	/// send close after the pending data and initiate closing of the channel
	bool send_close();

	/// grow the remote's sending window by n bytes
	bool adjust_window(std::uint32_t n);

	/// application consumed n bytes of received data, sends window adjust by the policy
	void consumed(std::uint32_t n);

	/// send channel request with request specific data already serialised
	std::optional<request_id> send_request(std::string_view name, bool want_reply, const_span data = {});

	template<typename... Args>
	std::optional<request_id> send_request_fields(std::string_view name, bool want_reply, Args const&... args);

	std::optional<request_id> request_pty(pty_settings const&);
	std::optional<request_id> request_env(std::string_view name, std::string_view value);
	std::optional<request_id> request_exec(std::string_view command);
	std::optional<request_id> request_shell();
	std::optional<request_id> request_subsystem(std::string_view subsystem);
	// window-change and signal are sent without want-reply
	std::optional<request_id> request_window_change(std::uint32_t columns, std::uint32_t rows, std::uint32_t width_px = 0, std::uint32_t height_px = 0);
	std::optional<request_id> request_signal(std::string_view signal);

	/// succeeded or failed is reported once, after that the request is forgotten and reads as unknown
	request_status request_result(request_id);

	/// try to flush out pending sends, return true if more still left to be flushed
	bool flush();

protected: // called by ssh_connection
	friend class ssh_connection;

	bool on_confirm(channel_side_info remote, const_span extra_data);
	void on_open_failure(std::uint32_t code, std::string_view message);
	// returns false if the remote violated the window or the packet size
	bool on_data(std::uint32_t data_type, const_span);
	void on_window_adjust(std::uint32_t bytes);
	void on_eof();
	// returns false if the channel was not confirmed yet
	bool on_close();
	void on_request(std::string_view name, bool reply, const_span extra_data);
	void on_request_reply(bool success);

protected:
	/// data arrived within the window, data_type 0 is the primary data
	virtual void on_data_received(std::uint32_t data_type, const_span);
	virtual void on_state_change() {}

	void set_state(channel_state);

private:
	struct pending_send {
		send_id id{};
		std::uint32_t data_type{};
		byte_vector data;
		std::size_t sent{};
	};

	bool send_data_packet(pending_send&);
	bool do_flush();
	bool send_close_packet();
	void drop_pending();
	std::optional<request_id> add_request(bool want_reply);

protected:
	transport_base& transport_;
	logger& log_;

	std::string type_;
	channel_side_info local_info_;
	channel_side_info remote_info_;
	channel_state state_{channel_state::init};

	std::optional<open_failure_info> open_failure_;

	bool eof_requested_{};
	bool close_requested_{};
	// close was asked by the application, not as reply to the remote close
	bool local_close_{};
	bool sent_eof_{};
	bool received_eof_{};
	bool sent_close_{};
	bool received_close_{};

	std::uint32_t max_out_size_{};

	// how much we have window left for sending
	std::uint32_t out_window_{};
	// how much the remote can send before we adjust
	std::uint32_t in_window_{};
	// consumed but not acknowledged with window adjust
	std::uint32_t unacked_{};

	std::deque<pending_send> pending_;
	send_id next_send_id_{1};
	std::set<send_id> dropped_;

	// requests sent with want-reply, the replies come in the same order
	std::deque<request_id> reply_queue_;
	std::map<request_id, request_status> requests_;
	request_id next_request_id_{1};

	std::optional<std::uint32_t> exit_status_;
	std::optional<exit_signal_info> exit_signal_;
};

template<typename... Args>
std::optional<request_id> channel::send_request_fields(std::string_view name, bool want_reply, Args const&... args) {
	byte_vector data;
	ssh_bf_writer w(data);
	if(!(w.write(args) && ...)) {
		return std::nullopt;
	}
	return send_request(name, want_reply, data);
}

}

#endif
