#ifndef SSHC_CORE_CONNECTION_SSH_CONNECTION_HEADER
#define SSHC_CORE_CONNECTION_SSH_CONNECTION_HEADER

#include "channel.hpp"
#include "channel_stream.hpp"
#include "sshc/core/service/ssh_service.hpp"

#include <functional>
#include <map>
#include <memory>

namespace securepath::sshc {

class transport_base;

using channel_constructor = std::function<std::unique_ptr<channel>(transport_base&, channel_side_info)>;

/// Implements the client side of SSH connection protocol (RFC4254)
class ssh_connection : public ssh_service {
public:
	ssh_connection(transport_base&);
	~ssh_connection();

	/** \brief Open new channel
	 *
	 *  Zero window or packet size takes the default from the configuration.
	 *  The channel is usable after the remote confirms it, if the remote refuses the channel is closed
	 *  and open_failure() tells the reason.
	 */
	channel* open_channel(std::string_view type, std::uint32_t window = 0, std::uint32_t max_packet = 0, const_span extra_data = {}, channel_constructor = {});

	/// open channel that buffers the received data for reading
	channel_stream* open_stream(std::string_view type, std::uint32_t window = 0, std::uint32_t max_packet = 0, const_span extra_data = {});

	/// "session" channel with the configured defaults
	channel_stream* open_session() { return open_stream("session"); }

	// find channel
	channel* find_channel(channel_id) const;

	/// destroy closed channel, the id is never reused
	bool remove_channel(channel_id);

	std::size_t channel_count() const { return channels_.size(); }

	std::string_view name() const override;
	service_state state() const override;

	bool flush() override;

protected:
	bool init() override;
	handler_result process(ssh_packet_type, const_span payload) override;

	/*
		Global requests
			The request does not contain any identification but the replies must come in order,
			we never send global requests so the replies are only logged
	*/
	// gets called on global requests, return true if the request was handled (if reply is set, one has to send reply if handling the request)
	virtual bool on_global_request(std::string_view name, bool reply, const_span extra_data);

protected:
	handler_result handle_open(const_span payload);
	handler_result handle_open_confirm(const_span payload);
	handler_result handle_open_failure(const_span payload);
	handler_result handle_close(const_span payload);
	handler_result handle_global_request(const_span payload);
	handler_result handle_request_reply(ssh_packet_type type, const_span payload);
	handler_result handle_window_adjust(const_span payload);
	handler_result handle_data(const_span payload);
	handler_result handle_extended_data(const_span payload);
	handler_result handle_eof(const_span payload);
	handler_result handle_channel_request(const_span payload);
	handler_result handle_channel_reply(ssh_packet_type type, const_span payload);

private:
	channel* channel_for(channel_id local_id, std::string_view packet_name);
	void invalid_packet(std::string_view packet_name);

private:
	transport_base& transport_;
	logger& log_;
	ssh_config const& config_;
	service_state state_{service_state::none};

	std::map<channel_id, std::unique_ptr<channel>> channels_;

	channel_id current_id_{};
};

}

#endif
