#include "ssh_connection.hpp"
#include "conn_protocol.hpp"

#include "sshc/core/packet_ser_impl.hpp"
#include "sshc/core/transport_base.hpp"
#include "sshc/core/service/names.hpp"

namespace securepath::sshc {

ssh_connection::ssh_connection(transport_base& t)
: transport_(t)
, log_(transport_.call_context().log)
, config_(t.config())
{
}

ssh_connection::~ssh_connection()
{
}

std::string_view ssh_connection::name() const {
	return connection_service_name;
}

service_state ssh_connection::state() const {
	return state_;
}

bool ssh_connection::init() {
	state_ = service_state::inprogress;
	return true;
}

channel* ssh_connection::open_channel(std::string_view type, std::uint32_t window, std::uint32_t max_packet, const_span extra_data, channel_constructor ctor) {
	if(state_ != service_state::inprogress) {
		log_.log(logger::error, "cannot open channel, connection service not running [state={}]", to_string(state_));
		return nullptr;
	}

	channel_side_info local{
		++current_id_,
		window ? window : config_.channel.initial_window_size,
		max_packet ? max_packet : config_.channel.max_packet_size};

	std::unique_ptr<channel> ch = ctor ? ctor(transport_, local) : std::make_unique<channel>(transport_, local);
	if(!ch) {
		log_.log(logger::info, "failed to construct channel [type={}]", type);
		return nullptr;
	}

	channel* res{};
	if(ch->send_open(type, extra_data)) {
		res = ch.get();
		channels_[res->id()] = std::move(ch);
	}
	return res;
}

channel_stream* ssh_connection::open_stream(std::string_view type, std::uint32_t window, std::uint32_t max_packet, const_span extra_data) {
	return static_cast<channel_stream*>(open_channel(type, window, max_packet, extra_data,
		[](transport_base& t, channel_side_info local) {
			return std::make_unique<channel_stream>(t, local);
		}));
}

channel* ssh_connection::find_channel(channel_id id) const {
	auto it = channels_.find(id);
	return it != channels_.end() ? it->second.get() : nullptr;
}

bool ssh_connection::remove_channel(channel_id id) {
	auto it = channels_.find(id);
	if(it == channels_.end() || it->second->state() != channel_state::closed) {
		return false;
	}
	channels_.erase(it);
	return true;
}

channel* ssh_connection::channel_for(channel_id local_id, std::string_view packet_name) {
	auto ch = find_channel(local_id);
	if(!ch) {
		log_.log(logger::error, "Invalid channel id with {} [id={}]", packet_name, local_id);
	}
	return ch;
}

void ssh_connection::invalid_packet(std::string_view packet_name) {
	log_.log(logger::error, "Invalid {} packet", packet_name);
	transport_.set_error_and_disconnect(ssh_protocol_error);
}

handler_result ssh_connection::handle_open(const_span payload) {
	ser::channel_open::load packet(payload);
	if(packet) {
		auto& [type, sender_channel, initial_window, max_packet] = packet;
		// we are the client, the server side opened channels (forwarding, agent, x11) are not supported
		log_.log(logger::info, "refusing channel open from remote [type={}]", type);
		send_packet<ser::channel_open_failure>(transport_, sender_channel, ser::administratively_prohibited, "channel type not supported", "");
	} else {
		invalid_packet("channel open");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_open_confirm(const_span payload) {
	ser::channel_open_confirmation::load packet(payload);
	if(packet) {
		auto& [local_id, remote_id, initial_window, max_packet] = packet;
		if(auto ch = channel_for(local_id, "open confirmation")) {
			if(!ch->on_confirm(channel_side_info{remote_id, initial_window, max_packet}, safe_subspan(payload, packet.size()))) {
				transport_.set_error_and_disconnect(ssh_protocol_error, "invalid channel open confirmation");
			}
		}
	} else {
		invalid_packet("channel open confirmation");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_open_failure(const_span payload) {
	ser::channel_open_failure::load packet(payload);
	if(packet) {
		auto& [local_id, code, message, lang] = packet;
		if(auto ch = channel_for(local_id, "open failure")) {
			ch->on_open_failure(code, message);
		}
	} else {
		invalid_packet("channel open failure");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_close(const_span payload) {
	ser::channel_close::load packet(payload);
	if(packet) {
		auto& [local_id] = packet;
		if(auto ch = channel_for(local_id, "close")) {
			if(!ch->on_close()) {
				transport_.set_error_and_disconnect(ssh_protocol_error, "close for unconfirmed channel");
			}
		}
	} else {
		invalid_packet("channel close");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_global_request(const_span payload) {
	ser::global_request::load packet(payload);
	if(packet) {
		auto& [request_name, reply] = packet;
		if(!on_global_request(request_name, reply, safe_subspan(payload, packet.size()))) {
			if(reply) {
				send_packet<ser::request_failure>(transport_);
			}
		}
	} else {
		invalid_packet("global request");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_request_reply(ssh_packet_type type, const_span) {
	log_.log(logger::debug, "received global request reply without request [type={}]", type);
	return handler_result::handled;
}

handler_result ssh_connection::handle_window_adjust(const_span payload) {
	ser::channel_window_adjust::load packet(payload);
	if(packet) {
		auto& [local_id, bytes] = packet;
		if(auto ch = channel_for(local_id, "window adjust")) {
			ch->on_window_adjust(bytes);
		}
	} else {
		invalid_packet("channel window adjust");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_data(const_span payload) {
	ser::channel_data::load packet(payload);
	if(packet) {
		auto& [local_id, data] = packet;
		if(auto ch = channel_for(local_id, "data")) {
			if(!ch->on_data(0, to_span(data))) {
				transport_.set_error_and_disconnect(sshc_window_violation, "channel window exceeded");
			}
		}
	} else {
		invalid_packet("channel data");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_extended_data(const_span payload) {
	ser::channel_extended_data::load packet(payload);
	if(packet) {
		auto& [local_id, type, data] = packet;
		if(auto ch = channel_for(local_id, "extended data")) {
			if(!ch->on_data(type, to_span(data))) {
				transport_.set_error_and_disconnect(sshc_window_violation, "channel window exceeded");
			}
		}
	} else {
		invalid_packet("channel extended data");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_eof(const_span payload) {
	ser::channel_eof::load packet(payload);
	if(packet) {
		auto& [local_id] = packet;
		if(auto ch = channel_for(local_id, "eof")) {
			ch->on_eof();
		}
	} else {
		invalid_packet("channel eof");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_channel_request(const_span payload) {
	ser::channel_request::load packet(payload);
	if(packet) {
		auto& [local_id, name, reply] = packet;
		if(auto ch = channel_for(local_id, "channel request")) {
			ch->on_request(name, reply, safe_subspan(payload, packet.size()));
		}
	} else {
		invalid_packet("channel request");
	}
	return handler_result::handled;
}

handler_result ssh_connection::handle_channel_reply(ssh_packet_type type, const_span payload) {
	// success and failure have the same layout
	ser::channel_success::load packet(payload);
	if(packet) {
		auto& [local_id] = packet;
		if(auto ch = channel_for(local_id, "channel request reply")) {
			ch->on_request_reply(type == ssh_channel_success);
		}
	} else {
		invalid_packet("channel request reply");
	}
	return handler_result::handled;
}

handler_result ssh_connection::process(ssh_packet_type type, const_span payload) {
	switch(type) {
		case ssh_channel_open :              return handle_open(payload);
		case ssh_channel_open_confirmation : return handle_open_confirm(payload);
		case ssh_channel_open_failure :      return handle_open_failure(payload);
		case ssh_channel_close :             return handle_close(payload);
		case ssh_global_request :            return handle_global_request(payload);
		case ssh_request_success :
		case ssh_request_failure :           return handle_request_reply(type, payload);
		case ssh_channel_window_adjust :     return handle_window_adjust(payload);
		case ssh_channel_data :              return handle_data(payload);
		case ssh_channel_extended_data :     return handle_extended_data(payload);
		case ssh_channel_eof :               return handle_eof(payload);
		case ssh_channel_request :           return handle_channel_request(payload);
		case ssh_channel_success :
		case ssh_channel_failure :           return handle_channel_reply(type, payload);
		default: break; // to suppress warning
	};

	log_.log(logger::error, "Unknown packet type for ssh_connection [type={}]", type);

	return handler_result::unknown;
}

bool ssh_connection::flush() {
	bool more = false;
	// in case the channel reports there are more data still, we probably fully filled the out buffers and give up
	for(auto it = channels_.begin(); !more && it != channels_.end(); ++it) {
		channel& c = *it->second;
		if(c.state() == channel_state::established || c.state() == channel_state::close_pending) {
			more = c.flush();
		}
	}
	return more;
}

bool ssh_connection::on_global_request(std::string_view name, bool reply, const_span) {
	log_.log(logger::debug, "received global request '{}' [reply={}]", name, reply);
	return false;
}

}
