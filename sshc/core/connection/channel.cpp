#include "channel.hpp"
#include "sshc/core/packet_ser_impl.hpp"

#include <algorithm>
#include <limits>

namespace securepath::sshc {

std::string_view to_string(channel_state s) {
	using enum channel_state;
	switch(s) {
		case init:          return "init";
		case open_pending:  return "open_pending";
		case established:   return "established";
		case close_pending: return "close_pending";
		case closed:        return "closed";
	}
	return "unknown";
}

std::string_view to_string(request_status s) {
	using enum request_status;
	switch(s) {
		case unknown:   return "unknown";
		case pending:   return "pending";
		case succeeded: return "succeeded";
		case failed:    return "failed";
	}
	return "unknown";
}

// channel data packet header: message number, recipient channel, data type and string length
std::uint32_t const packet_overhead = 1 + 4 + 4 + 4;

namespace {

std::uint32_t add_window(std::uint32_t window, std::uint32_t bytes) {
	// lets not increase the size over 2^32-1
	return window + std::min(bytes, std::numeric_limits<std::uint32_t>::max() - window);
}

}

channel::channel(transport_base& transport, channel_side_info local)
: transport_(transport)
, log_(transport_.call_context().log)
, local_info_(local)
{
	// we don't accept bigger packets than the transport does
	local_info_.max_packet_size = std::min(local_info_.max_packet_size, transport_.max_in_packet_size() - packet_overhead);
	in_window_ = local_info_.window_size;
	log_.log(logger::debug_trace, "channel id={} constructed", local_info_.id);
}

channel::~channel()
{
	log_.log(logger::debug_trace, "channel id={} destroyed", local_info_.id);
}

bool channel::send_open(std::string_view type, const_span extra_data) {
	SSHC_ASSERT(state_ == channel_state::init, "channel already opened");
	type_ = std::string(type);

	byte_vector payload;
	bool ret = ser::serialise_to_vector<ser::channel_open>(payload,
		type,
		local_info_.id,
		local_info_.window_size,
		local_info_.max_packet_size);

	if(ret && !extra_data.empty()) {
		ssh_bf_writer w(payload, payload.size());
		ret = w.write(extra_data);
	}

	ret = ret && send_payload(transport_, payload);
	if(ret) {
		log_.log(logger::debug, "channel open sent [id={}, type={}, window={}, max packet={}]"
			, local_info_.id, type_, local_info_.window_size, local_info_.max_packet_size);
		set_state(channel_state::open_pending);
	}
	return ret;
}

bool channel::on_confirm(channel_side_info remote, const_span /*extra_data*/) {
	if(state_ != channel_state::open_pending) {
		log_.log(logger::error, "open confirmation for channel in wrong state [id={}, state={}]", local_info_.id, to_string(state_));
		return false;
	}
	log_.log(logger::info, "channel open confirmed id={} ({}) [out window={}, max packet={}]"
		, local_info_.id, remote.id, remote.window_size, remote.max_packet_size);
	remote_info_ = remote;
	out_window_ = remote_info_.window_size;
	max_out_size_ = std::min(remote_info_.max_packet_size, transport_.max_out_packet_size() - packet_overhead);
	if(max_out_size_ == 0) {
		log_.log(logger::error, "remote maximum packet size too small [id={}]", local_info_.id);
		return false;
	}
	set_state(channel_state::established);

	// anything queued before the confirmation
	do_flush();
	return true;
}

void channel::on_open_failure(std::uint32_t code, std::string_view message) {
	log_.log(logger::info, "failed to open channel id={} (remote refuses) [code={}, msg={}]", local_info_.id, code, message);
	open_failure_ = open_failure_info{code, std::string(message)};
	drop_pending();
	set_state(channel_state::closed);
}

std::optional<send_id> channel::send_data(const_span s, std::uint32_t data_type) {
	if(state_ > channel_state::established || eof_requested_ || close_requested_) {
		log_.log(logger::debug, "cannot send data on channel [id={}, state={}, eof={}]", local_info_.id, to_string(state_), eof_requested_);
		return std::nullopt;
	}

	send_id id = next_send_id_++;
	pending_.push_back(pending_send{id, data_type, byte_vector(s.begin(), s.end())});

	log_.log(logger::debug_trace, "queued data for channel [id={}, send={}, size={}, type={}]", local_info_.id, id, s.size(), data_type);

	if(state_ == channel_state::established) {
		do_flush();
	}
	return id;
}

bool channel::cancel_send(send_id id) {
	auto it = std::find_if(pending_.begin(), pending_.end(), [&](auto const& p) { return p.id == id; });
	if(it == pending_.end()) {
		return false;
	}
	log_.log(logger::debug, "cancelling send [id={}, send={}, sent={}, left={}]", local_info_.id, id, it->sent, it->data.size() - it->sent);
	pending_.erase(it);
	return true;
}

bool channel::send_done(send_id id) const {
	return id < next_send_id_
		&& std::none_of(pending_.begin(), pending_.end(), [&](auto const& p) { return p.id == id; });
}

bool channel::send_dropped(send_id id) {
	return dropped_.erase(id) != 0;
}

std::size_t channel::pending_bytes() const {
	std::size_t res{};
	for(auto const& p : pending_) {
		res += p.data.size() - p.sent;
	}
	return res;
}

bool channel::send_data_packet(pending_send& p) {
	std::uint32_t size = std::uint32_t(std::min<std::size_t>({out_window_, max_out_size_, p.data.size() - p.sent}));
	auto data = to_string_view(safe_subspan(p.data, p.sent, size));

	bool res = p.data_type == 0
		? send_packet<ser::channel_data>(transport_, remote_info_.id, data)
		: send_packet<ser::channel_extended_data>(transport_, remote_info_.id, p.data_type, data);

	if(res) {
		p.sent += size;
		out_window_ -= size;
	} else {
		log_.log(logger::debug_trace, "failed to send channel data [channel={}, size={}, out_window={}]", local_info_.id, size, out_window_);
	}
	return res;
}

bool channel::do_flush() {
	if(state_ != channel_state::established && state_ != channel_state::close_pending) {
		return !pending_.empty();
	}

	while(!pending_.empty() && out_window_ && !sent_close_ && !transport_.send_would_block()) {
		auto& p = pending_.front();
		if(!send_data_packet(p)) {
			break;
		}
		if(p.sent == p.data.size()) {
			pending_.pop_front();
		}
	}

	if(pending_.empty()) {
		if(eof_requested_ && !sent_eof_) {
			sent_eof_ = send_packet<ser::channel_eof>(transport_, remote_info_.id);
		}
		if(close_requested_ && !sent_close_) {
			send_close_packet();
		}
	}
	return !pending_.empty();
}

bool channel::flush() {
	log_.log(logger::debug_trace, "trying to flush channel id={} [pending={}, out_window={}]", local_info_.id, pending_.size(), out_window_);
	return do_flush() && out_window_;
}

bool channel::send_eof() {
	if(state_ > channel_state::established || close_requested_) {
		return false;
	}
	eof_requested_ = true;
	if(state_ == channel_state::established) {
		do_flush();
	}
	return true;
}

bool channel::send_close_packet() {
	if(!send_packet<ser::channel_close>(transport_, remote_info_.id)) {
		return false;
	}
	sent_close_ = true;
	set_state(received_close_ ? channel_state::closed : channel_state::close_pending);
	return true;
}

bool channel::send_close() {
	if(state_ == channel_state::closed || close_requested_) {
		return true;
	}
	close_requested_ = true;
	local_close_ = true;
	on_state_change();
	if(state_ == channel_state::init || state_ == channel_state::open_pending) {
		// nothing to close yet at the remote side, the close is sent after confirmation
		return true;
	}
	set_state(channel_state::close_pending);
	do_flush();
	return transport_.error() == ssh_noerror;
}

bool channel::adjust_window(std::uint32_t n) {
	if(state_ != channel_state::established && state_ != channel_state::close_pending) {
		return false;
	}
	bool ret = send_packet<ser::channel_window_adjust>(transport_, remote_info_.id, n);
	if(ret) {
		log_.log(logger::debug_trace, "adjusted in window [id={}, bytes={}, window={}]", local_info_.id, n, in_window_);
		in_window_ = add_window(in_window_, n);
		unacked_ -= std::min(n, unacked_);
	}
	return ret;
}

// restore the window when half of the initial window is consumed
void channel::consumed(std::uint32_t n) {
	unacked_ = add_window(unacked_, n);
	if(unacked_ >= local_info_.window_size / 2 && !received_close_) {
		log_.log(logger::debug_trace, "adjusting in window [id={}, unacked={}, window_size={}]", local_info_.id, unacked_, local_info_.window_size);
		adjust_window(unacked_);
	}
}

bool channel::on_data(std::uint32_t data_type, const_span d) {
	if(d.size() > in_window_) {
		log_.log(logger::error, "remote sent more than the window allows [id={}, size={}, window={}]", local_info_.id, d.size(), in_window_);
		return false;
	}
	if(d.size() > local_info_.max_packet_size) {
		log_.log(logger::error, "remote sent too big data packet [id={}, size={}, max={}]", local_info_.id, d.size(), local_info_.max_packet_size);
		return false;
	}
	if(received_eof_ || received_close_) {
		log_.log(logger::debug, "data after eof/close from remote, ignoring [id={}]", local_info_.id);
		return true;
	}
	in_window_ -= std::uint32_t(d.size());
	on_data_received(data_type, d);
	return true;
}

void channel::on_data_received(std::uint32_t, const_span d) {
	consumed(std::uint32_t(d.size()));
}

void channel::on_window_adjust(std::uint32_t bytes) {
	log_.log(logger::debug_trace, "adjusting out window id={} [bytes={}, window={}]", local_info_.id, bytes, out_window_);
	out_window_ = add_window(out_window_, bytes);
	do_flush();
}

void channel::on_eof() {
	log_.log(logger::debug, "received eof for channel id={}", local_info_.id);
	received_eof_ = true;
	on_state_change();
}

bool channel::on_close() {
	log_.log(logger::debug_trace, "received close for channel id={}", local_info_.id);
	if(state_ == channel_state::init || state_ == channel_state::open_pending) {
		// the peer has no id for us to answer to
		log_.log(logger::error, "close for channel that is not open [id={}, state={}]", local_info_.id, to_string(state_));
		drop_pending();
		set_state(channel_state::closed);
		return false;
	}
	if(received_close_) {
		return true;
	}
	received_close_ = true;
	if(sent_close_) {
		set_state(channel_state::closed);
	} else {
		// nothing more can be sent after the remote closed
		drop_pending();
		close_requested_ = true;
		if(!send_close_packet()) {
			set_state(channel_state::closed);
		}
	}
	return true;
}

void channel::drop_pending() {
	if(!pending_.empty()) {
		log_.log(logger::debug, "dropping pending sends [id={}, count={}, bytes={}]", local_info_.id, pending_.size(), pending_bytes());
		for(auto const& p : pending_) {
			dropped_.insert(p.id);
		}
		pending_.clear();
	}
}

std::optional<request_id> channel::add_request(bool want_reply) {
	request_id id = next_request_id_++;
	if(want_reply) {
		reply_queue_.push_back(id);
		requests_[id] = request_status::pending;
	} else {
		requests_[id] = request_status::succeeded;
	}
	return id;
}

std::optional<request_id> channel::send_request(std::string_view name, bool want_reply, const_span data) {
	if(state_ != channel_state::established || sent_close_) {
		log_.log(logger::debug, "cannot send channel request [id={}, state={}, name={}]", local_info_.id, to_string(state_), name);
		return std::nullopt;
	}

	byte_vector payload;
	bool ret = ser::serialise_to_vector<ser::channel_request>(payload, remote_info_.id, name, want_reply);
	if(ret && !data.empty()) {
		ssh_bf_writer w(payload, payload.size());
		ret = w.write(data);
	}
	if(!ret || !send_payload(transport_, payload)) {
		return std::nullopt;
	}

	log_.log(logger::debug, "channel request sent [id={}, name={}, want reply={}]", local_info_.id, name, want_reply);
	return add_request(want_reply);
}

std::optional<request_id> channel::request_pty(pty_settings const& s) {
	return send_request_fields("pty-req", true,
		std::string_view(s.term), s.columns, s.rows, s.width_px, s.height_px, std::string_view(s.modes));
}

std::optional<request_id> channel::request_env(std::string_view name, std::string_view value) {
	return send_request_fields("env", true, name, value);
}

std::optional<request_id> channel::request_exec(std::string_view command) {
	return send_request_fields("exec", true, command);
}

std::optional<request_id> channel::request_shell() {
	return send_request("shell", true);
}

std::optional<request_id> channel::request_subsystem(std::string_view subsystem) {
	return send_request_fields("subsystem", true, subsystem);
}

std::optional<request_id> channel::request_window_change(std::uint32_t columns, std::uint32_t rows, std::uint32_t width_px, std::uint32_t height_px) {
	return send_request_fields("window-change", false, columns, rows, width_px, height_px);
}

std::optional<request_id> channel::request_signal(std::string_view signal) {
	return send_request_fields("signal", false, signal);
}

request_status channel::request_result(request_id id) {
	auto it = requests_.find(id);
	if(it == requests_.end()) {
		return request_status::unknown;
	}
	auto res = it->second;
	if(res != request_status::pending) {
		requests_.erase(it);
	}
	return res;
}

void channel::on_request_reply(bool success) {
	if(reply_queue_.empty()) {
		log_.log(logger::error, "channel request reply without request [id={}]", local_info_.id);
		return;
	}
	auto id = reply_queue_.front();
	reply_queue_.pop_front();
	requests_[id] = success ? request_status::succeeded : request_status::failed;
	log_.log(logger::debug, "channel request reply [id={}, request={}, success={}]", local_info_.id, id, success);
	on_state_change();
}

void channel::on_request(std::string_view name, bool reply, const_span extra_data) {
	log_.log(logger::debug_trace, "received channel request [id={}, name={}, reply={}]", local_info_.id, name, reply);

	bool handled = false;
	if(name == "exit-status") {
		ser::exit_status_data::load packet(extra_data);
		if(packet) {
			auto& [status] = packet;
			exit_status_ = status;
			handled = true;
			log_.log(logger::debug, "remote exit status [id={}, status={}]", local_info_.id, status);
		}
	} else if(name == "exit-signal") {
		ser::exit_signal_data::load packet(extra_data);
		if(packet) {
			auto& [signal, core_dumped, message, lang] = packet;
			exit_signal_ = exit_signal_info{std::string(signal), core_dumped, std::string(message)};
			handled = true;
			log_.log(logger::debug, "remote exit signal [id={}, signal={}, core dumped={}]", local_info_.id, signal, core_dumped);
		}
	}

	if(reply && state_ <= channel_state::close_pending && !sent_close_) {
		if(handled) {
			send_packet<ser::channel_success>(transport_, remote_info_.id);
		} else {
			send_packet<ser::channel_failure>(transport_, remote_info_.id);
		}
	}
	if(handled) {
		on_state_change();
	}
}

void channel::set_state(channel_state s) {
	if(state_ == s) {
		return;
	}
	SSHC_ASSERT(state_ < s, "invalid state change");
	log_.log(logger::debug_trace, "changing state for channel id={} [{} -> {}]", local_info_.id, to_string(state_), to_string(s));
	state_ = s;
	if(state_ == channel_state::closed) {
		// pending requests will not get reply any more
		for(auto id : reply_queue_) {
			requests_[id] = request_status::failed;
		}
		reply_queue_.clear();
	}
	on_state_change();
}

}
