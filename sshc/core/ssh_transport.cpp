#include "ssh_transport.hpp"

#include "packet_ser_impl.hpp"
#include "protocol.hpp"
#include "protocol_helpers.hpp"

namespace securepath::sshc {

std::string_view to_string(transport_op op) {
	using enum transport_op;
	switch(op) {
		case want_read_more: return "want_read_more";
		case want_write_more: return "want_write_more";
		case pending_action: return "pending_action";
		case disconnected: return "disconnected";
	};
	return "unknown";
}

ssh_transport::ssh_transport(ssh_config const& c, logger& l, out_buffer& out, crypto_context cc)
: ssh_binary_packet(c, l)
, crypto_(std::move(cc))
, output_(out)
, rand_(crypto_.construct_random ? crypto_.construct_random() : nullptr)
{
	if(rand_) {
		set_random(*rand_);
	} else {
		logger_.log(logger::error, "SSH Unable to create random generator, double check your set-up");
		set_state(ssh_state::disconnected, sshc_invalid_setup);
	}
}

ssh_transport::~ssh_transport()
{
}

void ssh_transport::on_version_exchange(ssh_version const& v) {
	logger_.log(logger::info, "SSH version exchange [remote ssh={}, remote software={}]", v.ssh, v.software);

	// 1.99 announces a server that speaks both, it is 2.0 for us
	if(v.ssh != "2.0" && v.ssh != "1.99") {
		logger_.log(logger::error, "SSH invalid remote version [{} != 2.0]", v.ssh);
		set_error_and_disconnect(ssh_protocol_version_not_supported, "unsupported protocol version");
	}
}

ssh_state ssh_transport::state() const {
	return state_;
}

void ssh_transport::set_state(ssh_state s, std::optional<ssh_error_code> err) {
	if(err) {
		set_error(*err);
	}
	if(state_ == s) {
		return;
	}
	SSHC_ASSERT(state_ != ssh_state::disconnected, "already in disconnected state");
	logger_.log(logger::debug_trace, "SSH state change [{} -> {}]", state_, s);

	ssh_state old = state_;
	state_ = s;

	on_state_change(old, state_);
}

bool ssh_transport::rekeying() const {
	return state_ == ssh_state::kex && !kex_data_.session_id.empty();
}

void ssh_transport::disconnect(std::uint32_t code, std::string_view message, std::string_view lang) {
	logger_.log(logger::debug, "SSH disconnect [state={}, code={}, msg={}]", state(), code, message);

	if(state() == ssh_state::disconnected) {
		return;
	}

	if(state() == ssh_state::kex || state() == ssh_state::transport) {
		send_packet<ser::disconnect>(*this, code, message, lang);
	}
	set_state(ssh_state::disconnected);
}

void ssh_transport::send_ignore(std::size_t size) {
	logger_.log(logger::debug, "SSH send_ignore [state={}, size={}]", state(), size);

	if(state() == ssh_state::kex || state() == ssh_state::transport) {
		byte_vector data;
		data.resize(size);
		rand_->random_bytes(data);
		send_packet<ser::ignore>(*this, to_string_view(data));
	}
}

void ssh_transport::set_error(ssh_error_code code, std::string_view message) {
	ssh_binary_packet::set_error(code, message);
}

void ssh_transport::set_error_and_disconnect(ssh_error_code code, std::string_view message) {
	logger_.log(logger::debug_trace, "SSH setting error [error={}, msg={}]", code, message);
	// keep the first error, it is the reason for everything after
	if(error_ == ssh_noerror) {
		set_error(code, message);
	}
	disconnect(disconnect_code(code), message);
}

void ssh_transport::handle_version_exchange(in_buffer& in) {
	logger_.log(logger::debug_trace, "SSH handle_version_exchange [state={}]", state());
	if(state() == ssh_state::none) {
		if(!send_version_string(config_.my_version, output_)) {
			set_state(ssh_state::disconnected, sshc_memory_error);
			return;
		}
		set_state(ssh_state::version_exchange);
	}
	if(state() == ssh_state::version_exchange && !remote_version_received_) {
		// the server can send other lines before the version line, client must not
		bool allow_lines = config_.side == transport_side::client;
		auto res = parse_ssh_version(in, allow_lines, kex_data_.remote_ver, &pre_version_lines_);
		if(res == version_parse_result::ok) {
			remote_version_received_ = true;
			on_version_exchange(kex_data_.remote_ver);
			if(error_ == ssh_noerror) {
				kex_data_.local_ver = config_.my_version;
				set_state(ssh_state::kex);
			}
		} else if(res == version_parse_result::error) {
			logger_.log(logger::error, "SSH failed to parse protocol version information");
			set_state(ssh_state::disconnected, ssh_protocol_error);
		} else {
			logger_.log(logger::debug_trace, "SSH parse_ssh_version requires more data [in_buffer.size={}]", in.get().size());
		}
	}
}

handler_result ssh_transport::handle_binary_packet(in_buffer& in) {
	while(state() != ssh_state::disconnected) {
		auto res = decode(in.get());

		if(res == decode_result::need_more_data) {
			break;
		}

		if(res == decode_result::frame_error) {
			logger_.log(logger::error, "SSH frame error, closing connection [error={}, msg={}]", error(), error_message());
			// the input side is unusable, try to tell the peer before closing
			disconnect(disconnect_code(error()), error_message());
			break;
		}

		auto result = process_transport_payload(current_packet().payload);
		if(result == handler_result::pending) {
			return result;
		}

		logger_.log(logger::debug_trace, "SSH packet handled [seq={}]", current_packet().sequence);
		packet_handled(in);

		// let the output drain before taking more input
		if(has_pending_output()) {
			break;
		}
	}
	return handler_result::handled;
}

void ssh_transport::start_kex() {
	logger_.log(logger::debug, "SSH starting key exchange [session={}]", kex_data_.session_id.empty() ? "new" : "re-key");
	set_state(ssh_state::kex);
	if(!send_kex_init(false)) {
		logger_.log(logger::error, "SSH key exchange failed, aborting...");
		set_error_and_disconnect(ssh_key_exchange_failed);
	}
}

bool ssh_transport::request_rekey() {
	if(state() != ssh_state::transport) {
		logger_.log(logger::debug, "SSH cannot re-key in current state [state={}]", state());
		return false;
	}
	start_kex();
	return state() == ssh_state::kex;
}

bool ssh_transport::do_rekeying() {
	if(state() != ssh_state::transport) {
		return false;
	}

	bool time_passed = config_.rekey_time_interval.count() > 0 && rekey_time_ <= std::chrono::steady_clock::now();
	bool in_data_reached = config_.rekey_data_interval && stream_in_.transferred_bytes >= config_.rekey_data_interval;
	bool out_data_reached = config_.rekey_data_interval && stream_out_.transferred_bytes >= config_.rekey_data_interval;

	if(time_passed) {
		logger_.log(logger::debug_trace, "SSH rekey time interval passed");
	}
	if(in_data_reached) {
		logger_.log(logger::debug_trace, "SSH rekey data interval for in has been reached [transferred={}, limit={}]", stream_in_.transferred_bytes, config_.rekey_data_interval);
	}
	if(out_data_reached) {
		logger_.log(logger::debug_trace, "SSH rekey data interval for out has been reached [transferred={}, limit={}]", stream_out_.transferred_bytes, config_.rekey_data_interval);
	}

	bool res = time_passed || in_data_reached || out_data_reached;
	if(res) {
		start_kex();
	}
	return res;
}

transport_op ssh_transport::process(in_buffer& in) {
	if(state() == ssh_state::transport || rekeying()) {
		// if we have data in the internal buffer, it is possible that the service has buffered data
		flush_service_ = flush_service_ || has_pending_output();
	}

	// we try to write even in case of disconnect (we might have disconnect packet in the buffer)
	if(!send_pending(output_)) {
		return transport_op::want_write_more;
	}

	if(state() == ssh_state::disconnected) {
		return transport_op::disconnected;
	}

	if(state() == ssh_state::none || state() == ssh_state::version_exchange) {
		handle_version_exchange(in);
		if(state() == ssh_state::kex) {
			// only the client has a first kex packet to guess with the supported methods
			if(!send_kex_init(config_.guess_kex_packet && config_.side == transport_side::client)) {
				set_error_and_disconnect(ssh_key_exchange_failed);
			}
		}
	}

	if(state() == ssh_state::kex || state() == ssh_state::transport) {
		do_rekeying();

		if(handle_binary_packet(in) == handler_result::pending && state() != ssh_state::disconnected) {
			logger_.log(logger::debug_trace, "SSH action pending");
			return transport_op::pending_action;
		}

		if(flush_service_ && (state() == ssh_state::transport || rekeying()) && !has_pending_output()) {
			flush_service_ = flush();
		}
	}

	if(has_pending_output()) {
		logger_.log(logger::debug_trace, "SSH more to write");
		send_pending(output_);
		if(has_pending_output()) {
			return transport_op::want_write_more;
		}
	}

	if(state() == ssh_state::disconnected) {
		logger_.log(logger::debug_trace, "SSH disconnected");
		return transport_op::disconnected;
	}

	return transport_op::want_read_more;
}

handler_result ssh_transport::do_handle_transport_packet(ssh_packet_type type, const_span payload) {
	handler_result result = handle_transport_packet(type, payload.subspan(1));
	if(result == handler_result::unknown) {
		logger_.log(logger::debug, "SSH Unknown packet type, sending unimplemented packet [type={}]", type);
		send_packet<ser::unimplemented>(*this, current_packet().sequence);
		result = handler_result::handled;
	}
	return result;
}

handler_result ssh_transport::process_transport_payload(span payload) {
	SSHC_ASSERT(payload.size() >= 1, "invalid payload size");
	ssh_packet_type type = ssh_packet_type(std::to_integer<std::uint8_t>(payload[0]));
	logger_.log(logger::debug, "SSH process_transport_payload [state={}, type={}, size={}]", state(), type, payload.size());

	// basic packets are handled in all states
	if(handle_basic_packets(type, payload.subspan(1))) {
		return handler_result::handled;
	}

	if(state() == ssh_state::transport && type == ssh_kexinit) {
		// re-key initiated by the remote side
		start_kex();
	}

	if(state() == ssh_state::kex) {
		// give whole payload as we need to save kexinit for the exchange hash
		handler_result result = handle_raw_kex_packet(type, payload);
		if(result != handler_result::unknown) {
			return result;
		}
		if(kex_data_.session_id.empty()) {
			logger_.log(logger::error, "SSH Received non-kex packet during initial kex [type={}]", type);
			set_error_and_disconnect(ssh_protocol_error, "unexpected packet during key exchange");
			return handler_result::handled;
		}
		// traffic continues with the old keys while re-keying
		return do_handle_transport_packet(type, payload);
	}

	if(state() == ssh_state::transport) {
		return do_handle_transport_packet(type, payload);
	}

	logger_.log(logger::debug_trace, "SSH packet in invalid state [state={}]", state());
	set_error_and_disconnect(ssh_protocol_error);
	return handler_result::handled;
}

bool ssh_transport::handle_basic_packets(ssh_packet_type type, const_span payload) {
	bool ret = true;
	if(type == ssh_disconnect) {
		ser::disconnect::load packet(payload);
		if(packet) {
			auto & [code, desc, lang] = packet;
			remote_disconnect_ = disconnect_info{code, std::string(desc)};
			set_error(ssh_error_code(code), desc);
			logger_.log(logger::info, "SSH Disconnect from remote [code={}, msg={}]", error_, error_msg_);
		} else {
			logger_.log(logger::debug, "SSH Invalid disconnect packet from remote");
			remote_disconnect_ = disconnect_info{ssh_protocol_error, {}};
			set_error(ssh_protocol_error, "invalid disconnect packet");
		}
		set_state(ssh_state::disconnected);
	} else if(type == ssh_ignore) {
		ser::ignore::load packet(payload);
		if(packet) {
			logger_.log(logger::debug_trace, "SSH ignore packet received");
		} else {
			logger_.log(logger::debug_trace, "SSH received invalid ignore packet");
			set_error_and_disconnect(ssh_protocol_error);
		}
	} else if(type == ssh_unimplemented) {
		ser::unimplemented::load packet(payload);
		if(packet) {
			auto & [seq] = packet;
			logger_.log(logger::debug, "SSH unimplemented packet received [seq={}]", seq);
		} else {
			logger_.log(logger::debug_trace, "SSH received invalid unimplemented packet");
			set_error_and_disconnect(ssh_protocol_error);
		}
	} else if(type == ssh_debug) {
		ser::debug::load packet(payload);
		if(packet) {
			auto & [always_display, message, lang] = packet;
			logger_.log(always_display ? logger::info : logger::debug, "SSH debug packet received [message={}]", message);
		} else {
			logger_.log(logger::debug_trace, "SSH received invalid debug packet");
			set_error_and_disconnect(ssh_protocol_error);
		}
	} else {
		ret = false;
	}

	return ret;
}

bool ssh_transport::send_kex_init(bool send_first_packet) {
	logger_.log(logger::debug_trace, "SSH send_kex_init [send guess={}]", send_first_packet);
	SSHC_ASSERT(!kex_ || !kexinit_sent_, "invalid state");

	if(!config_.algorithms.valid()) {
		logger_.log(logger::error, "SSH Invalid algorithm configuration, aborting...");
		set_error_and_disconnect(sshc_invalid_setup);
		return false;
	}

	kex_cookie_.resize(cookie_size);
	rand_->random_bytes(kex_cookie_);

	bool ret = serialise_kexinit(kex_data_.local_kexinit, kex_cookie_, config_.algorithms, send_first_packet);

	if(ret) {
		ret = send_payload(*this, kex_data_.local_kexinit);
	}

	if(ret) {
		kexinit_sent_ = true;
		if(send_first_packet) {
			send_kex_guess();
		}
	}

	return ret;
}

void ssh_transport::send_kex_guess() {
	logger_.log(logger::debug_trace, "SSH send_kex_guess");

	kex_ = create_kex(config_.algorithms.kexes.preferred(), kex_context{*this, kex_data_});
	if(kex_) {
		kex_->initiate();
	}
}

void ssh_transport::kex_set_done() {
	if(local_kex_done_ && remote_kex_done_) {
		logger_.log(logger::info, "SSH key exchange done [{}]", kex_->configuration());

		host_key_blob_ = byte_vector(kex_->server_host_key_blob().begin(), kex_->server_host_key_blob().end());
		negotiated_ = kex_->configuration();

		kex_.reset();
		kexinit_received_ = false;
		kexinit_sent_ = false;
		ignore_next_kex_packet_ = false;
		local_kex_done_ = false;
		remote_kex_done_ = false;
		++kex_count_;

		rekey_time_ = std::chrono::steady_clock::now() + config_.rekey_time_interval;

		set_state(ssh_state::transport);
	}
}

bool ssh_transport::queue_output() const {
	// between our kexinit and newkeys only kex related packets can be sent
	return state_ == ssh_state::kex && !local_kex_done_;
}

bool ssh_transport::send_would_block() const {
	return queue_output() && rekey_queue_bytes_ >= config_.max_rekey_queue_size;
}

bool ssh_transport::send_payload_now(const_span payload) {
	auto rec = ssh_binary_packet::alloc_out_packet(payload.size(), output_);
	if(!rec) {
		return false;
	}
	copy(payload, rec->data);
	return ssh_binary_packet::create_out_packet(*rec, output_);
}

bool ssh_transport::flush_rekey_queue() {
	if(!rekey_queue_.empty()) {
		logger_.log(logger::debug, "SSH sending packets queued during re-key [count={}, size={}]", rekey_queue_.size(), rekey_queue_bytes_);
	}
	while(!rekey_queue_.empty()) {
		if(!send_payload_now(rekey_queue_.front())) {
			return false;
		}
		rekey_queue_bytes_ -= rekey_queue_.front().size();
		rekey_queue_.pop_front();
	}
	return true;
}

handler_result ssh_transport::handle_kex_done(kex const&) {
	logger_.log(logger::debug_trace, "SSH kex succeeded");

	auto out_keys = kex_->construct_out_crypto_pair();
	if(!out_keys) {
		logger_.log(logger::error, "SSH Failed to generate crypto");
		set_error_and_disconnect(ssh_key_exchange_failed);
		return handler_result::handled;
	}

	// newkeys is the last packet with the old keys
	if(!send_packet<ser::newkeys>(*this)) {
		logger_.log(logger::error, "SSH Failed to send newkeys packet");
		set_error_and_disconnect(ssh_key_exchange_failed);
		return handler_result::handled;
	}

	set_output_crypto(std::move(out_keys->cipher), std::move(out_keys->mac));
	local_kex_done_ = true;

	if(!flush_rekey_queue()) {
		logger_.log(logger::error, "SSH Failed to send queued packets");
		set_error_and_disconnect(sshc_memory_error);
		return handler_result::handled;
	}
	// channels may have stopped on the full re-key queue
	flush_service_ = true;

	kex_set_done();
	return handler_result::handled;
}

void ssh_transport::handle_remote_newkeys() {
	logger_.log(logger::debug_trace, "SSH kex remote newkeys");

	if(!kex_ || kex_->state() != kex_state::succeeded || remote_kex_done_) {
		logger_.log(logger::error, "SSH Received newkeys in invalid state");
		set_error_and_disconnect(ssh_protocol_error, "unexpected newkeys");
		return;
	}

	auto in_keys = kex_->construct_in_crypto_pair();
	if(!in_keys) {
		logger_.log(logger::error, "SSH Failed to generate crypto");
		set_error_and_disconnect(ssh_key_exchange_failed);
		return;
	}

	set_input_crypto(std::move(in_keys->cipher), std::move(in_keys->mac));
	remote_kex_done_ = true;

	if(kex_data_.session_id.empty()) {
		auto s = kex_->session_id();
		kex_data_.session_id = byte_vector(s.begin(), s.end());
	}
	kex_set_done();
}

handler_result ssh_transport::handle_raw_kex_packet(ssh_packet_type type, const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_raw_kex_packet [type={}]", type);

	if(!is_kex_packet(type)) {
		return handler_result::unknown;
	}

	if(type == ssh_kexinit) {
		if(kexinit_received_) {
			logger_.log(logger::error, "SSH Received second kexinit during key exchange");
			set_error_and_disconnect(ssh_protocol_error, "unexpected kexinit");
		} else {
			handle_kexinit_packet(payload);
		}
		return handler_result::handled;
	}

	if(!kexinit_received_) {
		logger_.log(logger::error, "SSH Received kex packet before kexinit [type={}]", type);
		set_error_and_disconnect(ssh_key_exchange_failed);
		return handler_result::handled;
	}

	// the remote guessed wrong, drop its first kex packet
	if(ignore_next_kex_packet_) {
		ignore_next_kex_packet_ = false;
		logger_.log(logger::debug_trace, "SSH ignoring guessed kex packet [type={}]", type);
		return handler_result::handled;
	}

	if(type == ssh_newkeys) {
		handle_remote_newkeys();
		return handler_result::handled;
	}

	return handle_kex_packet(type, payload);
}

handler_result ssh_transport::handle_kex_packet(ssh_packet_type type, const_span payload) {
	if(!kex_) {
		set_error_and_disconnect(ssh_key_exchange_failed);
		return handler_result::handled;
	}

	kex_state state = kex_->state();
	if(state == kex_state::inprogress) {
		state = kex_->handle(type, payload);
		if(state == kex_state::error) {
			logger_.log(logger::error, "SSH kex failed [msg={}]", kex_->error_message());
			set_error_and_disconnect(kex_->error(), kex_->error_message());
			return handler_result::handled;
		}
	} else if(state != kex_state::succeeded || local_kex_done_) {
		logger_.log(logger::error, "SSH kex packet in wrong kex state [type={}, state={}]", type, to_string(state));
		set_error_and_disconnect(ssh_protocol_error, "unexpected kex packet");
		return handler_result::handled;
	}

	if(state == kex_state::succeeded && !local_kex_done_) {
		return handle_kex_done(*kex_);
	}
	return handler_result::handled;
}

kexinit_result ssh_transport::agree_algorithms(kexinit_offer const& remote) {
	kexinit_agreement kagree(logger_, config_.algorithms);
	kexinit_result res;
	if(!kagree.agree(remote.algorithms)) {
		res.failed_category = kagree.failed_category();
		return res;
	}
	res.conf = kagree.agreed_configuration();
	// names we don't implement were dropped from the offer, those cannot be a correct guess
	res.guess_correct = kagree.was_guess_correct()
		&& remote.first_kex == res.conf->kex
		&& remote.first_host_key == res.conf->host_key;
	return res;
}

std::unique_ptr<kex> ssh_transport::create_kex(kex_type t, kex_context context) {
	return construct_kex(t, context);
}

void ssh_transport::handle_kexinit_packet(const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_kexinit_packet");

	auto offer = parse_kexinit(payload);
	if(!offer) {
		logger_.log(logger::error, "SSH Invalid kexinit packet from remote");
		set_error_and_disconnect(ssh_protocol_error, "invalid kexinit");
		return;
	}
	offer->algorithms.dump("remote", logger_);

	auto agreed = agree_algorithms(*offer);
	if(!agreed.conf) {
		logger_.log(logger::error, "SSH kexinit failed, no matching algorithms found [category={}]", agreed.failed_category);
		config_.algorithms.dump("local", logger_);
		set_error(sshc_no_common_algorithm, "no common " + std::string(agreed.failed_category) + " algorithm");
		disconnect(ssh_key_exchange_failed, error_msg_);
		return;
	}

	auto crypto_conf = *agreed.conf;
	bool const sent_first_packet = offer->first_kex_packet_follows;
	bool const guess_correct = agreed.guess_correct;
	logger_.log(logger::debug, "SSH kexinit agreed on configuration [{}, sent_first_packet={}]", crypto_conf, sent_first_packet);

	if(!guess_correct) {
		// wrong guess, ignore the remote's guessed packet and drop our own guess
		ignore_next_kex_packet_ = sent_first_packet;
		kex_.reset();
	}

	kex_data_.remote_kexinit = byte_vector{payload.begin(), payload.end()};
	negotiated_ = crypto_conf;

	if(!kex_) {
		kex_ = create_kex(crypto_conf.kex, kex_context{*this, kex_data_});
		if(!kex_) {
			set_error_and_disconnect(ssh_key_exchange_failed, "failed to construct kex");
			return;
		}
		kex_->set_crypto_configuration(crypto_conf);
		if(kex_->initiate() == kex_state::error) {
			set_error_and_disconnect(ssh_key_exchange_failed, kex_->error_message());
			return;
		}
	} else {
		kex_->set_crypto_configuration(crypto_conf);
	}
	kexinit_received_ = true;
}

const_span ssh_transport::session_id() const {
	return kex_data_.session_id;
}

std::optional<out_packet_record> ssh_transport::alloc_out_packet(std::size_t data_size) {
	if(queue_output()) {
		// the payload type decides later if this goes out now or after the key exchange
		staging_.resize(data_size);
		out_packet_record rec{data_size, data_size, 0};
		rec.data = staging_;
		rec.queued = true;
		return rec;
	}
	return ssh_binary_packet::alloc_out_packet(data_size, output_);
}

bool ssh_transport::write_alloced_out_packet(out_packet_record const& r) {
	if(r.queued) {
		SSHC_ASSERT(!r.data.empty(), "empty payload");
		auto type = ssh_packet_type(std::to_integer<std::uint8_t>(r.data[0]));
		if(is_transport_generic_packet(type) || is_kex_packet(type)) {
			return send_payload_now(r.data);
		}
		logger_.log(logger::debug_trace, "SSH queueing packet until key exchange is done [type={}, size={}]", type, r.data.size());
		rekey_queue_.emplace_back(r.data.begin(), r.data.end());
		rekey_queue_bytes_ += r.data.size();
		return true;
	}
	return ssh_binary_packet::create_out_packet(r, output_);
}

std::uint32_t ssh_transport::max_in_packet_size() const {
	// we don't know if the other side uses random padding, so we use the maximum padding size here
	return std::uint32_t(config_.max_in_packet_size - packet_header_size - maximum_padding_size);
}

std::uint32_t ssh_transport::max_out_packet_size() const {
	return std::uint32_t(config_.max_out_packet_size - packet_header_size - maximum_padding_size);
}

}
