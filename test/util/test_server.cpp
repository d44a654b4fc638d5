#include "test_server.hpp"

#include "sshc/core/auth/auth_protocol.hpp"
#include "sshc/core/connection/conn_protocol.hpp"
#include "sshc/core/packet_ser_impl.hpp"
#include "sshc/core/protocol.hpp"
#include "sshc/core/ssh_public_key.hpp"

#include <algorithm>
#include <utility>

namespace securepath::sshc::test {
namespace {

/// server side of the exchange, signs the exchange hash with the host key of the agreed type
class responder_kex : public kex {
public:
	responder_kex(kex_type t, kex_method m, kex_context c, std::vector<test_host_key> const& keys)
	: kex(transport_side::server, t, std::move(m), c)
	, keys_(keys)
	{}

	kex_state initiate() override {
		// the client sends its ephemeral key first
		return set_state(kex_state::inprogress);
	}

	kex_state handle(ssh_packet_type type, const_span payload) override {
		if(state_ != kex_state::inprogress) {
			return set_error(ssh_key_exchange_failed, "Invalid kex state [state={}]", to_string(state_));
		}
		return std::visit([&](auto& m) { return reply(m, type, payload); }, method_);
	}

private:
	template<typename Method>
	kex_state reply(Method& m, ssh_packet_type type, const_span payload) {
		if(type != Method::init_packet::packet_type) {
			return set_error(ssh_key_exchange_failed, "Wrong kex packet [type={}]", type);
		}

		typename Method::init_packet::load packet(ser::match_type_t, payload);
		if(!packet) {
			return set_error(ssh_key_exchange_failed, "Invalid kex init packet");
		}

		auto & [client_eph_key] = packet;

		const_span remote_public = Method::decode(client_eph_key);
		auto secret = m.exchange->agree(remote_public);
		if(secret.empty()) {
			return set_error(ssh_key_exchange_failed, "Invalid shared secret");
		}

		auto it = std::find_if(keys_.begin(), keys_.end(), [&](auto&& v) { return v.key.type() == conf_.host_key; });
		if(it == keys_.end()) {
			return set_error(ssh_key_exchange_failed, "Failed to find suitable host key [type={}]", to_string(conf_.host_key));
		}

		auto hash = calculate_exchange_hash(it->blob, remote_public, secret);
		if(hash.empty()) {
			return set_error(ssh_key_exchange_failed, "Failed to calculate exchange hash");
		}

		byte_vector sig = it->key.sign(hash);
		if(sig.empty()) {
			return set_error(ssh_key_exchange_failed, "Failed to sign exchange hash");
		}

		if(!context_.send_packet<typename Method::reply_packet>(
			to_string_view(it->blob),
			Method::encode(m.exchange->public_key()),
			to_string_view(sig)))
		{
			return set_error(ssh_key_exchange_failed, "Failed to send kex reply");
		}

		set_data(std::move(hash), std::move(secret), it->blob);
		return set_state(kex_state::succeeded);
	}

private:
	std::vector<test_host_key> const& keys_;
};

}

test_server::test_server(logger& l, ssh_config c, std::size_t max_out_size)
: test_context(l, "[server] ", max_out_size)
, ssh_config(std::move(c))
, ssh_transport(*this, slog, out_buf, default_crypto_context())
{
	side = transport_side::server;

	crypto_test_context crypto;
	add_host_key(crypto.test_ed25519_private_key());
	add_host_key(crypto.test_rsa_private_key());
}

bool test_server::add_host_key(ssh_private_key k) {
	auto blob = to_byte_vector(k.public_key());
	if(blob.empty()) {
		return false;
	}
	host_keys_.push_back(test_host_key{std::move(k), std::move(blob)});
	return true;
}

bool test_server::set_host_keys(std::vector<ssh_private_key> keys) {
	host_keys_.clear();
	algorithms.host_keys.clear();
	for(auto&& k : keys) {
		auto type = k.type();
		if(!add_host_key(std::move(k))) {
			host_keys_.clear();
			algorithms.host_keys.clear();
			return false;
		}
		algorithms.host_keys.add_back(type);
	}
	return true;
}

kexinit_result test_server::agree_algorithms(kexinit_offer const& remote) {
	// the client list decides the selection
	kexinit_agreement kagree(slog, remote.algorithms);
	kexinit_result res;
	if(!kagree.agree(algorithms)) {
		res.failed_category = kagree.failed_category();
		return res;
	}
	auto conf = kagree.agreed_configuration();
	// client to server is our in direction
	std::swap(conf.in, conf.out);
	res.conf = conf;
	res.guess_correct = kagree.was_guess_correct()
		&& remote.first_kex == conf.kex
		&& remote.first_host_key == conf.host_key;
	return res;
}

std::unique_ptr<kex> test_server::create_kex(kex_type t, kex_context context) {
	auto method = construct_kex_method(t, context);
	if(!method) {
		return nullptr;
	}
	return std::make_unique<responder_kex>(t, std::move(*method), context, host_keys_);
}

peer_channel* test_server::find_channel(channel_id id) {
	auto it = channels.find(id);
	return it != channels.end() ? &it->second : nullptr;
}

peer_channel* test_server::last_channel() {
	return find_channel(last_id_);
}

handler_result test_server::handle_transport_packet(ssh_packet_type type, const_span payload) {
	if(type == ssh_service_request) {
		handle_service_request(payload);
	} else if(type == ssh_userauth_request) {
		handle_auth_request(payload);
	} else if(type == ssh_userauth_info_response) {
		handle_info_response(payload);
	} else if(is_connection_packet(type)) {
		handle_connection(type, payload);
	} else {
		return handler_result::unknown;
	}
	return handler_result::handled;
}

void test_server::handle_service_request(const_span payload) {
	ser::service_request::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(ssh_protocol_error, "invalid service request");
		return;
	}
	auto& [name] = packet;
	service_requests.emplace_back(name);
	if(services.count(std::string(name))) {
		send_packet<ser::service_accept>(*this, name);
	} else {
		set_error_and_disconnect(ssh_service_not_available, "service not available");
	}
}

void test_server::auth_success(std::string_view user) {
	slog.log(logger::info, "test server: user authenticated [user={}]", user);
	authenticated_ = true;
	user_ = std::string(user);
	send_packet<ser::userauth_success>(*this);
}

void test_server::auth_failure() {
	std::vector<std::string_view> methods(auth_data.methods.begin(), auth_data.methods.end());
	send_packet<ser::userauth_failure>(*this, methods, false);
}

void test_server::handle_auth_request(const_span payload) {
	ser::userauth_request::load packet(payload);
	if(!packet || authenticated_) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected auth request");
		return;
	}

	auto& [user, service, method] = packet;
	++auth_request_count;
	auth_methods_seen.emplace_back(method);

	if(!auth_data.banner.empty() && !banner_sent_) {
		banner_sent_ = true;
		send_packet<ser::userauth_banner>(*this, auth_data.banner, "");
	}

	if(service != connection_service_name) {
		auth_failure();
		return;
	}

	auto& r = packet.reader();
	if(method == "none") {
		if(auth_data.accept_none) {
			auth_success(user);
		} else {
			auth_failure();
		}
	} else if(method == "password") {
		bool change{};
		std::string_view password;
		if(!r.read(change) || !r.read(password)) {
			set_error_and_disconnect(ssh_protocol_error, "invalid password request");
			return;
		}
		auto it = auth_data.passwords.find(std::string(user));
		if(!change && it != auth_data.passwords.end() && it->second == password) {
			auth_success(user);
		} else {
			auth_failure();
		}
	} else if(method == "publickey") {
		if(!handle_pk(user, payload, r)) {
			auth_failure();
		}
	} else if(method == "keyboard-interactive") {
		std::string_view lang, submethods;
		if(!r.read(lang) || !r.read(submethods)) {
			set_error_and_disconnect(ssh_protocol_error, "invalid interactive request");
			return;
		}
		interactive_user_ = std::string(user);

		auto const& req = auth_data.interactive;
		byte_vector info;
		bool ret = ser::serialise_to_vector<ser::userauth_info_request>(info,
			req.name, req.instruction, "", std::uint32_t(req.prompts.size()));
		ssh_bf_writer w(info, info.size());
		for(auto const& p : req.prompts) {
			ret = ret && w.write(std::string_view(p.text)) && w.write(p.echo);
		}
		if(!ret || !send_payload(*this, info)) {
			set_error_and_disconnect(sshc_memory_error);
		}
	} else {
		auth_failure();
	}
}

// the signature covers the session id and the request up to the public key blob
bool test_server::handle_pk(std::string_view user, const_span payload, ssh_bf_reader& r) {
	bool has_sig{};
	std::string_view alg, blob;
	if(!r.read(has_sig) || !r.read(alg) || !r.read(blob)) {
		set_error_and_disconnect(ssh_protocol_error, "invalid publickey request");
		return true;
	}

	auto key_blob = to_span(blob);
	bool known = std::any_of(auth_data.keys.begin(), auth_data.keys.end(),
		[&](auto const& k) { return compare_equal(k, key_blob); });

	if(!has_sig) {
		++pk_query_count;
		if(!known) {
			return false;
		}
		return send_packet<ser::userauth_pk_ok>(*this, alg, blob);
	}

	++pk_signed_count;
	std::size_t signed_size = r.used_size();

	std::string_view sig;
	if(!known || !r.read(sig)) {
		return false;
	}

	byte_vector signed_data;
	ssh_bf_writer w(signed_data);
	if(!w.write(to_string_view(session_id())) || !w.write(std::uint8_t(ssh_userauth_request)) || !w.write(payload.subspan(0, signed_size))) {
		return false;
	}

	auto key = load_ssh_public_key(key_blob, crypto(), call_context(), from_string(type_tag<key_type>{}, alg));
	if(!key.valid() || !key.verify(signed_data, to_span(sig))) {
		slog.log(logger::error, "test server: signature verification failed");
		return false;
	}

	++pk_verified_count;
	auth_success(user);
	return true;
}

void test_server::handle_info_response(const_span payload) {
	ser::userauth_info_response::load packet(payload);
	if(!packet || !interactive_user_) {
		set_error_and_disconnect(ssh_protocol_error, "unexpected info response");
		return;
	}

	auto& [count] = packet;
	interactive_answers.clear();
	for(std::uint32_t i = 0; i != count; ++i) {
		std::string_view answer;
		if(!packet.reader().read(answer)) {
			set_error_and_disconnect(ssh_protocol_error, "invalid info response");
			return;
		}
		interactive_answers.emplace_back(answer);
	}

	std::string user = *interactive_user_;
	interactive_user_.reset();
	if(interactive_answers == auth_data.answers) {
		auth_success(user);
	} else {
		auth_failure();
	}
}

void test_server::handle_connection(ssh_packet_type type, const_span payload) {
	if(!authenticated_) {
		set_error_and_disconnect(ssh_protocol_error, "connection packet before authentication");
		return;
	}

	if(type == ssh_channel_open) {
		handle_open(payload);
		return;
	}
	if(type == ssh_channel_open_failure) {
		ser::channel_open_failure::load packet(payload);
		if(packet) {
			auto& [id, code, desc, lang] = packet;
			open_failures.push_back(code);
		}
		return;
	}
	if(type == ssh_global_request || type == ssh_channel_success || type == ssh_channel_failure) {
		return;
	}

	// the rest start with the recipient channel
	ssh_bf_reader r(payload);
	std::uint32_t id{};
	if(!r.read(id)) {
		set_error_and_disconnect(ssh_protocol_error, "invalid channel packet");
		return;
	}
	auto ch = find_channel(id);
	if(!ch) {
		set_error_and_disconnect(ssh_protocol_error, "unknown channel");
		return;
	}

	if(type == ssh_channel_data) {
		std::string_view data;
		if(r.read(data)) {
			handle_data(0, *ch, data);
		}
	} else if(type == ssh_channel_extended_data) {
		std::uint32_t data_type{};
		std::string_view data;
		if(r.read(data_type) && r.read(data)) {
			handle_data(data_type, *ch, data);
		}
	} else if(type == ssh_channel_window_adjust) {
		std::uint32_t bytes{};
		if(r.read(bytes)) {
			ch->out_window += bytes;
			flush_channel(*ch);
		}
	} else if(type == ssh_channel_eof) {
		ch->eof_received = true;
	} else if(type == ssh_channel_close) {
		ch->close_received = true;
		if(!ch->close_sent) {
			ch->pending.clear();
			ch->close_queued = true;
			flush_channel(*ch);
		}
	} else if(type == ssh_channel_request) {
		std::string_view name;
		bool reply{};
		if(r.read(name) && r.read(reply)) {
			handle_request(*ch, name, reply, r.rest_of_span());
		}
	}
}

void test_server::handle_open(const_span payload) {
	ser::channel_open::load packet(payload);
	if(!packet) {
		set_error_and_disconnect(ssh_protocol_error, "invalid channel open");
		return;
	}
	auto& [type, sender, window, max_pkt] = packet;

	if(refuse_open) {
		send_packet<ser::channel_open_failure>(*this, sender, ser::administratively_prohibited, "refused by test", "");
		return;
	}

	peer_channel ch;
	ch.id = next_id_++;
	ch.remote_id = sender;
	ch.type = std::string(type);
	ch.out_window = window;
	ch.remote_max_packet = max_pkt;
	ch.in_window = window_size;

	last_id_ = ch.id;
	channels[ch.id] = ch;

	send_packet<ser::channel_open_confirmation>(*this, sender, ch.id, window_size, max_packet);
}

void test_server::handle_data(std::uint32_t data_type, peer_channel& ch, std::string_view data) {
	if(data.size() > ch.in_window || data.size() > max_packet) {
		slog.log(logger::error, "test server: client exceeded window [size={}, window={}]", data.size(), ch.in_window);
		ch.window_exceeded = true;
		return;
	}
	ch.in_window -= std::uint32_t(data.size());

	auto& target = data_type == 0 ? ch.data : ch.ext_data;
	auto s = to_span(data);
	target.insert(target.end(), s.begin(), s.end());

	if(auto_adjust && ch.in_window < window_size / 2) {
		std::uint32_t bytes = window_size - ch.in_window;
		if(send_packet<ser::channel_window_adjust>(*this, ch.remote_id, bytes)) {
			ch.in_window += bytes;
		}
	}
}

void test_server::handle_request(peer_channel& ch, std::string_view name, bool reply, const_span data) {
	ch.requests.emplace_back(name);
	ch.request_data.emplace_back(data.begin(), data.end());

	bool ok = !refuse_requests.count(std::string(name));
	if(reply) {
		if(ok) {
			send_packet<ser::channel_success>(*this, ch.remote_id);
		} else {
			send_packet<ser::channel_failure>(*this, ch.remote_id);
		}
	}

	if(ok && name == "exec" && exec_reply) {
		reply_exec(ch);
	}
}

void test_server::reply_exec(peer_channel& ch) {
	auto const& r = *exec_reply;
	if(!r.out.empty()) {
		send_data(ch.id, r.out);
	}
	if(!r.err.empty()) {
		send_data(ch.id, r.err, ser::extended_stderr);
	}
	if(r.exit_status) {
		send_exit_status(ch.id, *r.exit_status);
	}
	if(r.exit_signal) {
		send_exit_signal(ch.id, *r.exit_signal);
	}
	if(r.eof) {
		send_eof(ch.id);
	}
	if(r.close) {
		send_close(ch.id);
	}
}

void test_server::flush_channel(peer_channel& ch) {
	while(!ch.pending.empty() && ch.out_window && !ch.close_sent) {
		auto& [data_type, data] = ch.pending.front();
		std::uint32_t size = std::uint32_t(std::min<std::size_t>({ch.out_window, ch.remote_max_packet, data.size()}));
		auto part = to_string_view(const_span(data).subspan(0, size));

		bool ret = data_type == 0
			? send_packet<ser::channel_data>(*this, ch.remote_id, part)
			: send_packet<ser::channel_extended_data>(*this, ch.remote_id, data_type, part);
		if(!ret) {
			return;
		}
		ch.out_window -= size;
		data.erase(data.begin(), data.begin() + size);
		if(data.empty()) {
			ch.pending.pop_front();
		}
	}

	if(ch.pending.empty()) {
		if(ch.eof_queued && !ch.eof_sent && !ch.close_sent) {
			ch.eof_sent = send_packet<ser::channel_eof>(*this, ch.remote_id);
		}
		if(ch.close_queued && !ch.close_sent) {
			ch.close_sent = send_packet<ser::channel_close>(*this, ch.remote_id);
		}
	}
}

bool test_server::send_data(channel_id id, std::string_view data, std::uint32_t data_type) {
	auto ch = find_channel(id);
	if(!ch || ch->eof_queued || ch->close_queued) {
		return false;
	}
	auto s = to_span(data);
	ch->pending.emplace_back(data_type, byte_vector(s.begin(), s.end()));
	flush_channel(*ch);
	return true;
}

bool test_server::send_eof(channel_id id) {
	auto ch = find_channel(id);
	if(!ch) {
		return false;
	}
	ch->eof_queued = true;
	flush_channel(*ch);
	return true;
}

bool test_server::send_close(channel_id id) {
	auto ch = find_channel(id);
	if(!ch) {
		return false;
	}
	ch->close_queued = true;
	flush_channel(*ch);
	return true;
}

bool test_server::send_window_adjust(channel_id id, std::uint32_t bytes) {
	auto ch = find_channel(id);
	if(!ch || !send_packet<ser::channel_window_adjust>(*this, ch->remote_id, bytes)) {
		return false;
	}
	ch->in_window += bytes;
	return true;
}

bool test_server::send_exit_status(channel_id id, std::uint32_t status) {
	auto ch = find_channel(id);
	if(!ch) {
		return false;
	}
	byte_vector payload;
	bool ret = ser::serialise_to_vector<ser::channel_request>(payload, ch->remote_id, "exit-status", false);
	ssh_bf_writer w(payload, payload.size());
	return ret && w.write(status) && send_payload(*this, payload);
}

bool test_server::send_exit_signal(channel_id id, exit_signal_info const& info) {
	auto ch = find_channel(id);
	if(!ch) {
		return false;
	}
	byte_vector payload;
	bool ret = ser::serialise_to_vector<ser::channel_request>(payload, ch->remote_id, "exit-signal", false);
	ssh_bf_writer w(payload, payload.size());
	return ret
		&& w.write(std::string_view(info.name))
		&& w.write(info.core_dumped)
		&& w.write(std::string_view(info.message))
		&& w.write(std::string_view(""))
		&& send_payload(*this, payload);
}

bool test_server::send_raw_data(channel_id id, std::string_view data) {
	auto ch = find_channel(id);
	return ch && send_packet<ser::channel_data>(*this, ch->remote_id, data);
}

bool test_server::open_channel(std::string_view type) {
	return send_packet<ser::channel_open>(*this, type, next_id_++, window_size, max_packet);
}

}
