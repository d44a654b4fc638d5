#include "session.hpp"

#include "sshc/core/protocol_helpers.hpp"

namespace securepath::sshc {

namespace {

// how long the worker waits for input when nothing else is happening
std::chrono::milliseconds const poll_interval{10};

std::size_t const receive_buffer_size = 32*1024;

op_result no_channel(channel_id id) {
	return op_result{error_kind::invalid_state, sshc_invalid_state, simple_format("no such channel [id={}]", id)};
}

op_result invalid_state(std::string message) {
	return op_result{error_kind::invalid_state, sshc_invalid_state, std::move(message)};
}

std::string join(std::vector<std::string> const& names) {
	std::string res;
	for(auto const& n : names) {
		if(!res.empty()) {
			res += ',';
		}
		res += n;
	}
	return res;
}

}

session::session(client_config conf, logger& log, std::unique_ptr<byte_stream> stream, crypto_context cc)
: config_(std::move(conf))
, log_(log, "[session] ")
, stream_(std::move(stream))
, client_(config_, log_, out_buf_, std::move(cc))
, recv_buf_(receive_buffer_size)
{
	SSHC_ASSERT(stream_, "session requires byte stream");
}

session::~session() {
	{
		std::lock_guard lock(mutex_);
		stop_ = true;
	}
	cond_.notify_all();
	if(thread_.joinable()) {
		thread_.join();
	}
	if(!stream_closed_) {
		stream_->close();
	}
}

bool session::set_version_software(std::string_view s) {
	std::lock_guard lock(mutex_);
	if(thread_.joinable() || s.empty()) {
		return false;
	}
	config_.my_version.software = std::string(s);
	return true;
}

bool session::method_pref(method_type t, std::string_view list) {
	std::lock_guard lock(mutex_);
	if(thread_.joinable()) {
		return false;
	}
	return config_.algorithms.set_preference(t, list);
}

std::vector<std::string_view> session::supported_algs(method_type t) {
	return supported_algorithm_names(t);
}

void session::set_timeout(std::chrono::milliseconds t) {
	timeout_ms_ = t.count();
}

std::chrono::milliseconds session::timeout() const {
	return std::chrono::milliseconds(timeout_ms_.load());
}

void session::start() {
	std::lock_guard lock(mutex_);
	if(!thread_.joinable() && !stop_) {
		log_.log(logger::debug, "starting session worker [timeout={}ms]", timeout_ms_.load());
		thread_ = std::thread([this]{ worker(); });
	}
}

op_result session::run(step_function step, std::function<void()> abort, std::optional<cancel_token> token, bool needs_connection) {
	auto c = std::make_unique<call>();
	c->step = std::move(step);
	c->abort = std::move(abort);
	c->token = std::move(token);
	c->needs_connection = needs_connection;

	auto t = timeout_ms_.load();
	if(t > 0) {
		c->deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(t);
	}

	auto result = c->promise.get_future();
	{
		std::lock_guard lock(mutex_);
		if(!thread_.joinable() || stop_) {
			return invalid_state("session is not running");
		}
		queue_.push_back(std::move(c));
	}
	cond_.notify_one();
	return result.get();
}

template<typename Func>
auto session::query(Func f) -> decltype(f()) {
	bool running{};
	{
		std::lock_guard lock(mutex_);
		running = thread_.joinable();
	}
	if(!running) {
		return f();
	}
	decltype(f()) value{};
	op_result res = run([&](bool) -> std::optional<op_result> {
			value = f();
			return op_result{};
		}, {}, std::nullopt, false);

	if(!res) {
		log_.log(logger::debug, "session query failed [{}]", res.message);
	}
	return value;
}

void session::worker() {
	std::vector<std::unique_ptr<call>> calls;
	for(;;) {
		{
			std::lock_guard lock(mutex_);
			if(stop_) {
				break;
			}
			for(; !queue_.empty(); queue_.pop_front()) {
				calls.push_back(std::move(queue_.front()));
			}
		}

		bool progress = pump();
		progress = step_calls(calls) || progress;

		if(!stream_closed_) {
			receive(progress ? std::chrono::milliseconds(0) : poll_interval);
		} else if(!progress) {
			std::unique_lock lock(mutex_);
			cond_.wait_for(lock, poll_interval, [&]{ return stop_ || !queue_.empty(); });
		}
	}

	if(!stream_closed_ && !closed()) {
		log_.log(logger::debug, "session destroyed while connected, disconnecting");
		client_.disconnect(ssh_disconnect_by_application, "session closed");
		pump();
	}

	op_result res{error_kind::disconnected, ssh_disconnect_by_application, "session destroyed"};
	for(auto& c : calls) {
		c->promise.set_value(res);
	}
	std::lock_guard lock(mutex_);
	for(auto& c : queue_) {
		c->promise.set_value(res);
	}
	queue_.clear();
}

bool session::pump() {
	if(stream_closed_) {
		return false;
	}
	bool progress = false;
	for(bool more = true; more && !stream_closed_;) {
		std::size_t in_size = in_buf_.size();
		auto op = client_.process(in_buf_);
		bool wrote = write_output();

		more = wrote || in_buf_.size() != in_size;
		progress = progress || more;

		if(op == transport_op::disconnected && !stream_closed_ && !client_.output_pending()) {
			log_.log(logger::info, "session disconnected [error={}, msg={}]", client_.error(), client_.error_message());
			stream_->close();
			stream_closed_ = true;
			progress = true;
		}
	}
	return progress;
}

bool session::write_output() {
	if(out_buf_.empty()) {
		return false;
	}
	std::string data = out_buf_.extract_committed();
	log_.log(logger::debug_trace, "session writing [size={}]", data.size());
	if(!stream_->send(to_span(data))) {
		connection_lost("failed to write to stream");
	}
	return true;
}

void session::receive(std::chrono::milliseconds wait) {
	auto res = stream_->receive(recv_buf_, wait);
	if(!res) {
		connection_lost("stream closed");
	} else if(*res) {
		log_.log(logger::debug_trace, "session received [size={}]", *res);
		in_buf_.add(const_span{recv_buf_.data(), *res});
	}
}

void session::connection_lost(std::string_view message) {
	log_.log(logger::info, "connection lost [{}]", message);
	if(client_.state() != ssh_state::disconnected) {
		client_.set_error(ssh_connection_lost, message);
		client_.set_state(ssh_state::disconnected);
	}
	stream_->close();
	stream_closed_ = true;
}

bool session::closed() const {
	return client_.state() == ssh_state::disconnected;
}

op_result session::terminal_result() const {
	ssh_error_code code = client_.error();
	if(code == ssh_noerror) {
		return op_result{error_kind::disconnected, ssh_disconnect_by_application, "session closed"};
	}
	error_kind kind = kind_of(code);
	if(!is_fatal(kind)) {
		kind = error_kind::disconnected;
	}
	std::string message = client_.error_message();
	if(message.empty()) {
		message = std::string(to_string(code));
	}
	return op_result{kind, code, std::move(message)};
}

bool session::step_calls(std::vector<std::unique_ptr<call>>& calls) {
	bool progress = false;
	auto now = std::chrono::steady_clock::now();
	for(auto it = calls.begin(); it != calls.end();) {
		call& c = **it;
		std::optional<op_result> res;

		if(c.needs_connection && closed()) {
			res = terminal_result();
		} else if(c.token && c.token->cancelled()) {
			if(c.abort) {
				c.abort();
			}
			res = op_result{error_kind::cancelled, sshc_cancelled, "call cancelled"};
		} else {
			bool first = !c.started;
			c.started = true;
			res = c.step(first);
			if(!res && c.deadline && now >= *c.deadline) {
				if(c.abort) {
					c.abort();
				}
				res = op_result{error_kind::timeout, sshc_timeout, "call timed out"};
			}
		}

		if(res) {
			if(res->kind != error_kind::none) {
				log_.log(logger::debug, "session call failed [kind={}, code={}, msg={}]", res->kind, res->code, res->message);
			}
			c.promise.set_value(std::move(*res));
			it = calls.erase(it);
			progress = true;
		} else {
			++it;
		}
	}
	return progress;
}

op_result session::handshake() {
	start();
	return run([this](bool) -> std::optional<op_result> {
		auto s = client_.current_state();
		if(s == session_state::authenticating || s == session_state::authenticated
			|| (s == session_state::rekeying && client_.kex_count() > 0))
		{
			log_.log(logger::info, "handshake done [kex={}, host key={}]", client_.methods(method_type::kex), client_.methods(method_type::host_key));
			return op_result{};
		}
		return std::nullopt;
	});
}

op_result session::rekey() {
	std::size_t target{};
	return run([this, target](bool first) mutable -> std::optional<op_result> {
		if(first) {
			target = client_.kex_count() + 1;
			if(!client_.request_rekey()) {
				return invalid_state("cannot start key exchange");
			}
		}
		if(client_.kex_count() >= target) {
			return op_result{};
		}
		return std::nullopt;
	});
}

op_result session::disconnect(std::uint32_t reason, std::string_view description, std::string_view lang) {
	{
		std::lock_guard lock(mutex_);
		if(!thread_.joinable()) {
			// nothing was sent yet
			if(!stream_closed_) {
				stream_->close();
				stream_closed_ = true;
			}
			return op_result{};
		}
	}
	return run([this, reason, desc = std::string(description), l = std::string(lang)](bool first) -> std::optional<op_result> {
		if(first && !closed()) {
			client_.disconnect(reason, desc, l);
		}
		if(stream_closed_) {
			return op_result{};
		}
		return std::nullopt;
	}, {}, std::nullopt, false);
}

session_state session::state() {
	return query([this]{ return client_.current_state(); });
}

std::string session::remote_banner() {
	return query([this]{
		auto const& v = client_.remote_version();
		return v.ssh.empty() ? std::string() : to_string(v);
	});
}

std::optional<server_host_key> session::host_key() {
	return query([this]() -> std::optional<server_host_key> {
		auto const& blob = client_.server_host_key_blob();
		if(blob.empty()) {
			return std::nullopt;
		}
		return server_host_key{client_.host_key_type(), blob, client_.host_key_fingerprint()};
	});
}

std::string session::methods(method_type t) {
	return query([this, t]{ return std::string(client_.methods(t)); });
}

op_result session::last_error() {
	return query([this]{ return closed() ? terminal_result() : op_result{}; });
}

op_result session::do_userauth(auth_credentials creds, std::vector<auth_type> methods, std::string* allowed) {
	return run([this, creds = std::move(creds), methods = std::move(methods), allowed](bool first) mutable -> std::optional<op_result> {
		if(first) {
			if(client_.authenticated()) {
				return invalid_state("already authenticated");
			}
			if(!client_.authenticate(std::move(creds), std::move(methods))) {
				return invalid_state("cannot start authentication");
			}
		}

		auto const& auth = client_.auth();
		if(auth.status() == auth_status::authenticated) {
			if(allowed) {
				allowed->clear();
			}
			return op_result{};
		}
		if(auth.status() == auth_status::failed) {
			auto const& f = auth.failure();
			if(allowed) {
				*allowed = join(f.allowed);
				return op_result{};
			}
			return op_result{error_kind::auth_failure, sshc_auth_failed,
				simple_format("authentication failed [tried={}, partial={}, allowed={}]", to_string(f.tried), to_string(f.partial), join(f.allowed))};
		}
		return std::nullopt;
	});
}

op_result session::userauth(auth_credentials creds, std::vector<auth_type> methods) {
	return do_userauth(std::move(creds), std::move(methods), nullptr);
}

op_result session::userauth_password(std::string_view username, std::string_view password) {
	auth_credentials creds;
	creds.username = std::string(username);
	creds.password = std::string(password);
	return do_userauth(std::move(creds), {auth_type::password}, nullptr);
}

op_result session::userauth_publickey(std::string_view username, ssh_private_key const& key) {
	auth_credentials creds;
	creds.username = std::string(username);
	creds.keys.push_back(key);
	return do_userauth(std::move(creds), {auth_type::public_key}, nullptr);
}

op_result session::userauth_keyboard_interactive(std::string_view username, std::vector<std::string> submethods) {
	auth_credentials creds;
	creds.username = std::string(username);
	creds.submethods = std::move(submethods);
	return do_userauth(std::move(creds), {auth_type::interactive}, nullptr);
}

op_result session::userauth_agent(std::string_view username, agent_client& agent) {
	auth_credentials creds;
	creds.username = std::string(username);
	creds.keys = query([&] {
			return agent.signing_keys(client_.crypto(), client_.call_context());
		});
	if(creds.keys.empty()) {
		return op_result{error_kind::auth_failure, sshc_auth_failed, "agent has no usable keys"};
	}
	return do_userauth(std::move(creds), {auth_type::public_key}, nullptr);
}

op_result session::auth_methods(std::string_view username, std::string& methods) {
	auth_credentials creds;
	creds.username = std::string(username);
	return do_userauth(std::move(creds), {auth_type::none}, &methods);
}

bool session::authenticated() {
	return query([this]{ return client_.authenticated(); });
}

channel_stream* session::find_stream(channel_id id) {
	auto conn = client_.connection();
	return conn ? dynamic_cast<channel_stream*>(conn->find_channel(id)) : nullptr;
}

op_result session::channel_open(std::string_view type, std::uint32_t window, std::uint32_t packet_size, const_span message, channel_id& id) {
	return run([this, t = std::string(type), window, packet_size, extra = byte_vector(message.begin(), message.end()), &id](bool first) -> std::optional<op_result> {
		if(first) {
			auto conn = client_.connection();
			if(!conn) {
				return invalid_state("not authenticated");
			}
			auto ch = conn->open_stream(t, window, packet_size, extra);
			if(!ch) {
				return invalid_state(simple_format("failed to open channel [type={}]", t));
			}
			id = ch->id();
		}

		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(ch->state() == channel_state::established) {
			return op_result{};
		}
		if(ch->state() == channel_state::closed) {
			if(auto const& f = ch->open_failure()) {
				return op_result{error_kind::open_failure, sshc_open_failed, simple_format("{} (reason {})", f->description, f->code)};
			}
			return op_result{error_kind::open_failure, sshc_open_failed, "channel closed while opening"};
		}
		return std::nullopt;
	});
}

op_result session::channel_session(channel_id& id) {
	return channel_open("session", config_.channel.initial_window_size, config_.channel.max_packet_size, {}, id);
}

op_result session::do_write(channel_id id, const_span data, std::uint32_t data_type, cancel_token token) {
	auto sid = std::make_shared<std::optional<send_id>>();
	return run([this, id, data, data_type, sid](bool first) -> std::optional<op_result> {
		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(first) {
			*sid = ch->send_data(data, data_type);
			if(!*sid) {
				return invalid_state(simple_format("channel not writable [id={}]", id));
			}
		}
		if(ch->send_dropped(**sid)) {
			return invalid_state(simple_format("channel closed before all data was sent [id={}]", id));
		}
		if(ch->send_done(**sid)) {
			return op_result{};
		}
		return std::nullopt;
	}, [this, id, sid]{
		auto ch = find_stream(id);
		if(ch && *sid) {
			ch->cancel_send(**sid);
		}
	}, std::move(token));
}

op_result session::write(channel_id id, const_span data, cancel_token token) {
	return do_write(id, data, 0, std::move(token));
}

op_result session::write_stderr(channel_id id, const_span data, cancel_token token) {
	return do_write(id, data, ser::extended_stderr, std::move(token));
}

op_result session::do_read(channel_id id, span out, std::size_t& read_size, std::uint32_t data_type, cancel_token token) {
	read_size = 0;
	return run([this, id, out, &read_size, data_type](bool) -> std::optional<op_result> {
		auto ch = find_stream(id);
		// freed channel reads as end of stream
		if(!ch || out.empty()) {
			return op_result{};
		}
		auto r = ch->read(out, data_type);
		if(r.size || r.eos) {
			read_size = r.size;
			return op_result{};
		}
		return std::nullopt;
	}, {}, std::move(token));
}

op_result session::read(channel_id id, span out, std::size_t& read_size, cancel_token token) {
	return do_read(id, out, read_size, 0, std::move(token));
}

op_result session::read_stderr(channel_id id, span out, std::size_t& read_size, cancel_token token) {
	return do_read(id, out, read_size, ser::extended_stderr, std::move(token));
}

op_result session::send_eof(channel_id id) {
	return run([this, id](bool first) -> std::optional<op_result> {
		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(first && !ch->send_eof()) {
			return invalid_state(simple_format("cannot send eof [id={}]", id));
		}
		if(ch->eof_sent() || ch->state() == channel_state::closed) {
			return op_result{};
		}
		return std::nullopt;
	});
}

op_result session::close(channel_id id) {
	return run([this, id](bool first) -> std::optional<op_result> {
		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(first && !ch->send_close()) {
			return invalid_state(simple_format("cannot close channel [id={}]", id));
		}
		if(ch->close_sent() || ch->state() == channel_state::closed) {
			return op_result{};
		}
		return std::nullopt;
	});
}

op_result session::wait_closed(channel_id id) {
	return run([this, id](bool) -> std::optional<op_result> {
		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(ch->state() == channel_state::closed) {
			return op_result{};
		}
		return std::nullopt;
	});
}

op_result session::channel_free(channel_id id) {
	return run([this, id](bool) -> std::optional<op_result> {
		auto conn = client_.connection();
		if(!conn || !conn->remove_channel(id)) {
			return invalid_state(simple_format("channel not closed [id={}]", id));
		}
		return op_result{};
	}, {}, std::nullopt, false);
}

op_result session::do_request(channel_id id, std::function<std::optional<request_id>(channel_stream&)> send) {
	auto rid = std::make_shared<std::optional<request_id>>();
	return run([this, id, send = std::move(send), rid](bool first) -> std::optional<op_result> {
		auto ch = find_stream(id);
		if(!ch) {
			return no_channel(id);
		}
		if(first) {
			*rid = send(*ch);
			if(!*rid) {
				return invalid_state(simple_format("cannot send channel request [id={}]", id));
			}
		}
		switch(ch->request_result(**rid)) {
			case request_status::succeeded:
				return op_result{};
			case request_status::failed:
				return op_result{error_kind::request_failure, sshc_request_failed, simple_format("channel request failed [id={}]", id)};
			default: break;
		}
		return std::nullopt;
	});
}

op_result session::request_pty(channel_id id, pty_settings const& pty) {
	return do_request(id, [pty](channel_stream& ch) { return ch.request_pty(pty); });
}

op_result session::env(channel_id id, std::string_view name, std::string_view value) {
	return do_request(id, [n = std::string(name), v = std::string(value)](channel_stream& ch) { return ch.request_env(n, v); });
}

op_result session::exec(channel_id id, std::string_view command) {
	return do_request(id, [c = std::string(command)](channel_stream& ch) { return ch.request_exec(c); });
}

op_result session::shell(channel_id id) {
	return do_request(id, [](channel_stream& ch) { return ch.request_shell(); });
}

op_result session::subsystem(channel_id id, std::string_view name) {
	return do_request(id, [n = std::string(name)](channel_stream& ch) { return ch.request_subsystem(n); });
}

op_result session::window_change(channel_id id, std::uint32_t columns, std::uint32_t rows, std::uint32_t width_px, std::uint32_t height_px) {
	return do_request(id, [=](channel_stream& ch) { return ch.request_window_change(columns, rows, width_px, height_px); });
}

op_result session::signal(channel_id id, std::string_view name) {
	return do_request(id, [n = std::string(name)](channel_stream& ch) { return ch.request_signal(n); });
}

std::optional<std::uint32_t> session::exit_status(channel_id id) {
	return query([this, id]() -> std::optional<std::uint32_t> {
		auto ch = find_stream(id);
		return ch ? ch->exit_status() : std::nullopt;
	});
}

std::optional<exit_signal_info> session::exit_signal(channel_id id) {
	return query([this, id]() -> std::optional<exit_signal_info> {
		auto ch = find_stream(id);
		return ch ? ch->exit_signal() : std::nullopt;
	});
}

}
