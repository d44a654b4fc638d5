#ifndef SSHC_CLIENT_SESSION_HEADER
#define SSHC_CLIENT_SESSION_HEADER

#include "agent_client.hpp"
#include "byte_stream.hpp"
#include "ssh_client.hpp"

#include "sshc/common/string_buffers.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace securepath::sshc {

/// Outcome of a blocking session call
struct op_result {
	error_kind kind{error_kind::none};
	ssh_error_code code{ssh_noerror};
	std::string message;

	explicit operator bool() const { return kind == error_kind::none; }
};

/// Shared flag to cancel a blocking call from another thread
class cancel_token {
public:
	cancel_token()
	: flag_(std::make_shared<std::atomic<bool>>(false))
	{}

	void cancel() { *flag_ = true; }
	bool cancelled() const { return *flag_; }

private:
	std::shared_ptr<std::atomic<bool>> flag_;
};

struct server_host_key {
	key_type type{};
	byte_vector blob;
	std::string fingerprint;
};

/** \brief Blocking client session
 *
 *  Owns the client engine and the byte stream. The engine is not thread safe, so every call
 *  is queued to the worker thread, which pumps the input and output and steps the queued calls
 *  until they complete. Each call waits at most the session timeout (zero is no timeout), and calls
 *  taking cancel_token can be cancelled. A cancelled or timed out write drops only its own unsent
 *  data, the channel stays usable. When the connection is closed, every pending and later call
 *  gets the same terminal error.
 *
 *  The worker starts with handshake(), the configuration can be changed until then.
 */
class session {
public:
	session(client_config, logger&, std::unique_ptr<byte_stream>, crypto_context = default_crypto_context());
	~session();

	session(session const&) = delete;
	session& operator=(session const&) = delete;

	/// configuration, must not be changed after handshake()
	client_config& config() { return config_; }

	/// set the software part of our identification string
	bool set_version_software(std::string_view);

	/// set algorithm preference from comma separated list, only before handshake()
	bool method_pref(method_type, std::string_view list);

	/// names of the implemented algorithms of the category
	static std::vector<std::string_view> supported_algs(method_type);

	/// timeout for the blocking calls, zero means no timeout
	void set_timeout(std::chrono::milliseconds);
	std::chrono::milliseconds timeout() const;

public: // transport
	/// version exchange and first key exchange, returns when the authentication can start
	op_result handshake();
	op_result rekey();
	op_result disconnect(std::uint32_t reason = ssh_disconnect_by_application, std::string_view description = {}, std::string_view lang = {});

	session_state state();
	/// the server identification line
	std::string remote_banner();
	std::optional<server_host_key> host_key();
	/// negotiated algorithm of the category
	std::string methods(method_type);

	/// the error that closed the session, kind none while the session is alive
	op_result last_error();

public: // authentication
	op_result userauth(auth_credentials, std::vector<auth_type> methods);
	op_result userauth_password(std::string_view username, std::string_view password);
	op_result userauth_publickey(std::string_view username, ssh_private_key const&);
	op_result userauth_keyboard_interactive(std::string_view username, std::vector<std::string> submethods = {});
	/// public key authentication with the keys of the agent, tried in the agent's order
	op_result userauth_agent(std::string_view username, agent_client&);

	/// try "none" authentication, methods is set to the comma separated list of methods the server allows (empty if none succeeded)
	op_result auth_methods(std::string_view username, std::string& methods);

	bool authenticated();

public: // channels
	op_result channel_open(std::string_view type, std::uint32_t window, std::uint32_t packet_size, const_span message, channel_id& id);
	op_result channel_session(channel_id& id);

	/// block until all data is sent to the transport
	op_result write(channel_id, const_span data, cancel_token = {});
	op_result write_stderr(channel_id, const_span data, cancel_token = {});

	/// block until some data is available, read_size 0 means end of stream
	op_result read(channel_id, span out, std::size_t& read_size, cancel_token = {});
	op_result read_stderr(channel_id, span out, std::size_t& read_size, cancel_token = {});

	op_result send_eof(channel_id);
	op_result close(channel_id);
	/// wait until both sides have closed the channel
	op_result wait_closed(channel_id);
	/// destroy closed channel
	op_result channel_free(channel_id);

	op_result request_pty(channel_id, pty_settings const&);
	op_result env(channel_id, std::string_view name, std::string_view value);
	op_result exec(channel_id, std::string_view command);
	op_result shell(channel_id);
	op_result subsystem(channel_id, std::string_view name);
	op_result window_change(channel_id, std::uint32_t columns, std::uint32_t rows, std::uint32_t width_px = 0, std::uint32_t height_px = 0);
	op_result signal(channel_id, std::string_view name);

	std::optional<std::uint32_t> exit_status(channel_id);
	std::optional<exit_signal_info> exit_signal(channel_id);

private:
	// called on the worker thread until it returns the result, the argument is true on the first call
	using step_function = std::function<std::optional<op_result>(bool first)>;

	struct call {
		step_function step;
		// undo the partial work when the call is cancelled or times out
		std::function<void()> abort;
		std::optional<std::chrono::steady_clock::time_point> deadline;
		std::optional<cancel_token> token;
		// fails with the terminal error once the session is closed
		bool needs_connection{true};
		bool started{};
		std::promise<op_result> promise;
	};

	op_result run(step_function, std::function<void()> abort = {}, std::optional<cancel_token> = std::nullopt, bool needs_connection = true);

	template<typename Func>
	auto query(Func f) -> decltype(f());

	void start();
	void worker();
	bool pump();
	bool write_output();
	void receive(std::chrono::milliseconds wait);
	void connection_lost(std::string_view message);
	bool step_calls(std::vector<std::unique_ptr<call>>& calls);
	op_result terminal_result() const;
	bool closed() const;

	channel_stream* find_stream(channel_id);
	op_result do_userauth(auth_credentials, std::vector<auth_type> methods, std::string* allowed);
	op_result do_write(channel_id, const_span data, std::uint32_t data_type, cancel_token);
	op_result do_read(channel_id, span out, std::size_t& read_size, std::uint32_t data_type, cancel_token);
	op_result do_request(channel_id, std::function<std::optional<request_id>(channel_stream&)>);

private:
	client_config config_;
	session_logger log_;
	std::unique_ptr<byte_stream> stream_;

	// owned by the worker thread after start
	string_in_buffer in_buf_;
	string_out_buffer out_buf_;
	ssh_client client_;
	byte_vector recv_buf_;
	bool stream_closed_{};

	std::mutex mutex_;
	std::condition_variable cond_;
	std::deque<std::unique_ptr<call>> queue_;
	bool stop_{};
	std::thread thread_;

	std::atomic<std::int64_t> timeout_ms_{};
};

}

#endif
