#ifndef SSHC_TEST_UTIL_TEST_SERVER_HEADER
#define SSHC_TEST_UTIL_TEST_SERVER_HEADER

#include "test/util.hpp"
#include "sshc/core/auth/auth.hpp"
#include "sshc/core/connection/channel.hpp"
#include "sshc/core/ssh_private_key.hpp"
#include "sshc/core/ssh_transport.hpp"

#include <deque>
#include <map>
#include <optional>
#include <set>

namespace securepath::sshc::test {

/// What the test server accepts as user authentication
struct test_auth_data {
	// username -> password
	std::map<std::string, std::string> passwords;
	// accepted public key blobs
	std::vector<byte_vector> keys;
	// sent in every failure message
	std::vector<std::string> methods{"publickey", "password", "keyboard-interactive"};
	bool accept_none{};
	// sent before the first reply when not empty
	std::string banner;

	// keyboard-interactive prompts and the expected answers
	interactive_request interactive{"test", "answer the questions", {}};
	std::vector<std::string> answers;

	void add_password(std::string const& user, std::string password) {
		passwords[user] = std::move(password);
	}
	void add_key(byte_vector blob) {
		keys.push_back(std::move(blob));
	}
};

/// host key with its public key blob
struct test_host_key {
	ssh_private_key key;
	byte_vector blob;
};

struct test_exec_reply {
	std::string out;
	std::string err;
	std::optional<std::uint32_t> exit_status{0};
	std::optional<exit_signal_info> exit_signal;
	bool eof{true};
	bool close{true};
};

/// Server side of one channel as seen by the test server
struct peer_channel {
	channel_id id{};
	channel_id remote_id{};
	std::string type;

	// what we can still send to the client
	std::uint32_t out_window{};
	std::uint32_t remote_max_packet{};
	// what the client can still send to us
	std::uint32_t in_window{};

	byte_vector data;
	byte_vector ext_data;
	// our data waiting for window, with the data type
	std::deque<std::pair<std::uint32_t, byte_vector>> pending;
	bool eof_queued{};
	bool close_queued{};

	std::vector<std::string> requests;
	std::vector<byte_vector> request_data;

	bool window_exceeded{};
	bool eof_received{};
	bool close_received{};
	bool eof_sent{};
	bool close_sent{};
};

/** \brief Scripted responder for driving the client in tests
 *
 *  Runs the server side of the key exchange with the ed25519 and rsa test host keys, accepts the
 *  user auth service, checks the credentials from test_auth_data (publickey signatures are
 *  verified) and acts as the remote end of the channels.
 */
class test_server : public test_context, public ssh_config, public ssh_transport {
public:
	test_server(logger& l = test_log(), ssh_config c = test_server_config(), std::size_t max_out_size = -1);

	bool authenticated() const { return authenticated_; }
	std::string const& authenticated_user() const { return user_; }

	// channels are identified by the server side id
	peer_channel* find_channel(channel_id);
	peer_channel* last_channel();

	/// queue data and send what the window allows
	bool send_data(channel_id, std::string_view data, std::uint32_t data_type = 0);
	/// eof and close are sent after the queued data
	bool send_eof(channel_id);
	bool send_close(channel_id);
	bool send_window_adjust(channel_id, std::uint32_t bytes);
	bool send_exit_status(channel_id, std::uint32_t status);
	bool send_exit_signal(channel_id, exit_signal_info const&);
	/// data packet ignoring our bookkeeping of the client window
	bool send_raw_data(channel_id, std::string_view data);
	/// server initiated channel open, the client should refuse
	bool open_channel(std::string_view type);

	bool send_raw_payload(const_span payload) { return send_payload(*this, payload); }

	/// replace the host keys, the offered host key algorithms follow the keys
	bool set_host_keys(std::vector<ssh_private_key>);

public:
	test_auth_data auth_data;
	// services we accept
	std::set<std::string> services{"ssh-userauth"};

	// channel handling
	bool refuse_open{};
	std::uint32_t window_size{2*1024*1024};
	std::uint32_t max_packet{32*1024};
	// adjust the window for the client when half used, otherwise only by send_window_adjust
	bool auto_adjust{true};
	std::set<std::string> refuse_requests;
	// reply to exec with this
	std::optional<test_exec_reply> exec_reply;

	// counters and results for the tests
	std::size_t pk_query_count{};
	std::size_t pk_signed_count{};
	std::size_t pk_verified_count{};
	std::size_t auth_request_count{};
	std::vector<std::string> auth_methods_seen;
	std::vector<std::string> interactive_answers;
	std::vector<std::uint32_t> open_failures;
	std::vector<std::string> service_requests;

	std::map<channel_id, peer_channel> channels;

protected:
	handler_result handle_transport_packet(ssh_packet_type, const_span payload) override;
	kexinit_result agree_algorithms(kexinit_offer const& remote) override;
	std::unique_ptr<kex> create_kex(kex_type, kex_context) override;

private:
	void handle_service_request(const_span payload);
	void handle_auth_request(const_span payload);
	void handle_info_response(const_span payload);
	bool handle_pk(std::string_view user, const_span payload, ssh_bf_reader& r);
	void auth_success(std::string_view user);
	void auth_failure();

	void handle_connection(ssh_packet_type, const_span payload);
	void handle_open(const_span payload);
	void handle_data(std::uint32_t data_type, peer_channel&, std::string_view data);
	void handle_request(peer_channel&, std::string_view name, bool reply, const_span data);
	void reply_exec(peer_channel&);
	void flush_channel(peer_channel&);

private:
	bool add_host_key(ssh_private_key);

private:
	std::vector<test_host_key> host_keys_;
	bool authenticated_{};
	bool banner_sent_{};
	std::string user_;
	std::optional<std::string> interactive_user_;
	channel_id next_id_{100};
	channel_id last_id_{};
};

}

#endif
