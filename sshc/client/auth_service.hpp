#ifndef SSHC_CLIENT_AUTH_SERVICE_HEADER
#define SSHC_CLIENT_AUTH_SERVICE_HEADER

#include "client_config.hpp"
#include "sshc/common/logger.hpp"
#include "sshc/core/auth/auth.hpp"
#include "sshc/core/service/ssh_service.hpp"
#include "sshc/core/ssh_private_key.hpp"

#include <deque>
#include <optional>

namespace securepath::sshc {

class transport_base;

/// What we authenticate with, the password and keys are never logged
struct auth_credentials {
	std::string username;
	std::string password;
	std::vector<ssh_private_key> keys;
	std::vector<std::string> submethods;
};

enum class auth_status {
	none,          // nothing requested yet
	inprogress,    // attempts queued or waiting for reply
	authenticated,
	failed         // all attempts of the episode were used, see failure()
};

std::string_view to_string(auth_status);

/** \brief Client side of the user authentication protocol (RFC 4252, RFC 4256)
 *
 *  authenticate() queues one attempt per method (one per key for publickey) in the given order.
 *  Attempts are sent one at a time, and after the server has told which methods can continue,
 *  attempts for other methods are skipped. Running out of attempts ends the episode with
 *  auth_status::failed, which is not fatal: authenticate() can be called again.
 */
class client_auth_service : public ssh_service {
public:
	client_auth_service(transport_base& transport, client_config const&);

	std::string_view name() const override;
	service_state state() const override;
	bool init() override;
	handler_result process(ssh_packet_type, const_span payload) override;

public:
	/// start new authentication episode, returns false if one is already running or the input is invalid
	bool authenticate(auth_credentials, std::vector<auth_type> methods);

	auth_status status() const { return status_; }
	bool authenticated() const { return status_ == auth_status::authenticated; }

	/// result of the last failed episode
	auth_failure_info const& failure() const { return failure_; }

	/// methods the server allows to continue with, empty before the first failure message
	std::vector<std::string> const& allowed_methods() const { return failure_.allowed; }

	/// number of signatures made during the session, publickey attempts sign only after the server accepted the key
	std::size_t signature_count() const { return signature_count_; }

private:
	struct auth_attempt {
		auth_type type{};
		// for publickey
		ssh_private_key key;
		bool signature_sent{};
	};

	void next();
	bool allowed(auth_type) const;
	bool send_attempt(auth_attempt&);
	bool send_pk_query(ssh_private_key const&);
	bool send_pk_signed(ssh_private_key const&);
	bool send_interactive_response(std::vector<std::string> const& results);

	void handle_banner(const_span payload);
	void handle_success();
	void handle_failure(const_span payload);
	void handle_pk_ok(const_span payload);
	void handle_change_password(const_span payload);
	handler_result handle_interactive_request(const_span payload);

	void protocol_error(std::string_view message);

private:
	transport_base& transport_;
	logger& log_;
	client_config const& config_;
	service_state state_{service_state::none};

	auth_status status_{auth_status::none};
	auth_credentials credentials_;
	std::deque<auth_attempt> attempts_;
	std::optional<auth_attempt> current_;
	auth_failure_info failure_;
	bool have_allowed_{};

	std::size_t signature_count_{};
};

}

#endif
