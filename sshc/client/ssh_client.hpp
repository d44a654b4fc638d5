#ifndef SSHC_CLIENT_SSH_CLIENT_HEADER
#define SSHC_CLIENT_SSH_CLIENT_HEADER

#include "auth_service.hpp"
#include "client_config.hpp"
#include "sshc/core/ssh_transport.hpp"
#include "sshc/core/connection/ssh_connection.hpp"

#include <memory>

namespace securepath::sshc {

/// session lifecycle as seen by the application
enum class session_state {
	connecting,     // version exchange
	key_exchange,   // first key exchange
	authenticating,
	authenticated,
	rekeying,
	closing,        // disconnected, output still pending
	closed
};

std::string_view to_string(session_state);

/** \brief SSH Version 2 Client side
 *
 *  Requests the user authentication service after the first key exchange and starts the
 *  connection service once the user is authenticated. Channels exist only after that.
 */
class ssh_client : public ssh_transport {
public:
	ssh_client(client_config const&, logger& log, out_buffer&, crypto_context = default_crypto_context());
	~ssh_client();

	session_state current_state() const;

	client_config const& client_configuration() const { return config_; }

	/// queue authentication attempts, can be called before the auth service is accepted
	bool authenticate(auth_credentials, std::vector<auth_type> methods);
	bool authenticated() const;

	client_auth_service& auth() { return auth_; }
	client_auth_service const& auth() const { return auth_; }

	/// connection protocol, nullptr until authenticated
	ssh_connection* connection() { return connection_.get(); }

	/// negotiated algorithm name of the category, empty before the first key exchange
	std::string_view methods(method_type) const;

	/// server host key of the last key exchange
	key_type host_key_type() const;
	std::string host_key_fingerprint() const;

protected:
	void on_state_change(ssh_state old_s, ssh_state new_s) override;

	handler_result handle_kex_done(kex const&) override;
	handler_result handle_transport_packet(ssh_packet_type, const_span payload) override;
	bool flush() override;

	handler_result handle_service_accept(const_span payload);
	handler_result process_auth(ssh_packet_type type, const_span payload);
	handler_result process_connection(ssh_packet_type type, const_span payload);

private:
	handler_result check_host_key(kex const&);
	void start_connection();

protected:
	client_config const& config_;
	client_auth_service auth_;
	std::unique_ptr<ssh_connection> connection_;

	bool requesting_auth_{};
	bool auth_accepted_{};
};

}

#endif
