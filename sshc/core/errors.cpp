#include "errors.hpp"

#include <ostream>

namespace securepath::sshc {

std::string_view to_string(ssh_error_code c) {
	switch(c) {
		case ssh_noerror: return "no error";
		case ssh_host_not_allowed_to_connect: return "host not allowed to connect";
		case ssh_protocol_error: return "protocol error";
		case ssh_key_exchange_failed: return "key exchange failed";
		case ssh_reserved: return "reserved";
		case ssh_mac_error: return "mac error";
		case ssh_compression_error: return "compression error";
		case ssh_service_not_available: return "service not available";
		case ssh_protocol_version_not_supported: return "protocol version not supported";
		case ssh_host_key_not_verifiable: return "host key not verifiable";
		case ssh_connection_lost: return "connection lost";
		case ssh_disconnect_by_application: return "disconnect by application";
		case ssh_too_many_connections: return "too many connections";
		case ssh_auth_cancelled_by_user: return "auth cancelled by user";
		case ssh_no_more_auth_methods_available: return "no more auth methods available";
		case ssh_illegal_user_name: return "illegal user name";
		case sshc_invalid_setup: return "invalid setup";
		case sshc_memory_error: return "memory error";
		case sshc_invalid_packet: return "invalid packet";
		case sshc_crypto_error: return "crypto error";
		case sshc_invalid_data: return "invalid data";
		case sshc_no_common_algorithm: return "no common algorithm";
		case sshc_window_violation: return "window violation";
		case sshc_auth_failed: return "authentication failed";
		case sshc_open_failed: return "channel open failed";
		case sshc_timeout: return "timeout";
		case sshc_cancelled: return "cancelled";
		case sshc_invalid_state: return "invalid state";
		case sshc_request_failed: return "request failed";
	}
	return "unknown error";
}

std::string_view to_string(error_kind k) {
	using enum error_kind;
	switch(k) {
		case none: return "none";
		case frame_error: return "frame error";
		case kex_failure: return "kex failure";
		case auth_failure: return "auth failure";
		case open_failure: return "open failure";
		case window_violation: return "window violation";
		case timeout: return "timeout";
		case cancelled: return "cancelled";
		case request_failure: return "request failure";
		case invalid_state: return "invalid state";
		case disconnected: return "disconnected";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, error_kind k) {
	return out << to_string(k);
}

error_kind kind_of(ssh_error_code c) {
	switch(c) {
		case ssh_noerror:
			return error_kind::none;
		case ssh_mac_error:
		case sshc_invalid_packet:
		case sshc_crypto_error:
			return error_kind::frame_error;
		case ssh_key_exchange_failed:
		case ssh_host_key_not_verifiable:
		case sshc_no_common_algorithm:
			return error_kind::kex_failure;
		case ssh_no_more_auth_methods_available:
		case ssh_auth_cancelled_by_user:
		case sshc_auth_failed:
			return error_kind::auth_failure;
		case sshc_open_failed:
			return error_kind::open_failure;
		case sshc_window_violation:
			return error_kind::window_violation;
		case sshc_timeout:
			return error_kind::timeout;
		case sshc_cancelled:
			return error_kind::cancelled;
		case sshc_request_failed:
			return error_kind::request_failure;
		case sshc_invalid_state:
			return error_kind::invalid_state;
		default: break;
	}
	return error_kind::disconnected;
}

bool is_fatal(error_kind k) {
	switch(k) {
		case error_kind::frame_error:
		case error_kind::kex_failure:
		case error_kind::window_violation:
		case error_kind::disconnected:
			return true;
		default: break;
	}
	return false;
}

ssh_error_code disconnect_code(ssh_error_code c) {
	switch(c) {
		case sshc_invalid_packet:
		case sshc_invalid_data:
		case sshc_window_violation:
			return ssh_protocol_error;
		case sshc_crypto_error:
			return ssh_mac_error;
		case sshc_no_common_algorithm:
			return ssh_key_exchange_failed;
		default: break;
	}
	return c < sshc_invalid_setup ? c : ssh_disconnect_by_application;
}

}
