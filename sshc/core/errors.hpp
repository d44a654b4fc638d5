#ifndef SSHC_CORE_ERRORS_HEADER
#define SSHC_CORE_ERRORS_HEADER

#include "sshc/common/types.hpp"

#include <iosfwd>

namespace securepath::sshc {

enum ssh_error_code : std::uint32_t {
	ssh_noerror                        = 0,
	ssh_host_not_allowed_to_connect    = 1,
	ssh_protocol_error                 = 2,
	ssh_key_exchange_failed            = 3,
	ssh_reserved                       = 4,
	ssh_mac_error                      = 5,
	ssh_compression_error              = 6,
	ssh_service_not_available          = 7,
	ssh_protocol_version_not_supported = 8,
	ssh_host_key_not_verifiable        = 9,
	ssh_connection_lost                = 10,
	ssh_disconnect_by_application      = 11,
	ssh_too_many_connections           = 12,
	ssh_auth_cancelled_by_user         = 13,
	ssh_no_more_auth_methods_available = 14,
	ssh_illegal_user_name              = 15,

	//0x00000010-0xFDFFFFFF	Unassigned
	//0xFE000000-0xFFFFFFFF	Reserved for Private Use

	// local errors, never sent to the peer as such
	sshc_invalid_setup                 = 0xFFFF0001,
	sshc_memory_error                  = 0xFFFF0002,
	sshc_invalid_packet                = 0xFFFF0003,
	sshc_crypto_error                  = 0xFFFF0004,
	sshc_invalid_data                  = 0xFFFF0005,
	sshc_no_common_algorithm           = 0xFFFF0006,
	sshc_window_violation              = 0xFFFF0007,
	sshc_auth_failed                   = 0xFFFF0008,
	sshc_open_failed                   = 0xFFFF0009,
	sshc_timeout                       = 0xFFFF000A,
	sshc_cancelled                     = 0xFFFF000B,
	sshc_invalid_state                 = 0xFFFF000C,
	sshc_request_failed                = 0xFFFF000D
};

std::string_view to_string(ssh_error_code);

/** \brief Error classes as seen by the application
 *
 *  Fatal kinds close the whole connection and are reported to every pending call,
 *  the rest are reported only to the call that caused them.
 */
enum class error_kind {
	none,
	frame_error,
	kex_failure,
	auth_failure,
	open_failure,
	window_violation,
	timeout,
	cancelled,
	request_failure,
	invalid_state,
	// connection closed by either side, or lost
	disconnected
};

std::string_view to_string(error_kind);
std::ostream& operator<<(std::ostream&, error_kind);

error_kind kind_of(ssh_error_code);
bool is_fatal(error_kind);

/// Code that is sent in the disconnect packet when closing because of the given local error
ssh_error_code disconnect_code(ssh_error_code);

}

#endif
