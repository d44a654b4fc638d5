
#include "packet_types.hpp"

#include <ostream>

namespace securepath::sshc {

bool is_transport_generic_packet(ssh_packet_type t) {
	return t >= ssh_disconnect && t <= ssh_debug;
}

bool is_kex_packet(ssh_packet_type t) {
	return t >= 20 && t <= 49;
}

bool is_auth_packet(ssh_packet_type t) {
	return t >= 50 && t <= 79;
}

bool is_connection_packet(ssh_packet_type t) {
	return t >= 80 && t <= 127;
}

std::string_view to_string(ssh_packet_type t) {
	switch(t) {
		case ssh_disconnect: return "disconnect";
		case ssh_ignore: return "ignore";
		case ssh_unimplemented: return "unimplemented";
		case ssh_debug: return "debug";
		case ssh_service_request: return "service_request";
		case ssh_service_accept: return "service_accept";
		case ssh_ext_info: return "ext_info";
		case ssh_newcompress: return "newcompress";
		case ssh_kexinit: return "kexinit";
		case ssh_newkeys: return "newkeys";
		case ssh_userauth_request: return "userauth_request";
		case ssh_userauth_failure: return "userauth_failure";
		case ssh_userauth_success: return "userauth_success";
		case ssh_userauth_banner: return "userauth_banner";
		case ssh_userauth_info_request: return "userauth_info_request";
		case ssh_userauth_info_response: return "userauth_info_response";
		case ssh_global_request: return "global_request";
		case ssh_request_success: return "request_success";
		case ssh_request_failure: return "request_failure";
		case ssh_channel_open: return "channel_open";
		case ssh_channel_open_confirmation: return "channel_open_confirmation";
		case ssh_channel_open_failure: return "channel_open_failure";
		case ssh_channel_window_adjust: return "channel_window_adjust";
		case ssh_channel_data: return "channel_data";
		case ssh_channel_extended_data: return "channel_extended_data";
		case ssh_channel_eof: return "channel_eof";
		case ssh_channel_close: return "channel_close";
		case ssh_channel_request: return "channel_request";
		case ssh_channel_success: return "channel_success";
		case ssh_channel_failure: return "channel_failure";
	}
	return {};
}

std::ostream& operator<<(std::ostream& out, ssh_packet_type t) {
	auto s = to_string(t);
	if(s.empty()) {
		return out << static_cast<std::uint32_t>(t);
	}
	return out << s << "(" << static_cast<std::uint32_t>(t) << ")";
}

}
