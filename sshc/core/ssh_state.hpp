#ifndef SSHC_CORE_SSH_STATE_HEADER
#define SSHC_CORE_SSH_STATE_HEADER

#include <iosfwd>
#include <string_view>

namespace securepath::sshc {

/// transport layer state
enum class ssh_state {
	none,
	version_exchange,
	kex,
	transport,
	disconnected,
};
std::string_view to_string(ssh_state);
std::ostream& operator<<(std::ostream&, ssh_state);

enum class handler_result {
	unknown, //unknown packet type, cannot handle
	handled, //the packet was handled
	pending  //handling the packet is still in progress
};
std::string_view to_string(handler_result);

/// state of a service running on top of the transport
enum class service_state {
	none,
	inprogress,
	done,
	error
};
std::string_view to_string(service_state);

}

#endif
