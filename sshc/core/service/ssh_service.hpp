#ifndef SSHC_CORE_SERVICE_HEADER
#define SSHC_CORE_SERVICE_HEADER

#include "sshc/core/errors.hpp"
#include "sshc/core/packet_ser.hpp"
#include "sshc/core/packet_types.hpp"
#include "sshc/core/ssh_state.hpp"

namespace securepath::sshc {

/// Service running on top of the transport (user authentication or connection protocol)
class ssh_service {
public:
	virtual ~ssh_service() = default;

	virtual std::string_view name() const = 0;
	virtual service_state state() const = 0;

	// called when the peer accepted the service (this function can send packets specific to the service)
	virtual bool init() = 0;

	// process a packet from network, payload starts after the message number
	virtual handler_result process(ssh_packet_type, const_span payload) = 0;

	// try to send buffered data, returns true if there is still more to send
	virtual bool flush() { return false; }

	ssh_error_code error() const {
		return error_;
	}

	std::string error_message() const {
		return err_message_;
	}

	void set_error(ssh_error_code err, std::string msg) {
		error_ = err;
		err_message_ = std::move(msg);
	}

protected:
	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

}

#endif
