#include "transport_base.hpp"

#include "sshc/common/util.hpp"

namespace securepath::sshc {

bool send_payload(transport_base& base, const_span payload) {
	base.call_context().log.log(logger::debug_trace, "SSH sending payload [size={}]", payload.size());

	auto rec = base.alloc_out_packet(payload.size());
	if(rec) {
		copy(payload, rec->data);
		return base.write_alloced_out_packet(*rec);
	} else if(base.error() == ssh_noerror) {
		base.set_error(sshc_memory_error, "Could not allocate buffer for sending payload");
	}

	return false;
}

}
