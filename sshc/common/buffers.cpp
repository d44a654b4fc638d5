#include "buffers.hpp"

#include <cstring>

namespace securepath::sshc {

bool out_buffer::write(std::string_view v) {
	if(v.empty()) {
		return true;
	}
	span s = get(v.size());
	if(!s.empty()) {
		std::memcpy(s.data(), v.data(), v.size());
		commit(v.size());
	}
	return !s.empty();
}

}
