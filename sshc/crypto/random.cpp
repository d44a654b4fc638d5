#include "random.hpp"

#include "sshc/common/util.hpp"

#include <algorithm>
#include <cerrno>
#include <sys/random.h>

namespace securepath::sshc {

bool system_entropy(span output) {
	while(!output.empty()) {
		// reads of up to 256 bytes are not interrupted once the urandom pool is initialised
		std::size_t s = std::min<std::size_t>(output.size(), 256);
		ssize_t res = ::getrandom(output.data(), s, 0);
		if(res > 0) {
			output = safe_subspan(output, std::size_t(res));
		} else if(res < 0 && errno == EINTR) {
			continue;
		} else {
			return false;
		}
	}
	return true;
}

}
