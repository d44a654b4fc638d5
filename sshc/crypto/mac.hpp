#ifndef SSHC_CRYPTO_MAC_HEADER
#define SSHC_CRYPTO_MAC_HEADER

#include "sshc/common/types.hpp"

namespace securepath::sshc {

class mac {
public:
	mac(std::size_t size)
	: size_(size)
	{}

	virtual ~mac() = default;

	/// size of the message authentication code in bytes
	std::size_t size() const { return size_; }

	virtual void process(const_span in) = 0;

	/// output mac and reset the mac accumulation
	virtual void result(span out) = 0;

private:
	std::size_t const size_;
};

}

#endif
