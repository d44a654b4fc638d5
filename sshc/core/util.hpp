#ifndef SSHC_CORE_UTIL_HEADER
#define SSHC_CORE_UTIL_HEADER

#include "sshc/common/types.hpp"
#include "sshc/crypto/hash.hpp"

namespace securepath::sshc {

/// Sink for serialised binary data
class binout {
public:
	virtual bool process(const_span data) = 0;
protected:
	~binout() = default;
};

struct hash_binout : binout {
	hash_binout(sshc::hash& hash);

	bool process(const_span data) override;

public:
	sshc::hash& hash;
};

struct byte_vector_binout : binout {
	byte_vector_binout(byte_vector& buf);

	bool process(const_span data) override;

public:
	byte_vector& buf;
};

struct string_binout : binout {
	string_binout(std::string& buf);

	bool process(const_span data) override;

public:
	std::string& buf;
};

}

#endif
