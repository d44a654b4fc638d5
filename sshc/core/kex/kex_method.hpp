#ifndef SSHC_CORE_KEX_KEX_METHOD_HEADER
#define SSHC_CORE_KEX_KEX_METHOD_HEADER

#include "kex_packets.hpp"
#include "sshc/core/ssh_binary_util.hpp"
#include "sshc/crypto/key_exchange.hpp"

#include <memory>
#include <variant>

namespace securepath::sshc {

/// curve25519 exchange (RFC 8731), the ephemeral keys are octet strings
struct ecdh_method {
	using init_packet = ser::kex_ecdh_init;
	using reply_packet = ser::kex_ecdh_reply;

	static std::string_view encode(const_span key) { return to_string_view(key); }
	static const_span decode(std::string_view key) { return to_span(key); }

	std::unique_ptr<key_exchange> exchange;
};

/// finite field exchange over a fixed modp group (RFC 8268), the ephemeral keys are mpints
struct dh_method {
	using init_packet = ser::kexdh_init;
	using reply_packet = ser::kexdh_reply;

	static const_mpint_span encode(const_span key) { return to_umpint(key); }
	static const_span decode(const_mpint_span key) { return mpint_digits(key); }

	std::unique_ptr<key_exchange> exchange;
};

using kex_method = std::variant<ecdh_method, dh_method>;

}

#endif
