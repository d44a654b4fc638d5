#ifndef SSHC_CORE_AUTH_AUTH_HEADER
#define SSHC_CORE_AUTH_AUTH_HEADER

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securepath::sshc {

// supported authentication methods [RFC 4252] [RFC 4256]
enum class auth_type {
	none         = 0,
	public_key   = 1,
	password     = 2,
	interactive  = 4
};

std::string_view to_string(auth_type);
std::optional<auth_type> auth_type_from_string(std::string_view);

/// comma separated method names, for logging and the auth_methods query
std::string to_string(std::vector<auth_type> const&);

struct interactive_prompt {
	bool echo{};
	std::string text;
};

using interactive_prompts = std::vector<interactive_prompt>;

struct interactive_request {
	std::string name;
	std::string instruction;
	interactive_prompts prompts;
};

enum class interactive_result {
	data,      // answers were filled in
	cancelled, // answer with zero responses
	pending    // ask again later
};

/// Outcome of one authentication episode when the peer did not accept us
struct auth_failure_info {
	// methods we sent a request for, in order (publickey once per key)
	std::vector<auth_type> tried;
	// methods that were accepted but the server wants more
	std::vector<auth_type> partial;
	// methods the server allows to continue with, from its last failure message
	std::vector<std::string> allowed;
};

}

#endif
