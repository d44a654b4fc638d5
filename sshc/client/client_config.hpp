#ifndef SSHC_CLIENT_CLIENT_CONFIG_HEADER
#define SSHC_CLIENT_CLIENT_CONFIG_HEADER

#include "sshc/core/ssh_config.hpp"
#include "sshc/core/auth/auth.hpp"
#include "sshc/core/service/names.hpp"

#include <functional>

namespace securepath::sshc {

enum class host_key_result {
	accept,
	reject,
	pending // not decided yet, the check is called again on next process round
};

struct host_key_info {
	key_type type{};
	// "SHA256:" followed by unpadded base64
	std::string fingerprint;
	// serialised public key
	const_span blob;
};

using host_key_callback = std::function<host_key_result(host_key_info const&)>;
using banner_callback = std::function<void(std::string_view message, std::string_view lang)>;
using interactive_callback = std::function<interactive_result(interactive_request const&, std::vector<std::string>& answers)>;

struct client_config : ssh_config {
	/// username that is used for authentication
	std::string username;

	/// service that we authenticate for
	std::string service{connection_service_name};

	/// server host key check at the first key exchange, if not set every key is accepted.
	/// On re-key the server must present the same key.
	host_key_callback host_key_check;

	/// user authentication banner from the server
	banner_callback on_banner;

	/// keyboard-interactive prompts, if not set the prompts are cancelled
	interactive_callback on_interactive;
};

}

#endif
