#include "auth.hpp"

namespace securepath::sshc {

std::string_view to_string(auth_type t) {
	using enum auth_type;
	switch(t) {
		case none: return "none";
		case public_key: return "publickey";
		case password: return "password";
		case interactive: return "keyboard-interactive";
	};
	return "unknown";
}

std::optional<auth_type> auth_type_from_string(std::string_view s) {
	for(auto t : {auth_type::none, auth_type::public_key, auth_type::password, auth_type::interactive}) {
		if(to_string(t) == s) {
			return t;
		}
	}
	return std::nullopt;
}

std::string to_string(std::vector<auth_type> const& types) {
	std::string res;
	for(auto t : types) {
		if(!res.empty()) {
			res += ',';
		}
		res += to_string(t);
	}
	return res;
}

}
