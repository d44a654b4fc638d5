#include "protocol_helpers.hpp"
#include "ssh_constants.hpp"

namespace securepath::sshc {

std::string to_string(ssh_version const& version) {
	std::string str = "SSH-" + version.ssh + "-" + version.software;
	if(!version.comment.empty()) {
		str += " ";
		str += version.comment;
	}
	return str;
}

bool send_version_string(ssh_version const& version, out_buffer& out) {
	return out.write(to_string(version) + "\r\n");
}

// printable US-ASCII except space and minus (std::isprint is locale dependent)
static bool is_valid_version_char(char c) {
	return c >= 0x21 && c <= 0x7e && c != '-';
}

static bool is_valid_software_char(char c) {
	return c >= 0x21 && c <= 0x7e;
}

template<typename Pred>
static bool all_of(std::string_view str, Pred&& p) {
	for(auto c : str) {
		if(!p(c)) {
			return false;
		}
	}
	return true;
}

static version_parse_result parse_version_parts(std::string_view str, ssh_version& version) {
	auto hyphen = str.find('-');

	//empty version number or no hyphen found
	if(hyphen == 0 || hyphen == std::string_view::npos) {
		return version_parse_result::error;
	}

	std::string_view ssh_v = str.substr(0, hyphen);
	if(!all_of(ssh_v, is_valid_version_char)) {
		return version_parse_result::error;
	}

	auto rest = str.substr(hyphen+1);
	auto space = rest.find(' ');
	std::string_view soft_v = rest.substr(0, space);

	if(soft_v.empty() || !all_of(soft_v, is_valid_software_char)) {
		return version_parse_result::error;
	}

	version.ssh = ssh_v;
	version.software = soft_v;
	version.comment.clear();
	if(space != std::string_view::npos) {
		version.comment = rest.substr(space+1);
	}

	return version_parse_result::ok;
}

// some implementations send only LF
static std::size_t line_end(std::string_view str, std::size_t& eol_size) {
	auto p = str.find('\n');
	eol_size = 1;
	if(p != std::string_view::npos && p > 0 && str[p-1] == '\r') {
		--p;
		eol_size = 2;
	}
	return p;
}

version_parse_result parse_ssh_version(in_buffer& in, bool allow_non_version_lines, ssh_version& version, std::vector<std::string>* pre_lines) {
	const_span buf = in.get();
	if(buf.empty()) {
		return version_parse_result::more_data;
	}

	std::string_view str = to_string_view(buf);
	std::size_t eol_size{};

	if(allow_non_version_lines) {
		while(str.size() >= 4 && !str.starts_with("SSH-")) {
			auto p = line_end(str, eol_size);
			if(p == std::string_view::npos) {
				return str.size() > maximum_version_line_size
					? version_parse_result::error : version_parse_result::more_data;
			}
			if(pre_lines) {
				pre_lines->emplace_back(str.substr(0, p));
			}
			str = str.substr(p+eol_size);
			in.consume(p+eol_size);
		}
		if(str.size() < 4) {
			return version_parse_result::more_data;
		}
	} else if(str.size() < 4) {
		return std::string_view("SSH-").starts_with(str)
			? version_parse_result::more_data : version_parse_result::error;
	}

	if(!str.starts_with("SSH-")) {
		return version_parse_result::error;
	}

	str = str.substr(0, maximum_version_line_size);

	auto p = line_end(str, eol_size);
	if(p == std::string_view::npos) {
		return str.size() == maximum_version_line_size
			? version_parse_result::error : version_parse_result::more_data;
	}

	auto result = parse_version_parts(str.substr(4, p-4), version);
	if(result == version_parse_result::ok) {
		in.consume(p+eol_size);
	}
	return result;
}

bool parse_string_list(std::string_view view, std::vector<std::string_view>& out) {
	while(!view.empty()) {
		auto end = view.find(',');
		out.emplace_back(view.substr(0, end));
		if(end == std::string_view::npos) {
			break;
		}
		view = view.substr(end+1);
	}
	return true;
}

bool to_string_list(std::vector<std::string_view> const& in, std::string& out) {
	for(auto&& v : in) {
		if(v.empty() || v.find(',') != std::string_view::npos) {
			return false;
		}
		if(!out.empty()) {
			out += ",";
		}
		out += v;
	}
	return true;
}

}
