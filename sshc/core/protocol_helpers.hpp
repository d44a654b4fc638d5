#ifndef SSHC_CORE_PROTOCOL_HELPERS_HEADER
#define SSHC_CORE_PROTOCOL_HELPERS_HEADER

#include "sshc/common/types.hpp"
#include "sshc/common/buffers.hpp"

#include <string_view>
#include <vector>

namespace securepath::sshc {

/// "SSH-2.0-software comment" without line ending
std::string to_string(ssh_version const&);

bool send_version_string(ssh_version const& version, out_buffer&);

enum class version_parse_result {
	ok,
	more_data,
	error
};

/** \brief Parse identification line from the input
 *
 *  Server may send other lines before the version line, these are passed to pre_lines if given
 */
version_parse_result parse_ssh_version(in_buffer&, bool allow_non_version_lines, ssh_version& version, std::vector<std::string>* pre_lines = nullptr);

bool parse_string_list(std::string_view, std::vector<std::string_view>& out);
bool to_string_list(std::vector<std::string_view> const& in, std::string& out);

}

#endif
