#ifndef SSHC_TOOLS_SSHC_EXEC_EXEC_OPTIONS_HEADER
#define SSHC_TOOLS_SSHC_EXEC_EXEC_OPTIONS_HEADER

#include "tools/common/command_parser.hpp"
#include "sshc/client/session.hpp"

namespace securepath::sshc {

struct exec_options {
	std::string host;
	std::uint16_t port{22};
	std::string user;
	std::string command;

	// environment variable holding the password
	std::string password_env{"SSHC_PASSWORD"};
	std::string identity;
	bool interactive{};
	bool agent{};
	std::string subsystem;

	std::string kexes;
	std::string host_keys;
	std::string ciphers;
	std::string macs;
	std::optional<std::uint64_t> rekey_data_interval;
	std::optional<std::uint32_t> rekey_time_interval;
	std::uint32_t window_size{};
	std::uint32_t packet_size{};
	std::string version_software;

	std::uint32_t timeout{30};
	bool verbose{};
	bool help{};

	void add_commands(command_parser&);

	/// takes host, user and command from the positionals, throws invalid_argument if something is missing
	void parse(command_parser const&);

	/// set the algorithm preferences and limits, throws invalid_argument for unknown algorithms
	void apply(session&) const;

	/// load the identity file, invalid key if not set
	ssh_private_key load_identity(logger&) const;
};

}

#endif
