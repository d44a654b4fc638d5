#include "exec_options.hpp"

#include "sshc/crypto/crypto_call_context.hpp"

#include <fstream>
#include <sstream>

namespace securepath::sshc {

namespace {

std::string read_file(std::string const& file) {
	std::ifstream f(file, std::ios_base::binary);
	if(!f) {
		throw invalid_argument("cannot read file '" + file + "'");
	}
	std::ostringstream out;
	out << f.rdbuf();
	return out.str();
}

void set_pref(session& s, method_type t1, method_type t2, std::string const& list, std::string_view name) {
	if(list.empty()) {
		return;
	}
	if(!s.method_pref(t1, list) || !s.method_pref(t2, list)) {
		throw invalid_argument("no supported " + std::string(name) + " in '" + list + "'");
	}
}

}

void exec_options::add_commands(command_parser& p) {
	p.add(port, "port", "p", "Server port");
	p.add(password_env, "password-env", "", "Environment variable holding the password");
	p.add(identity, "identity", "i", "Unencrypted openssh private key for public key authentication");
	p.add(agent, "agent", "A", "Use the keys of the agent in SSH_AUTH_SOCK for public key authentication");
	p.add(interactive, "interactive", "", "Use keyboard-interactive authentication, prompts are read from stdin");
	p.add(subsystem, "subsystem", "s", "Request subsystem instead of executing the command");

	p.add(kexes, "kex", "", "Key exchange methods in order of preference, comma separated");
	p.add(host_keys, "host-key", "", "Host key types in order of preference, comma separated");
	p.add(ciphers, "cipher", "c", "Ciphers in order of preference, comma separated");
	p.add(macs, "mac", "m", "Macs in order of preference, comma separated");
	p.add(rekey_data_interval, "rekey-data-interval", "", "Rekey data interval in kilo bytes");
	p.add(rekey_time_interval, "rekey-time-interval", "", "Rekey time interval in seconds");
	p.add(window_size, "window-size", "", "Initial channel window size in kilo bytes");
	p.add(packet_size, "packet-size", "", "Maximum channel packet size in kilo bytes");
	p.add(version_software, "version-software", "", "Software part of our version string");

	p.add(timeout, "timeout", "t", "Timeout for connecting and authenticating in seconds, 0 to wait forever");
	p.add(verbose, "verbose", "v", "Log the ssh traffic");
	p.add(help, "help", "h", "Show this help");
}

void exec_options::parse(command_parser const& p) {
	auto const& pos = p.positionals();
	if(pos.size() < 2 || (subsystem.empty() && pos.size() < 3)) {
		throw invalid_argument("expected <host> <user> <command>");
	}
	host = pos[0];
	user = pos[1];
	for(std::size_t i = 2; i < pos.size(); ++i) {
		if(!command.empty()) {
			command += ' ';
		}
		command += pos[i];
	}
	if(!subsystem.empty() && !command.empty()) {
		throw invalid_argument("both subsystem and command given");
	}
}

void exec_options::apply(session& s) const {
	set_pref(s, method_type::kex, method_type::kex, kexes, "kex");
	set_pref(s, method_type::host_key, method_type::host_key, host_keys, "host key");
	set_pref(s, method_type::crypt_cs, method_type::crypt_sc, ciphers, "cipher");
	set_pref(s, method_type::mac_cs, method_type::mac_sc, macs, "mac");

	if(!version_software.empty() && !s.set_version_software(version_software)) {
		throw invalid_argument("invalid version software '" + version_software + "'");
	}

	auto& c = s.config();
	if(rekey_data_interval) {
		c.rekey_data_interval = *rekey_data_interval * 1024ull;
	}
	if(rekey_time_interval) {
		c.rekey_time_interval = std::chrono::seconds(*rekey_time_interval);
	}
	if(window_size) {
		c.channel.initial_window_size = window_size * 1024ul;
	}
	if(packet_size) {
		c.channel.max_packet_size = packet_size * 1024ul;
	}
}

ssh_private_key exec_options::load_identity(logger& log) const {
	if(identity.empty()) {
		return {};
	}
	auto ccontext = default_crypto_context();
	auto rand = ccontext.construct_random();
	crypto_call_context call{log, *rand};

	auto key = load_openssh_private_key(read_file(identity), ccontext, call);
	if(!key.valid()) {
		throw invalid_argument("could not load private key '" + identity + "'");
	}
	return key;
}

}
