#include "exec_options.hpp"
#include "sshc/net/tcp_stream.hpp"
#include "sshc/net/unix_stream.hpp"

#include <cstdlib>
#include <iostream>

namespace securepath::sshc {
namespace {

void check(op_result const& r, std::string_view what) {
	if(!r) {
		throw std::runtime_error(std::string(what) + ": " + r.message + " (" + std::string(to_string(r.kind)) + ")");
	}
}

interactive_result ask(interactive_request const& req, std::vector<std::string>& answers) {
	if(!req.name.empty()) {
		std::cerr << req.name << "\n";
	}
	if(!req.instruction.empty()) {
		std::cerr << req.instruction << "\n";
	}
	for(auto const& p : req.prompts) {
		std::cerr << p.text << std::flush;
		std::string line;
		if(!std::getline(std::cin, line)) {
			return interactive_result::cancelled;
		}
		answers.push_back(std::move(line));
	}
	return interactive_result::data;
}

void authenticate(session& s, exec_options const& opts, logger& log) {
	if(opts.interactive) {
		check(s.userauth_keyboard_interactive(opts.user), "keyboard-interactive authentication failed");
		return;
	}
	if(opts.agent) {
		auto agent = connect_agent(log);
		if(!agent) {
			throw std::runtime_error("could not connect to the agent");
		}
		check(s.userauth_agent(opts.user, *agent), "agent authentication failed");
		return;
	}
	if(auto key = opts.load_identity(log); key.valid()) {
		check(s.userauth_publickey(opts.user, key), "public key authentication failed");
		return;
	}
	char const* password = std::getenv(opts.password_env.c_str());
	check(s.userauth_password(opts.user, password ? password : ""), "password authentication failed");
}

// stdin goes to the subsystem until end of file
void feed_stdin(session& s, channel_id id) {
	byte_vector buf(16*1024);
	while(std::cin.read(reinterpret_cast<char*>(buf.data()), std::streamsize(buf.size())) || std::cin.gcount()) {
		check(s.write(id, const_span(buf.data(), std::size_t(std::cin.gcount()))), "write failed");
	}
	check(s.send_eof(id), "sending eof failed");
}

void copy_out(session& s, channel_id id, bool err) {
	auto& out = err ? std::cerr : std::cout;
	byte_vector buf(16*1024);
	for(std::size_t n = 1; n;) {
		check(err ? s.read_stderr(id, buf, n) : s.read(id, buf, n), "read failed");
		out.write(reinterpret_cast<char const*>(buf.data()), std::streamsize(n));
	}
	out.flush();
}

int run(exec_options const& opts) {
	stdout_logger log(opts.verbose ? logger::log_all : logger::error);

	auto stream = connect_tcp(log, opts.host, opts.port);
	if(!stream) {
		std::cerr << "could not connect to " << opts.host << ":" << opts.port << "\n";
		return 1;
	}

	client_config config;
	config.username = opts.user;
	config.host_key_check = [](host_key_info const& info) {
		std::cerr << "host key " << to_string(info.type) << " " << info.fingerprint << "\n";
		return host_key_result::accept;
	};
	if(opts.interactive) {
		config.on_interactive = ask;
	}
	config.on_banner = [](std::string_view msg, std::string_view) {
		std::cerr << msg;
	};

	session s(std::move(config), log, std::move(stream));
	opts.apply(s);
	s.set_timeout(std::chrono::seconds(opts.timeout));

	check(s.handshake(), "handshake failed");
	authenticate(s, opts, log);

	// the command can run longer than the call timeout
	s.set_timeout(std::chrono::milliseconds(0));

	channel_id id{};
	check(s.channel_session(id), "channel open failed");
	if(opts.subsystem.empty()) {
		check(s.exec(id, opts.command), "exec failed");
	} else {
		check(s.subsystem(id, opts.subsystem), "subsystem request failed");
		feed_stdin(s, id);
	}

	copy_out(s, id, false);
	copy_out(s, id, true);

	if(auto r = s.close(id); r) {
		check(s.wait_closed(id), "channel close failed");
	}
	auto status = s.exit_status(id);
	if(auto sig = s.exit_signal(id)) {
		std::cerr << "killed by signal " << sig->name << "\n";
	}
	if(auto r = s.disconnect(ssh_disconnect_by_application, "bye"); !r) {
		std::cerr << "disconnect failed: " << r.message << "\n";
	}

	return status ? int(*status) : 1;
}

}
}

int main(int argc, char* argv[]) {
	using namespace securepath::sshc;
	try {
		command_parser p;
		exec_options opts;
		opts.add_commands(p);
		p.parse(argc, argv);

		if(opts.help) {
			std::cout << "usage: sshc_exec [options] <host> <user> <command...>\n";
			p.print_help(std::cout);
			return 0;
		}
		opts.parse(p);
		return run(opts);
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 2;
	}
}
