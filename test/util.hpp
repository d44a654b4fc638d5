#ifndef SSHC_TEST_UTIL_HEADER
#define SSHC_TEST_UTIL_HEADER

#include "configs.hpp"
#include "log.hpp"
#include "test_buffers.hpp"
#include "sshc/client/ssh_client.hpp"
#include "sshc/common/logger.hpp"
#include "sshc/core/ssh_transport.hpp"

namespace securepath::sshc::test {

struct test_context {
	test_context(logger& l, std::string tag, std::size_t max_out_size = -1)
	: slog(l, tag)
	, out_buf(max_out_size)
	{
	}

	mutable session_logger slog;
	string_io_buffer out_buf;
};

struct test_client : test_context, client_config, ssh_client {
	test_client(logger& l = test_log(), client_config c = test_client_config())
	: test_context(l, "[client] ")
	, client_config(std::move(c))
	, ssh_client(*this, slog, out_buf)
	{
		side = transport_side::client;
	}

	bool authenticate_password(std::string user, std::string password) {
		auth_credentials creds;
		creds.username = std::move(user);
		creds.password = std::move(password);
		return authenticate(std::move(creds), {auth_type::password});
	}
};

template<typename Client, typename Server>
bool run(Client& client, Server& server) {
	bool run = true;
	while(run) {
		auto client_op = client.process(server.out_buf);
		// if the client is waiting user action, break out of the running loop so it can be handled
		run = client_op != transport_op::disconnected && client_op != transport_op::pending_action;

		auto server_op = server.process(client.out_buf);
		run = run && server_op != transport_op::disconnected && server_op != transport_op::pending_action;
		if(server_op == transport_op::disconnected) {
			// give the client change to process once more
			while(client.process(server.out_buf) != transport_op::disconnected && !server.out_buf.empty()) {}
		}
		run = run && (!client.out_buf.empty() || !server.out_buf.empty());
	}
	return client.error() == ssh_noerror && server.error() == ssh_noerror;
}

}

#endif
