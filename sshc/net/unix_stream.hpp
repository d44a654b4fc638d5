#ifndef SSHC_NET_UNIX_STREAM_HEADER
#define SSHC_NET_UNIX_STREAM_HEADER

#include "sshc/client/agent_client.hpp"
#include "sshc/client/byte_stream.hpp"
#include "sshc/common/logger.hpp"

#include <asio.hpp>

#include <memory>

namespace securepath::sshc {

/// Unix domain socket connection, blocking in the same way as tcp_stream
class unix_stream : public byte_stream {
public:
	unix_stream(logger&);
	~unix_stream();

	bool connect(std::string const& path);

	bool send(const_span data) override;
	std::optional<std::size_t> receive(span out, std::chrono::milliseconds timeout) override;
	void close() override;

private:
	logger& log_;
	asio::io_context io_;
	asio::local::stream_protocol::socket socket_;
};

/// connect to the agent in SSH_AUTH_SOCK, nullptr if it is not set or the connection fails
std::shared_ptr<agent_client> connect_agent(logger&);

}

#endif
