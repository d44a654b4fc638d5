#ifndef SSHC_NET_TCP_STREAM_HEADER
#define SSHC_NET_TCP_STREAM_HEADER

#include "sshc/client/byte_stream.hpp"
#include "sshc/common/logger.hpp"

#include <asio.hpp>

#include <memory>

namespace securepath::sshc {

/** \brief TCP connection for the session
 *
 *  Blocking operations on own io_context, the receive timeout is done by running the
 *  io_context for the given time and cancelling the read if it did not complete.
 */
class tcp_stream : public byte_stream {
public:
	tcp_stream(logger&);
	~tcp_stream();

	/// resolve and connect, returns false and logs the reason on failure
	bool connect(std::string const& host, std::uint16_t port);

	bool send(const_span data) override;
	std::optional<std::size_t> receive(span out, std::chrono::milliseconds timeout) override;
	void close() override;

	bool is_open() const { return socket_.is_open(); }

private:
	logger& log_;
	asio::io_context io_;
	asio::ip::tcp::socket socket_;
};

/// connect to host:port, nullptr if the connection fails
std::unique_ptr<tcp_stream> connect_tcp(logger&, std::string const& host, std::uint16_t port);

}

#endif
