#include "unix_stream.hpp"

#include <cstdlib>

namespace securepath::sshc {

using local = asio::local::stream_protocol;

unix_stream::unix_stream(logger& log)
: log_(log)
, socket_(io_)
{
}

unix_stream::~unix_stream() {
	close();
}

bool unix_stream::connect(std::string const& path) {
	asio::error_code ec;
	socket_.connect(local::endpoint(path), ec);
	if(ec) {
		log_.log(logger::error, "Connect to {} failed: {}", path, ec.message());
		return false;
	}
	return true;
}

bool unix_stream::send(const_span data) {
	asio::error_code ec;
	asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
	if(ec) {
		log_.log(logger::error, "Write failed: {}", ec.message());
		return false;
	}
	return true;
}

std::optional<std::size_t> unix_stream::receive(span out, std::chrono::milliseconds timeout) {
	asio::error_code result = asio::error::would_block;
	std::size_t size{};

	socket_.async_read_some(asio::buffer(out.data(), out.size()),
		[&](asio::error_code const& ec, std::size_t n) {
			result = ec;
			size = n;
		});

	io_.restart();
	io_.run_for(timeout);

	if(!io_.stopped()) {
		asio::error_code ec;
		socket_.cancel(ec);
		io_.restart();
		io_.run();
	}

	if(result == asio::error::operation_aborted) {
		return 0;
	}
	if(result) {
		if(result != asio::error::eof) {
			log_.log(logger::error, "Read failed: {}", result.message());
		}
		return std::nullopt;
	}
	return size;
}

void unix_stream::close() {
	if(socket_.is_open()) {
		asio::error_code ec;
		socket_.shutdown(local::socket::shutdown_both, ec);
		socket_.close(ec);
	}
}

std::shared_ptr<agent_client> connect_agent(logger& log) {
	char const* path = std::getenv("SSH_AUTH_SOCK");
	if(!path || !*path) {
		log.log(logger::info, "SSH_AUTH_SOCK is not set");
		return nullptr;
	}
	auto s = std::make_unique<unix_stream>(log);
	if(!s->connect(path)) {
		return nullptr;
	}
	return std::make_shared<agent_client>(log, std::move(s));
}

}
