#include "tcp_stream.hpp"

namespace securepath::sshc {

using tcp = asio::ip::tcp;

tcp_stream::tcp_stream(logger& log)
: log_(log)
, socket_(io_)
{
}

tcp_stream::~tcp_stream() {
	close();
}

bool tcp_stream::connect(std::string const& host, std::uint16_t port) {
	asio::error_code ec;
	tcp::resolver resolver(io_);
	auto endpoints = resolver.resolve(host, std::to_string(port), ec);
	if(ec) {
		log_.log(logger::error, "Failed to resolve {}: {}", host, ec.message());
		return false;
	}

	auto ep = asio::connect(socket_, endpoints, ec);
	if(ec) {
		log_.log(logger::error, "Connect to {}:{} failed: {}", host, port, ec.message());
		return false;
	}
	log_.log(logger::info, "Connected to {}", ep);

	socket_.set_option(tcp::no_delay(true), ec);
	return true;
}

bool tcp_stream::send(const_span data) {
	asio::error_code ec;
	asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
	if(ec) {
		log_.log(logger::error, "Write failed: {}", ec.message());
		return false;
	}
	return true;
}

std::optional<std::size_t> tcp_stream::receive(span out, std::chrono::milliseconds timeout) {
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
		// timed out, cancel and let the handler run
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

void tcp_stream::close() {
	if(socket_.is_open()) {
		asio::error_code ec;
		socket_.shutdown(tcp::socket::shutdown_both, ec);
		socket_.close(ec);
	}
}

std::unique_ptr<tcp_stream> connect_tcp(logger& log, std::string const& host, std::uint16_t port) {
	auto s = std::make_unique<tcp_stream>(log);
	if(!s->connect(host, port)) {
		return nullptr;
	}
	return s;
}

}
