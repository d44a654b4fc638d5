#ifndef SSHC_TEST_UTIL_MEMORY_STREAM_HEADER
#define SSHC_TEST_UTIL_MEMORY_STREAM_HEADER

#include "test_server.hpp"
#include "sshc/client/byte_stream.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace securepath::sshc::test {

/// One direction of an in-memory connection
class memory_pipe {
public:
	bool write(const_span data);
	std::optional<std::size_t> read(span out, std::chrono::milliseconds timeout);
	void close();
	bool closed() const;

private:
	mutable std::mutex mutex_;
	std::condition_variable cond_;
	std::string data_;
	bool closed_{};
};

class memory_stream : public byte_stream {
public:
	memory_stream(std::shared_ptr<memory_pipe> in, std::shared_ptr<memory_pipe> out);
	~memory_stream();

	bool send(const_span data) override;
	std::optional<std::size_t> receive(span out, std::chrono::milliseconds timeout) override;
	void close() override;

private:
	std::shared_ptr<memory_pipe> in_;
	std::shared_ptr<memory_pipe> out_;
};

/** \brief test_server running in its own thread behind a memory_stream
 *
 *  The server object can be inspected and driven with with_server(), which runs under the same lock
 *  as the responder loop.
 */
class test_responder {
public:
	test_responder(ssh_config c = test_server_config());
	~test_responder();

	/// the client end, can be taken once
	std::unique_ptr<byte_stream> client_stream();

	template<typename Func>
	auto with_server(Func&& f) {
		std::lock_guard lock(mutex_);
		if constexpr(std::is_void_v<decltype(f(server_))>) {
			f(server_);
			flush_output();
		} else {
			auto ret = f(server_);
			flush_output();
			return ret;
		}
	}

	/// stop answering, the client sees no more data from us
	void freeze();
	/// close the connection from our side
	void cut();

private:
	void run();
	void flush_output();

private:
	std::shared_ptr<memory_pipe> to_server_;
	std::shared_ptr<memory_pipe> to_client_;
	std::unique_ptr<byte_stream> client_stream_;

	std::mutex mutex_;
	test_server server_;
	string_in_buffer in_buf_;
	bool frozen_{};
	bool stop_{};
	std::thread thread_;
};

}

#endif
