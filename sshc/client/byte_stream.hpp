#ifndef SSHC_CLIENT_BYTE_STREAM_HEADER
#define SSHC_CLIENT_BYTE_STREAM_HEADER

#include "sshc/common/types.hpp"

#include <chrono>
#include <optional>

namespace securepath::sshc {

/// The physical connection under the session, used only from the session worker thread
class byte_stream {
public:
	virtual ~byte_stream() = default;

	/// write all of the data, returns false if the stream is broken
	virtual bool send(const_span data) = 0;

	/// wait at most timeout for data, returns number of bytes read (0 on timeout) or nullopt on end of stream or error
	virtual std::optional<std::size_t> receive(span out, std::chrono::milliseconds timeout) = 0;

	virtual void close() = 0;
};

}

#endif
