#ifndef SSHC_CORE_CONNECTION_CHANNEL_STREAM_HEADER
#define SSHC_CORE_CONNECTION_CHANNEL_STREAM_HEADER

#include "channel.hpp"

#include <deque>

namespace securepath::sshc {

struct stream_read_result {
	std::size_t size{};
	// nothing was read and nothing more will arrive
	bool eos{};
};

/** \brief Channel as a byte stream with extended data
 *
 *  Received data is kept in one arrival ordered queue for the primary and extended data,
 *  reading one type leaves the other in place. The local window is adjusted as the
 *  application reads.
 */
class channel_stream : public channel {
public:
	using channel::channel;

	/// read buffered data of the type (0 primary, 1 stderr)
	stream_read_result read(span out, std::uint32_t data_type = 0);

	/// read next chunk regardless of its type, data_type is set to the chunk type
	stream_read_result read_any(span out, std::uint32_t& data_type);

	std::size_t available(std::uint32_t data_type = 0) const;
	std::size_t available_any() const;

	std::optional<send_id> write(const_span data) { return send_data(data); }
	std::optional<send_id> write_extended(const_span data, std::uint32_t data_type = ser::extended_stderr) {
		return send_data(data, data_type);
	}

	/// the remote will not send more data (eof or close received)
	bool remote_finished() const;

	/// both sides have sent eof, or the channel is closed
	bool end_of_stream() const;

protected:
	void on_data_received(std::uint32_t data_type, const_span) override;
	void on_state_change() override;

private:
	struct chunk {
		std::uint32_t data_type{};
		byte_vector data;
		std::size_t pos{};
	};

	std::deque<chunk> chunks_;
	bool discarded_{};
};

}

#endif
