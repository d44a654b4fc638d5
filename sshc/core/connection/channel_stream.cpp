#include "channel_stream.hpp"

#include <algorithm>

namespace securepath::sshc {

void channel_stream::on_data_received(std::uint32_t data_type, const_span d) {
	if(discarded_) {
		// nobody reads any more
		consumed(std::uint32_t(d.size()));
		return;
	}
	log_.log(logger::debug_trace, "channel stream buffered [id={}, type={}, size={}]", id(), data_type, d.size());
	chunks_.push_back(chunk{data_type, byte_vector(d.begin(), d.end())});
}

void channel_stream::on_state_change() {
	// reads after local close return end of stream
	if(local_close_ && !discarded_) {
		discarded_ = true;
		chunks_.clear();
	}
}

stream_read_result channel_stream::read(span out, std::uint32_t data_type) {
	std::size_t read = 0;
	for(auto it = chunks_.begin(); it != chunks_.end() && read < out.size(); ) {
		if(it->data_type != data_type) {
			++it;
			continue;
		}
		std::size_t size = std::min(out.size() - read, it->data.size() - it->pos);
		copy(safe_subspan(it->data, it->pos, size), safe_subspan(out, read, size));
		it->pos += size;
		read += size;
		if(it->pos == it->data.size()) {
			it = chunks_.erase(it);
		}
	}

	if(read) {
		consumed(std::uint32_t(read));
	}

	return stream_read_result{read, read == 0 && !out.empty() && (discarded_ || remote_finished())};
}

stream_read_result channel_stream::read_any(span out, std::uint32_t& data_type) {
	if(chunks_.empty()) {
		return stream_read_result{0, !out.empty() && (discarded_ || remote_finished())};
	}
	data_type = chunks_.front().data_type;

	// read only the front chunk and what follows of the same type
	std::size_t read = 0;
	while(!chunks_.empty() && chunks_.front().data_type == data_type && read < out.size()) {
		auto& c = chunks_.front();
		std::size_t size = std::min(out.size() - read, c.data.size() - c.pos);
		copy(safe_subspan(c.data, c.pos, size), safe_subspan(out, read, size));
		c.pos += size;
		read += size;
		if(c.pos == c.data.size()) {
			chunks_.pop_front();
		}
	}

	if(read) {
		consumed(std::uint32_t(read));
	}
	return stream_read_result{read, false};
}

std::size_t channel_stream::available(std::uint32_t data_type) const {
	std::size_t res{};
	for(auto const& c : chunks_) {
		if(c.data_type == data_type) {
			res += c.data.size() - c.pos;
		}
	}
	return res;
}

std::size_t channel_stream::available_any() const {
	std::size_t res{};
	for(auto const& c : chunks_) {
		res += c.data.size() - c.pos;
	}
	return res;
}

bool channel_stream::remote_finished() const {
	return eof_received() || close_received() || state() == channel_state::closed;
}

bool channel_stream::end_of_stream() const {
	return (eof_sent() && eof_received()) || state() == channel_state::closed;
}

}
