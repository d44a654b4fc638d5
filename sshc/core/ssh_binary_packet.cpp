#include "ssh_binary_packet.hpp"

#include "ssh_binary_util.hpp"
#include "sshc/common/util.hpp"

#include <cstring>

namespace securepath::sshc {

std::string_view to_string(decode_result r) {
	using enum decode_result;
	switch(r) {
		case packet: return "packet";
		case need_more_data: return "need more data";
		case frame_error: return "frame error";
	};
	return "unknown";
}

ssh_binary_packet::ssh_binary_packet(ssh_config const& config, logger& logger)
: config_(config)
, logger_(logger)
{
}

ssh_config const& ssh_binary_packet::config() const {
	return config_;
}

void ssh_binary_packet::set_random(random& r) {
	random_ = &r;
}

ssh_error_code ssh_binary_packet::error() const {
	return error_;
}

std::string ssh_binary_packet::error_message() const {
	return error_msg_;
}

void ssh_binary_packet::set_error(ssh_error_code code, std::string_view message) {
	error_ = code;
	error_msg_ = message;
}

void ssh_binary_packet::set_crypto(stream_crypto& s, std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac) {
	s.cipher = std::move(cipher);
	s.mac = std::move(mac);

	if(s.cipher->is_aead()) {
		s.integrity_size = std::uint32_t(static_cast<aead_cipher const&>(*s.cipher).tag_size());
		s.mac.reset();
	} else {
		SSHC_ASSERT(s.mac, "Invalid mac");
		s.integrity_size = std::uint32_t(s.mac->size());
	}

	s.block_size = std::uint32_t(std::max(minimum_block_size, s.cipher->block_size()));
	SSHC_ASSERT(s.block_size < maximum_padding_size, "too big cipher block size");

	// the rekey counters run per key set, the sequence numbers continue
	s.transferred_bytes = 0;
}

void ssh_binary_packet::set_input_crypto(std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac) {
	logger_.log(logger::debug, "SSH starting to decrypt incoming packets [seq={}]", stream_in_.packet_sequence);

	set_crypto(stream_in_, std::move(cipher), std::move(mac));
	stream_in_.tag_buffer.resize(stream_in_.integrity_size);
}

void ssh_binary_packet::set_output_crypto(std::unique_ptr<sshc::cipher> cipher, std::unique_ptr<sshc::mac> mac) {
	logger_.log(logger::debug, "SSH starting to encrypt outgoing packets [seq={}]", stream_out_.packet_sequence);

	set_crypto(stream_out_, std::move(cipher), std::move(mac));
}

decode_result ssh_binary_packet::try_decode_header(span in_data) {
	if(in_data.size() < stream_in_.block_size) {
		return decode_result::need_more_data;
	}

	bool const aead = stream_in_.cipher && stream_in_.cipher->is_aead();

	// with aead the packet length is only authenticated, otherwise the first block hides it
	if(stream_in_.cipher && !aead) {
		auto block_span = safe_subspan(in_data, 0, stream_in_.block_size);
		if(!stream_in_.cipher->process(block_span, block_span)) {
			set_error(sshc_crypto_error, "failed to decrypt packet header");
			return decode_result::frame_error;
		}
	}

	std::uint32_t length = ntou32(in_data.data());

	// aead encrypts everything after the length field, others the whole packet
	std::size_t aligned = aead ? length : length + packet_length_size;

	if(length < minimum_packet_length || aligned % stream_in_.block_size != 0) {
		logger_.log(logger::debug, "SSH invalid packet length [length={}, block size={}]", length, stream_in_.block_size);
		set_error(sshc_invalid_packet, "invalid packet length");
		return decode_result::frame_error;
	}

	if(packet_length_size + length > config_.max_in_packet_size) {
		logger_.log(logger::debug, "SSH too big packet [length={}, max={}]", length, config_.max_in_packet_size);
		set_error(sshc_invalid_packet, "packet exceeds maximum size");
		return decode_result::frame_error;
	}

	stream_in_.current_packet.packet_size = packet_length_size + length + stream_in_.integrity_size;
	stream_in_.current_packet.status = in_packet_status::waiting_data;
	logger_.log(logger::debug_trace, "SSH try_decode_header [size={}]", stream_in_.current_packet.packet_size);

	return decode_result::need_more_data;
}

decode_result ssh_binary_packet::decode(span in_data) {
	if(error_ != ssh_noerror) {
		return decode_result::frame_error;
	}

	auto& current = stream_in_.current_packet;

	if(current.status == in_packet_status::data_ready) {
		return decode_result::packet;
	}

	if(current.status == in_packet_status::waiting_header) {
		if(try_decode_header(in_data) == decode_result::frame_error) {
			return decode_result::frame_error;
		}
	}

	if(current.status == in_packet_status::waiting_data && current.packet_size <= in_data.size()) {
		if(decrypt_packet(safe_subspan(in_data, 0, current.packet_size)).empty()) {
			logger_.log(logger::debug, "SSH decoding packet failed [error={}]", error_);
			return decode_result::frame_error;
		}
		return decode_result::packet;
	}

	return decode_result::need_more_data;
}

void ssh_binary_packet::packet_handled(in_buffer& in) {
	SSHC_ASSERT(stream_in_.current_packet.status == in_packet_status::data_ready, "no packet to consume");
	in.consume(stream_in_.current_packet.packet_size);
	stream_in_.current_packet.clear();
}

span ssh_binary_packet::decrypt_packet(span data) {
	SSHC_ASSERT(stream_in_.current_packet.packet_size == data.size(), "Invalid data size");

	span payload;

	if(stream_in_.cipher) {
		if(stream_in_.cipher->is_aead()) {
			payload = decrypt_aead(static_cast<aead_cipher&>(*stream_in_.cipher), data);
		} else {
			payload = decrypt_with_mac(data);
		}
	} else {
		payload = check_padding(data);
	}

	if(!payload.empty()) {
		auto& current = stream_in_.current_packet;
		current.status = in_packet_status::data_ready;
		current.sequence = stream_in_.packet_sequence;
		current.payload = payload;
		current.data_size = payload.size();
		stream_in_.transferred_bytes += data.size();
		// incremented for every packet and let wrap around
		++stream_in_.packet_sequence;
	}
	return payload;
}

span ssh_binary_packet::check_padding(span packet) {
	std::uint32_t length = ntou32(packet.data());
	std::uint8_t padding = std::to_integer<std::uint8_t>(packet[packet_length_size]);

	// padding length byte, padding and at least the message type byte
	if(padding < minimum_padding_size || std::size_t(padding) + padding_size + 1 > length) {
		logger_.log(logger::debug, "SSH invalid padding [length={}, padding={}]", length, padding);
		set_error(sshc_invalid_packet, "invalid padding length");
		return span{};
	}

	return safe_subspan(packet, packet_header_size, length - padding_size - padding);
}

span ssh_binary_packet::decrypt_aead(aead_cipher& cip, span data) {
	SSHC_ASSERT(stream_in_.integrity_size > 0, "invalid integrity size");
	SSHC_ASSERT(stream_in_.tag_buffer.size() == stream_in_.integrity_size, "Invalid tag buffer");

	std::size_t const enc_size = data.size() - packet_length_size - stream_in_.integrity_size;

	// the packet length is authenticated but not encrypted
	cip.process_auth(safe_subspan(data, 0, packet_length_size));

	auto enc = safe_subspan(data, packet_length_size, enc_size);
	if(!cip.process(enc, enc)) {
		set_error(sshc_crypto_error, "failed to decrypt packet");
		return span{};
	}

	cip.tag(stream_in_.tag_buffer);

	if(!compare_equal(stream_in_.tag_buffer, safe_subspan(data, packet_length_size + enc_size, stream_in_.integrity_size))) {
		logger_.log(logger::debug, "SSH decrypt_aead verifying tag failed [seq={}]", stream_in_.packet_sequence);
		set_error(ssh_mac_error, "verifying tag failed");
		return span{};
	}

	return check_padding(safe_subspan(data, 0, data.size() - stream_in_.integrity_size));
}

span ssh_binary_packet::decrypt_with_mac(span data) {
	SSHC_ASSERT(stream_in_.integrity_size > 0, "invalid integrity size");
	SSHC_ASSERT(stream_in_.tag_buffer.size() == stream_in_.integrity_size, "Invalid tag buffer");

	// the first block was decrypted already to find the packet length
	std::size_t const packet_size = data.size() - stream_in_.integrity_size;
	auto rest = safe_subspan(data, stream_in_.block_size, packet_size - stream_in_.block_size);
	if(!rest.empty() && !stream_in_.cipher->process(rest, rest)) {
		set_error(sshc_crypto_error, "failed to decrypt packet");
		return span{};
	}

	// mac = MAC(key, sequence_number || unencrypted_packet)
	std::byte seq_buf[4];
	u32ton(stream_in_.packet_sequence, seq_buf);

	stream_in_.mac->process(span{seq_buf, 4});
	stream_in_.mac->process(safe_subspan(data, 0, packet_size));
	stream_in_.mac->result(stream_in_.tag_buffer);

	if(!compare_equal(stream_in_.tag_buffer, safe_subspan(data, packet_size, stream_in_.integrity_size))) {
		logger_.log(logger::debug, "SSH decrypt_with_mac verifying mac failed [seq={}]", stream_in_.packet_sequence);
		set_error(ssh_mac_error, "verifying mac failed");
		return span{};
	}

	return check_padding(safe_subspan(data, 0, packet_size));
}

bool ssh_binary_packet::resize_out_buffer(std::size_t size) {
	logger_.log(logger::debug_trace, "SSH resize_out_buffer [size={}, buf size={}, buf used={}]", size, stream_out_.buffer.size(), stream_out_.data.size());

	std::size_t used_size = stream_out_.data.size();
	std::size_t free_size = stream_out_.buffer.size() - used_size;

	if(free_size >= size) {
		return true;
	}

	std::size_t new_size = used_size + size;
	if(new_size > config_.max_out_buffer_size) {
		set_error(sshc_memory_error, "asking for bigger buffer than max_out_buffer_size");
		return false;
	}

	stream_out_.buffer.resize(new_size);
	stream_out_.data = safe_subspan(stream_out_.buffer, 0, used_size);
	return true;
}

void ssh_binary_packet::shrink_out_buffer() {
	if(stream_out_.data.empty() && config_.shrink_out_buffer_size < stream_out_.buffer.size()) {
		logger_.log(logger::debug_verbose, "SSH shrink_out_buffer [old size={}, new size={}]", stream_out_.buffer.size(), config_.shrink_out_buffer_size);
		stream_out_.buffer.resize(config_.shrink_out_buffer_size);
		stream_out_.buffer.shrink_to_fit();
	}
}

std::size_t ssh_binary_packet::minimum_padding(std::size_t header_payload_size) const {
	if(stream_out_.cipher && stream_out_.cipher->is_aead()) {
		// the encrypted part needs to be modulo block_size, but the length is not encrypted
		header_payload_size -= packet_length_size;
	}
	std::size_t res = stream_out_.block_size - (header_payload_size % stream_out_.block_size);
	if(res < minimum_padding_size) {
		res += stream_out_.block_size;
	}
	return res;
}

std::optional<out_packet_record> ssh_binary_packet::alloc_out_packet(std::size_t data_size, out_buffer& buf) {
	SSHC_ASSERT(random_, "random generator not set");

	std::size_t padding_size = minimum_padding(packet_header_size + data_size);

	if(packet_header_size + data_size + padding_size > config_.max_out_packet_size) {
		logger_.log(logger::error, "SSH alloc_out_packet too big packet [size={}, max={}]", data_size, config_.max_out_packet_size);
		set_error(sshc_invalid_data, "packet exceeds maximum size");
		return std::nullopt;
	}

	if(config_.random_packet_padding) {
		// add random padding to make traffic analysing harder
		std::size_t max = (maximum_padding_size - padding_size) / stream_out_.block_size;
		std::size_t room = (config_.max_out_packet_size - packet_header_size - data_size - padding_size) / stream_out_.block_size;
		max = std::min(max, room);
		if(max) {
			padding_size += random_->random_uint(0, max) * stream_out_.block_size;
			logger_.log(logger::debug_verbose, "SSH adding random padding [size={}]", padding_size);
		}
	}

	out_packet_record res
		{ packet_header_size + data_size + padding_size + stream_out_.integrity_size
		, data_size
		, padding_size
		};

	// nothing pending, so the packet can go directly to the output
	if(stream_out_.data.empty()) {
		res.data_buffer = buf.get(res.size);
		if(!res.data_buffer.empty()) {
			res.data_buffer = safe_subspan(res.data_buffer, 0, res.size);
		}
	}

	res.inplace = !res.data_buffer.empty();

	if(!res.inplace) {
		if(!resize_out_buffer(res.size)) {
			logger_.log(logger::info, "SSH alloc_out_packet failed to allocate data buffer [size={}]", res.size);
			return std::nullopt;
		}
		res.data_buffer = safe_subspan(stream_out_.buffer, stream_out_.data.size(), res.size);
	}

	res.data = safe_subspan(res.data_buffer, packet_header_size, data_size);

	return res;
}

void ssh_binary_packet::aead_encrypt(aead_cipher& cip, const_span data, span out) {
	// authenticate the packet length as we don't encrypt it
	cip.process_auth(safe_subspan(data, 0, packet_length_size));
	data = safe_subspan(data, packet_length_size);
	out = safe_subspan(out, packet_length_size);
	cip.process(data, out);
	cip.tag(safe_subspan(out, data.size(), stream_out_.integrity_size));
}

void ssh_binary_packet::encrypt_with_mac(const_span data, span out) {
	// mac = MAC(key, sequence_number || unencrypted_packet)
	std::byte seq_buf[4];
	u32ton(stream_out_.packet_sequence, seq_buf);
	stream_out_.mac->process(span{seq_buf, 4});
	stream_out_.mac->process(data);
	stream_out_.mac->result(safe_subspan(out, data.size(), stream_out_.integrity_size));
	stream_out_.cipher->process(data, safe_subspan(out, 0, data.size()));
}

void ssh_binary_packet::encrypt_packet(const_span data, span out) {
	if(stream_out_.cipher) {
		if(stream_out_.cipher->is_aead()) {
			aead_encrypt(static_cast<aead_cipher&>(*stream_out_.cipher), data, out);
		} else {
			SSHC_ASSERT(stream_out_.mac, "MAC object not set");
			encrypt_with_mac(data, out);
		}
	}
}

bool ssh_binary_packet::create_out_packet(out_packet_record const& info, out_buffer& out_buf) {
	logger_.log(logger::debug_trace, "SSH create_out_packet [size={}, payload_size={}, padding_size={}]", info.size, info.payload_size, info.padding_size);
	SSHC_ASSERT(random_, "random generator not set");

	std::size_t const used = stream_out_.data.size();
	ssh_bf_writer p(info.data_buffer);

	bool ret = p.write(std::uint32_t(padding_size + info.payload_size + info.padding_size))
		&& p.write(std::uint8_t(info.padding_size))
		&& p.jump_over(info.payload_size) // payload is already in place
		&& p.add_random_range(*random_, info.padding_size);

	if(ret) {
		encrypt_packet(safe_subspan(info.data_buffer, 0, info.size - stream_out_.integrity_size), info.data_buffer);

		// incremented for every packet and let wrap around
		++stream_out_.packet_sequence;
		stream_out_.transferred_bytes += info.size;

		if(info.inplace) {
			out_buf.commit(info.size);
		} else {
			stream_out_.data = safe_subspan(stream_out_.buffer, 0, used + info.size);
		}
	} else {
		set_error(sshc_invalid_packet, "failed to write packet header");
	}
	return ret;
}

bool ssh_binary_packet::send_pending(out_buffer& out) {
	if(stream_out_.data.empty()) {
		return true;
	}

	logger_.log(logger::debug_trace, "SSH send_pending [data size={}]", stream_out_.data.size());

	std::size_t ask_size = std::min(out.max_size(), stream_out_.data.size());
	span buf;
	// the out buffer might not take everything at once, try smaller pieces
	while(ask_size && (buf = out.get(ask_size)).empty()) {
		ask_size /= 2;
	}

	if(ask_size) {
		copy(safe_subspan(stream_out_.data, 0, ask_size), buf);
		out.commit(ask_size);

		if(stream_out_.data.size() > ask_size) {
			span left = safe_subspan(stream_out_.data, ask_size);
			std::memmove(stream_out_.buffer.data(), left.data(), left.size());
			stream_out_.data = safe_subspan(stream_out_.buffer, 0, left.size());
		} else {
			stream_out_.data = span();
			shrink_out_buffer();
		}
	}

	return stream_out_.data.empty();
}

}
