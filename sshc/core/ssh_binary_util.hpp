#ifndef SSHC_CORE_BINARY_UTIL_HEADER
#define SSHC_CORE_BINARY_UTIL_HEADER

#include "util.hpp"
#include "sshc/common/types.hpp"
#include "sshc/common/util.hpp"
#include "sshc/crypto/random.hpp"

#include <cstring>
#include <optional>

namespace securepath::sshc {

/// mpint magnitude without the leading zero bytes
inline const_span mpint_digits(const_mpint_span s) {
	const_span d = s.data;
	while(!d.empty() && d[0] == std::byte{0x0}) {
		d = d.subspan(1);
	}
	return d;
}

// unsigned value with most significant bit set needs extra zero byte in front to stay positive
inline bool requires_padding(const_mpint_span s) {
	const_span d = mpint_digits(s);
	return !d.empty()
		&& s.sign == const_mpint_span::unsigned_t
		&& (std::to_integer<std::uint8_t>(d[0]) & 0x80);
}

inline std::size_t encoded_size(const_mpint_span s) {
	return 4 + mpint_digits(s).size() + (requires_padding(s) ? 1 : 0);
}

/** \brief SSH binary format (rfc4251 section 5) writer
 *
 *  Derived class provides put(const_span) to output the raw bytes
 */
template<typename Derived>
class ssh_bf_writer_base {
public:
	bool write(std::uint64_t v) {
		std::byte arr[8];
		u64ton(v, arr);
		return put(arr);
	}

	bool write(std::uint32_t v) {
		std::byte arr[4];
		u32ton(v, arr);
		return put(arr);
	}

	bool write(std::uint8_t v) {
		std::byte b{v};
		return put(const_span(&b, 1));
	}

	bool write(std::byte v) {
		return put(const_span(&v, 1));
	}

	bool write(bool v) {
		return write(std::uint8_t{v});
	}

	bool write(std::string_view v) {
		return write(std::uint32_t(v.size())) && put(to_span(v));
	}

	// raw bytes without length
	bool write(const_span s) {
		return put(s);
	}

	template<std::size_t S>
	bool write(std::span<std::byte const, S> const& s) {
		return put(const_span(s.data(), s.size()));
	}

	bool write(const_mpint_span mpint) {
		const_span d = mpint_digits(mpint);
		if(requires_padding(mpint)) {
			return write(std::uint32_t(d.size()+1))
				&& write(std::uint8_t{0x0})
				&& put(d);
		}
		return write(std::uint32_t(d.size())) && put(d);
	}

private:
	bool put(const_span s) {
		return static_cast<Derived&>(*this).put(s);
	}
};

/// Writer to fixed span or to growing byte_vector
class ssh_bf_writer : public ssh_bf_writer_base<ssh_bf_writer> {
public:
	ssh_bf_writer(span out)
	: out_(out)
	{
	}

	ssh_bf_writer(byte_vector& out, std::size_t pos = 0)
	: buffer_(&out)
	, out_(out)
	, pos_(pos)
	{
	}

	using ssh_bf_writer_base::write;

	span used_span() const {
		return out_.subspan(0, pos_);
	}

	span total_span() const {
		return out_;
	}

	std::size_t used_size() const {
		return pos_;
	}

	std::size_t size_left() const {
		return out_.size() - pos_;
	}

	bool add_random_range(random& gen, std::size_t size) {
		bool ret = reserve(size);
		if(ret) {
			gen.random_bytes(span{out_.data()+pos_, size});
			pos_ += size;
		}
		return ret;
	}

	bool jump_over(std::size_t size) {
		bool ret = reserve(size);
		if(ret) {
			pos_ += size;
		}
		return ret;
	}

private:
	friend class ssh_bf_writer_base<ssh_bf_writer>;

	bool reserve(std::size_t s) {
		if(size_left() >= s) {
			return true;
		}
		if(buffer_) {
			buffer_->resize(pos_+s);
			out_ = span(*buffer_);
			return true;
		}
		return false;
	}

	bool put(const_span s) {
		bool ret = reserve(s.size());
		if(ret && !s.empty()) {
			std::memcpy(out_.data()+pos_, s.data(), s.size());
			pos_ += s.size();
		}
		return ret;
	}

private:
	byte_vector* buffer_{};
	span out_;
	std::size_t pos_{};
};

/// Writer that passes everything to binout, for example to calculate hash over ssh encoded data
class ssh_bf_binout_writer : public ssh_bf_writer_base<ssh_bf_binout_writer> {
public:
	ssh_bf_binout_writer(binout& out)
	: out_(out)
	{}

	using ssh_bf_writer_base::write;

private:
	friend class ssh_bf_writer_base<ssh_bf_binout_writer>;

	bool put(const_span s) {
		return out_.process(s);
	}

private:
	binout& out_;
};

/// SSH binary format reader, every read fails without consuming if there is not enough data
class ssh_bf_reader {
public:
	ssh_bf_reader(const_span in)
	: in_(in)
	{
	}

	const_span used_span() const {
		return in_.subspan(0, pos_);
	}

	const_span total_span() const {
		return in_;
	}

	const_span rest_of_span() const {
		return in_.subspan(pos_);
	}

	std::size_t used_size() const {
		return pos_;
	}

	std::size_t size_left() const {
		return in_.size() - pos_;
	}

	bool read(std::uint64_t& v) {
		bool ret = size_left() >= 8;
		if(ret) {
			v = ntou64(in_.data() + pos_);
			pos_ += 8;
		}
		return ret;
	}

	bool read(std::uint32_t& v) {
		bool ret = size_left() >= 4;
		if(ret) {
			v = ntou32(in_.data() + pos_);
			pos_ += 4;
		}
		return ret;
	}

	bool read(std::uint8_t& v) {
		bool ret = size_left() >= 1;
		if(ret) {
			v = std::to_integer<std::uint8_t>(in_[pos_++]);
		}
		return ret;
	}

	bool read(std::byte& v) {
		bool ret = size_left() >= 1;
		if(ret) {
			v = in_[pos_++];
		}
		return ret;
	}

	bool read(bool& v) {
		std::uint8_t b{};
		bool ret = read(b);
		if(ret) {
			v = b != 0;
		}
		return ret;
	}

	bool read(std::string_view& v) {
		std::uint32_t size{};
		auto const start = pos_;
		bool ret = read(size) && size_left() >= size;
		if(ret) {
			v = std::string_view{reinterpret_cast<char const*>(in_.data())+pos_, size};
			pos_ += size;
		} else {
			pos_ = start;
		}
		return ret;
	}

	bool read(const_mpint_span& mpint) {
		std::string_view s;
		bool ret = read(s);
		if(ret) {
			if(s.empty()) {
				mpint = const_mpint_span{};
			} else if(std::uint8_t(s[0]) & 0x80) {
				mpint = const_mpint_span{to_span(s), const_mpint_span::signed_t};
			} else {
				mpint = to_umpint(s);
			}
		}
		return ret;
	}

	template<std::size_t S>
	bool read(std::optional<std::span<std::byte const, S>>& s) {
		bool ret = size_left() >= S;
		if(ret) {
			s = std::span<std::byte const, S>(in_.data()+pos_, S);
			pos_ += S;
		}
		return ret;
	}

	bool jump_over(std::size_t size) {
		bool res = size_left() >= size;
		if(res) {
			pos_ += size;
		}
		return res;
	}

private:
	const_span in_;
	std::size_t pos_{};
};

}

#endif
