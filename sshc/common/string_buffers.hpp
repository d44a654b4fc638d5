#ifndef SSHC_COMMON_STRING_BUFFERS_HEADER
#define SSHC_COMMON_STRING_BUFFERS_HEADER

#include "buffers.hpp"

namespace securepath::sshc {

/// Input buffer that keeps the received bytes in a string, consumed bytes are dropped from the front
class string_in_buffer : public in_buffer {
public:
	string_in_buffer(std::string s = {}) : data(std::move(s)) {}

	span get() override {
		return span{reinterpret_cast<std::byte*>(data.data()+pos), data.size()-pos};
	}

	void consume(std::size_t size) override {
		SSHC_ASSERT(size <= data.size()-pos, "consuming more than available");
		pos += size;
		if(pos == data.size()) {
			data.clear();
			pos = 0;
		}
	}

	void add(std::string_view s) {
		compact();
		data.append(s);
	}

	void add(const_span s) {
		add(to_string_view(s));
	}

	std::size_t size() const {
		return data.size()-pos;
	}

	bool empty() const {
		return size() == 0;
	}

	std::string data;
	std::size_t pos{};

private:
	void compact() {
		if(pos) {
			data.erase(0, pos);
			pos = 0;
		}
	}
};

/// Output buffer that collects the committed bytes in a string, optionally limited to maximum size
class string_out_buffer : public out_buffer {
public:
	string_out_buffer(std::size_t max_size = std::size_t(-1))
	: maximum_size(max_size)
	{}

	span get(std::size_t size) override {
		if(data.size() - used < size) {
			if(used+size > maximum_size) {
				return span();
			}
			data.resize(used + size);
		}
		return span{reinterpret_cast<std::byte*>(data.data()+used), data.size()-used};
	}

	span expand(std::size_t new_size, std::size_t) override {
		return get(new_size);
	}

	void commit(std::size_t size) override {
		SSHC_ASSERT(size <= data.size()-used, "committing more than reserved");
		used += size;
	}

	std::size_t max_size() const override { return maximum_size; }

	bool empty() const {
		return used == 0;
	}

	std::size_t size() const {
		return used;
	}

	std::string extract_committed() {
		auto s = data.substr(0, used);
		data.erase(0, used);
		used = 0;
		return s;
	}

	/// drop first n committed bytes (after they were written out)
	void consume_committed(std::size_t n) {
		SSHC_ASSERT(n <= used, "consuming more than committed");
		data.erase(0, n);
		used -= n;
	}

	std::size_t const maximum_size;
	std::string data;
	std::size_t used{};
};

}

#endif
