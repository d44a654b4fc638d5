#include "sshc/crypto/random.hpp"

#include <limits>
#include <memory>

#include <nettle/yarrow.h>

namespace securepath::sshc::nettle {

class yarrow_random : public sshc::random {
public:
	yarrow_random() {
		nettle_yarrow256_init(&ctx_, 0, nullptr);
	}

	bool seed() {
		std::byte seed[YARROW256_SEED_FILE_SIZE];
		if(!system_entropy(seed)) {
			return false;
		}
		nettle_yarrow256_seed(&ctx_, sizeof(seed), to_uint8_ptr(const_span(seed)));
		return nettle_yarrow256_is_seeded(&ctx_) == 1;
	}

	std::size_t random_uint(std::size_t min, std::size_t max) override {
		SSHC_ASSERT(min <= max, "invalid range");
		std::size_t range = max - min;
		if(range == std::numeric_limits<std::size_t>::max()) {
			return next();
		}
		std::size_t const count = range + 1;
		// reject values from the incomplete last bucket so every value is equally likely
		std::size_t const limit = std::numeric_limits<std::size_t>::max() - std::numeric_limits<std::size_t>::max() % count;
		std::size_t v;
		do {
			v = next();
		} while(v >= limit);
		return min + v % count;
	}

	void random_bytes(span output) override {
		nettle_yarrow256_random(&ctx_, output.size(), to_uint8_ptr(output));
	}

private:
	std::size_t next() {
		std::size_t v{};
		nettle_yarrow256_random(&ctx_, sizeof(v), reinterpret_cast<std::uint8_t*>(&v));
		return v;
	}

private:
	yarrow256_ctx ctx_;
};

std::unique_ptr<sshc::random> create_random() {
	auto r = std::make_unique<yarrow_random>();
	if(!r->seed()) {
		return nullptr;
	}
	return r;
}

}
