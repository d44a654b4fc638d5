#ifndef SSHC_CORE_KEXINIT_HEADER
#define SSHC_CORE_KEXINIT_HEADER

#include "errors.hpp"
#include "sshc/crypto/ids.hpp"

#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace securepath::sshc {

enum class kex_type {
	unknown = 0,
	curve25519_sha256,
	libssh_curve25519_sha256,
	dh_group14_sha256,
	dh_group16_sha512
};

std::string_view to_string(kex_type);
kex_type from_string(type_tag<kex_type>, std::string_view);

struct crypto_configuration {
	kex_type kex{};
	key_type host_key{};

	struct type {
		cipher_type cipher{};
		mac_type mac{};
		compress_type compress{};

		friend bool operator==(type const&, type const&) = default;
	} in, out;

	bool valid() const;

	friend bool operator==(crypto_configuration const&, crypto_configuration const&) = default;
};

std::ostream& operator<<(std::ostream&, crypto_configuration const&);

/** \brief Pick the first name of the initiator list that the responder also lists
 *
 *  This is the selection rule for every algorithm category of the kexinit.
 */
std::optional<std::string_view> negotiate(std::vector<std::string_view> const& initiator, std::vector<std::string_view> const& responder);

struct supported_algorithms;
class logger;

/** \brief Algorithm selection between the client and the server kexinit
 *
 *  The agreed in and out directions are from the client point of view.
 */
class kexinit_agreement {
public:
	kexinit_agreement(logger&, supported_algorithms const& client);
	// the algorithms are referenced, not copied
	kexinit_agreement(logger&, supported_algorithms&&) = delete;

	bool agree(supported_algorithms const& server);
	bool was_guess_correct() const;

	crypto_configuration agreed_configuration() const;

	/// name of the category that failed when agree returns false
	std::string_view failed_category() const { return failed_category_; }

private:
	bool fail(std::string_view category);

private:
	logger& logger_;
	supported_algorithms const& client_;
	std::optional<crypto_configuration> agreed_;
	bool guess_was_correct_{};
	std::string_view failed_category_;
};

}

#endif
