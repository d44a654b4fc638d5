#ifndef SSHC_CORE_SUPPORTED_ALGORITHMS_HEADER
#define SSHC_CORE_SUPPORTED_ALGORITHMS_HEADER

#include "kexinit.hpp"

#include "sshc/common/algo_list.hpp"
#include "sshc/crypto/ids.hpp"

#include <string>
#include <vector>

namespace securepath::sshc {

using kex_list = algo_list<kex_type>;
using key_list = algo_list<key_type>;
using cipher_list = algo_list<cipher_type>;
using mac_list = algo_list<mac_type>;
using compress_list = algo_list<compress_type>;

/// algorithm categories of the kexinit packet
enum class method_type {
	kex,
	host_key,
	crypt_cs,
	crypt_sc,
	mac_cs,
	mac_sc,
	comp_cs,
	comp_sc
};

std::string_view to_string(method_type);

class logger;

struct supported_algorithms {
	kex_list kexes;

	// supported host key algorithms
	key_list host_keys;

	cipher_list client_server_ciphers;
	cipher_list server_client_ciphers;

	mac_list client_server_macs;
	mac_list server_client_macs;

	compress_list client_server_compress{compress_type::none};
	compress_list server_client_compress{compress_type::none};

public:
	bool valid() const;

	void dump(std::string_view tag, logger&) const;

	/** \brief Set preference list for one category from comma separated names
	 *
	 *  Unknown names are skipped, fails if nothing we implement is left
	 */
	bool set_preference(method_type, std::string_view names);

	/// comma separated preference list of the category
	std::string preference(method_type) const;
};

/// every algorithm implemented, in default preference order
supported_algorithms all_supported_algorithms();

/// names of implemented algorithms of the category
std::vector<std::string_view> supported_algorithm_names(method_type);

}

#endif
