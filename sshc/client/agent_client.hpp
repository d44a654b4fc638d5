#ifndef SSHC_CLIENT_AGENT_CLIENT_HEADER
#define SSHC_CLIENT_AGENT_CLIENT_HEADER

#include "byte_stream.hpp"

#include "sshc/common/logger.hpp"
#include "sshc/core/ssh_private_key.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace securepath::sshc {

// ssh-agent protocol message numbers (draft-miller-ssh-agent)
enum agent_message : std::uint8_t {
	ssh_agent_failure             = 5,
	ssh_agent_success             = 6,
	ssh_agentc_request_identities = 11,
	ssh_agent_identities_answer   = 12,
	ssh_agentc_sign_request       = 13,
	ssh_agent_sign_response       = 14
};

// sign request flags selecting the rsa signature hash
std::uint32_t const ssh_agent_rsa_sha2_256 = 2;
std::uint32_t const ssh_agent_rsa_sha2_512 = 4;

// agent replies larger than this are treated as broken
std::size_t const max_agent_message_size = 256*1024;

struct agent_identity {
	byte_vector key_blob;
	std::string comment;
};

/** \brief Client for a running ssh-agent
 *
 *  Talks the agent protocol over the given stream, one request at a time. The private keys stay in
 *  the agent, signing_keys() returns keys that forward their signatures to it and can be used as
 *  auth_credentials keys.
 */
class agent_client : public std::enable_shared_from_this<agent_client> {
public:
	agent_client(logger&, std::unique_ptr<byte_stream>, std::chrono::milliseconds timeout = std::chrono::seconds(10));

	/// keys the agent holds, nullopt if the agent did not answer properly
	std::optional<std::vector<agent_identity>> request_identities();

	/// returns ssh encoded signature blob, nullopt if the agent refused or failed
	std::optional<byte_vector> sign(const_span key_blob, const_span data, std::uint32_t flags);

	/// agent keys of the types we support (rsa keys sign with rsa-sha2-256), the keys keep this client alive
	std::vector<ssh_private_key> signing_keys(crypto_context const&, crypto_call_context const&);

private:
	std::optional<byte_vector> transact(byte_vector const& request);
	bool receive_all(span out);

private:
	logger& log_;
	std::mutex mutex_;
	std::unique_ptr<byte_stream> stream_;
	std::chrono::milliseconds timeout_;
};

/// sign request flags for the signature algorithm
std::uint32_t agent_sign_flags(key_type);

}

#endif
