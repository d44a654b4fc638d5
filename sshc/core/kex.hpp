#ifndef SSHC_CORE_KEX_HEADER
#define SSHC_CORE_KEX_HEADER

#include "kexinit.hpp"
#include "packet_types.hpp"
#include "ssh_public_key.hpp"
#include "transport_base.hpp"
#include "kex/kex_method.hpp"
#include "sshc/common/logger.hpp"
#include "sshc/crypto/crypto_context.hpp"

#include <memory>
#include <optional>

namespace securepath::sshc {

enum class kex_state {
	none,
	inprogress,
	succeeded,
	error
};

std::string_view to_string(kex_state);

struct crypto_pair {
	std::unique_ptr<sshc::cipher> cipher;
	std::unique_ptr<sshc::mac> mac;
};

/// Inputs of the exchange hash collected by the transport, session_id is empty until the first kex is done
struct kex_init_data {
	ssh_version local_ver;
	ssh_version remote_ver;
	byte_vector local_kexinit;
	byte_vector remote_kexinit;
	byte_vector session_id;
};

class kex_context {
public:
	kex_context(transport_base& transport, kex_init_data const& init_data)
	: transport_(transport)
	, init_data_(init_data)
	{}

	template<typename Packet, typename... Args>
	bool send_packet(Args&&... args) {
		logger().log(logger::debug_trace, "SSH kex sending packet [type={}]", int(Packet::packet_type));
		return sshc::send_packet<Packet>(transport_, std::forward<Args>(args)...);
	}

	ssh_config const& config() const { return transport_.config(); }
	kex_init_data const& init_data() const { return init_data_; }
	crypto_context const& ccontext() const { return transport_.crypto(); }
	crypto_call_context call_context() const { return transport_.call_context(); }
	sshc::logger& logger() const { return transport_.call_context().log; }

private:
	transport_base& transport_;
	kex_init_data const& init_data_;
};

hash_type kex_hash_type(kex_type);
key_exchange_type kex_exchange_type(kex_type);

/** \brief One key exchange run, from the method specific messages to the derived keys
 *
 *  The method is picked by the negotiated kex name and held as a variant, everything around
 *  it (exchange hash, host key signature, key derivation) is shared.
 *  This class runs the client side of the exchange.
 */
class kex {
public:
	kex(kex_type, kex_method, kex_context);
	virtual ~kex() = default;

	kex_type type() const { return type_; }
	kex_state state() const { return state_; }

	/// sends our ephemeral key, can be called before the crypto configuration is set
	virtual kex_state initiate();
	virtual kex_state handle(ssh_packet_type type, const_span payload);

	void set_crypto_configuration(sshc::crypto_configuration conf);
	sshc::crypto_configuration const& configuration() const { return conf_; }

	std::optional<crypto_pair> construct_in_crypto_pair();
	std::optional<crypto_pair> construct_out_crypto_pair();

	const_span session_id() const;
	const_span exchange_hash() const { return exchange_hash_; }

	/// server host key blob from the reply
	const_span server_host_key_blob() const { return server_host_key_; }
	ssh_public_key server_host_key() const;

	ssh_error_code error() const { return error_; }
	std::string error_message() const { return err_message_; }

protected:
	// the responding side of the exchange derives from this
	kex(transport_side, kex_type, kex_method, kex_context);

	kex_state set_state(kex_state s);

	template<typename... Args>
	kex_state set_error(ssh_error_code code, std::string_view msg, Args&&... args) {
		err_message_ = context_.logger().format(msg, std::forward<Args>(args)...);
		error_ = code;
		context_.logger().log_line(logger::error, err_message_);
		state_ = kex_state::error;
		return state_;
	}

	/// H over the identification strings, kexinit payloads, host key, both ephemeral keys and the secret
	byte_vector calculate_exchange_hash(const_span host_key, const_span remote_public, const_span secret);

	void set_data(byte_vector exhash, byte_vector secret, byte_vector host_key);

protected:
	transport_side side_;
	kex_type type_;
	hash_type hash_type_;
	kex_method method_;
	kex_context context_;
	kex_state state_{kex_state::none};
	sshc::crypto_configuration conf_;

private:
	template<typename Method>
	kex_state client_initiate(Method&);
	template<typename Method>
	kex_state client_handle(Method&, ssh_packet_type, const_span payload);

	std::optional<crypto_pair> construct_crypto_pair(cipher_dir dir, crypto_configuration::type const& conf, char const* letters);
	byte_vector derive_crypto_material(hash& h, std::size_t size, char letter);

private:
	byte_vector session_id_;
	byte_vector exchange_hash_;
	byte_vector secret_;
	byte_vector server_host_key_;

	ssh_error_code error_{ssh_noerror};
	std::string err_message_;
};

/// ephemeral key exchange for the kex type, nullopt if it is not implemented
std::optional<kex_method> construct_kex_method(kex_type, kex_context const&);

/// client side kex, nullptr if the kex type is not implemented or the exchange cannot be constructed
std::unique_ptr<kex> construct_kex(kex_type, kex_context);

}

#endif
