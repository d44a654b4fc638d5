#include "kex.hpp"

#include "packet_ser_impl.hpp"
#include "ssh_config.hpp"
#include "util.hpp"

#include <type_traits>

namespace securepath::sshc {

std::string_view to_string(kex_state s) {
	using enum kex_state;
	switch(s) {
		case none: return "none";
		case inprogress: return "inprogress";
		case succeeded: return "succeeded";
		case error: return "error";
	};
	return "unknown";
}

hash_type kex_hash_type(kex_type t) {
	using enum kex_type;
	switch(t) {
		case curve25519_sha256: [[fallthrough]];
		case libssh_curve25519_sha256: [[fallthrough]];
		case dh_group14_sha256:
			return hash_type::sha2_256;
		case dh_group16_sha512:
			return hash_type::sha2_512;
		case unknown:
			return hash_type::unknown;
	}
	return hash_type::unknown;
}

key_exchange_type kex_exchange_type(kex_type t) {
	using enum kex_type;
	switch(t) {
		case curve25519_sha256:        return key_exchange_type::X25519;
		case libssh_curve25519_sha256: return key_exchange_type::X25519;
		case dh_group14_sha256:        return key_exchange_type::dh_group14;
		case dh_group16_sha512:        return key_exchange_type::dh_group16;
		case unknown:                  return key_exchange_type::unknown;
	}
	return key_exchange_type::unknown;
}

kex::kex(kex_type t, kex_method m, kex_context c)
: kex(transport_side::client, t, std::move(m), c)
{
}

kex::kex(transport_side side, kex_type t, kex_method m, kex_context c)
: side_(side)
, type_(t)
, hash_type_(kex_hash_type(t))
, method_(std::move(m))
, context_(c)
{
	context_.logger().log(logger::debug_trace, "SSH constructing kex [type={}, side={}]", to_string(t), side == transport_side::client ? "client" : "server");
}

kex_state kex::set_state(kex_state s) {
	SSHC_ASSERT(state_ == kex_state::none || state_ == kex_state::inprogress, "invalid state change");
	state_ = s;
	return s;
}

void kex::set_crypto_configuration(sshc::crypto_configuration conf) {
	conf_ = conf;
}

kex_state kex::initiate() {
	return std::visit([&](auto& m) { return client_initiate(m); }, method_);
}

template<typename Method>
kex_state kex::client_initiate(Method& m) {
	if(context_.send_packet<typename Method::init_packet>(Method::encode(m.exchange->public_key()))) {
		return set_state(kex_state::inprogress);
	}
	return set_error(ssh_key_exchange_failed, "Failed to initiate kex");
}

kex_state kex::handle(ssh_packet_type type, const_span payload) {
	if(state_ != kex_state::inprogress) {
		return set_error(ssh_key_exchange_failed, "Invalid kex state [state={}]", to_string(state_));
	}

	return std::visit([&](auto& m) { return client_handle(m, type, payload); }, method_);
}

template<typename Method>
kex_state kex::client_handle(Method& m, ssh_packet_type type, const_span payload) {
	if(type != Method::reply_packet::packet_type) {
		return set_error(ssh_key_exchange_failed, "Wrong kex packet [type={}]", type);
	}

	typename Method::reply_packet::load packet(ser::match_type_t, payload);
	if(!packet) {
		return set_error(ssh_key_exchange_failed, "Invalid kex reply packet");
	}

	auto & [host_key, server_eph_key, sig] = packet;

	const_span remote_public = Method::decode(server_eph_key);
	auto secret = m.exchange->agree(remote_public);
	if(secret.empty()) {
		return set_error(ssh_key_exchange_failed, "Invalid shared secret");
	}

	auto host_key_span = to_span(host_key);
	auto hash = calculate_exchange_hash(host_key_span, remote_public, secret);
	if(hash.empty()) {
		return set_error(ssh_key_exchange_failed, "Failed to calculate exchange hash");
	}

	ssh_public_key hkey = load_ssh_public_key(host_key_span, context_.ccontext(), context_.call_context(), conf_.host_key);
	if(!hkey.valid()) {
		return set_error(ssh_key_exchange_failed, "Failed to load server host key");
	}

	if(hkey.type() != conf_.host_key) {
		return set_error(ssh_key_exchange_failed, "Server host key does not match negotiated algorithm [got={}, expected={}]", to_string(hkey.type()), to_string(conf_.host_key));
	}

	if(!hkey.verify(hash, to_span(sig))) {
		return set_error(ssh_key_exchange_failed, "Failed to verify exchange hash signature");
	}

	set_data(std::move(hash), std::move(secret), byte_vector(host_key_span.begin(), host_key_span.end()));
	return set_state(kex_state::succeeded);
}

static void hash_ident_string(ssh_bf_binout_writer& w, ssh_version const& v) {
	std::string vs = "SSH-" + v.ssh + "-" + v.software;
	if(!v.comment.empty()) {
		vs += " " + v.comment;
	}
	w.write(std::string_view(vs));
}

/*
	H = HASH(V_C || V_S || I_C || I_S || K_S || Q_C/e || Q_S/f || K)

	string         V_C, client's identification string (CR and LF excluded)
	string         V_S, server's identification string (CR and LF excluded)
	string         I_C, payload of the client's SSH_MSG_KEXINIT
	string         I_S, payload of the server's SSH_MSG_KEXINIT
	string         K_S, server's public host key
	string/mpint   Q_C/e, client's ephemeral public key
	string/mpint   Q_S/f, server's ephemeral public key
	mpint          K,   shared secret
*/
byte_vector kex::calculate_exchange_hash(const_span host_key, const_span remote_public, const_span secret) {
	auto hash = context_.ccontext().construct_hash(hash_type_, context_.call_context());
	if(!hash) {
		context_.logger().log(logger::error, "SSH Could not construct hash [type={}]", to_string(hash_type_));
		return {};
	}

	hash_binout bo(*hash);
	ssh_bf_binout_writer w(bo);

	kex_init_data const& kinit = context_.init_data();
	bool const client = side_ == transport_side::client;

	hash_ident_string(w, client ? kinit.local_ver : kinit.remote_ver);
	hash_ident_string(w, client ? kinit.remote_ver : kinit.local_ver);
	w.write(to_string_view(client ? kinit.local_kexinit : kinit.remote_kexinit));
	w.write(to_string_view(client ? kinit.remote_kexinit : kinit.local_kexinit));
	w.write(to_string_view(host_key));
	std::visit([&](auto const& m) {
			using method = std::decay_t<decltype(m)>;
			const_span local_public = m.exchange->public_key();
			w.write(method::encode(client ? local_public : remote_public));
			w.write(method::encode(client ? remote_public : local_public));
		}, method_);
	w.write(const_mpint_span{secret});

	return hash->digest();
}

void kex::set_data(byte_vector exhash, byte_vector secret, byte_vector host_key) {
	exchange_hash_ = std::move(exhash);
	secret_ = std::move(secret);
	server_host_key_ = std::move(host_key);

	// the first exchange hash stays as the session id for the whole connection
	if(context_.init_data().session_id.empty()) {
		session_id_ = exchange_hash_;
	} else {
		session_id_ = context_.init_data().session_id;
	}

	context_.logger().log(logger::debug_trace, "SSH kex data set [hash size={}, secret size={}]", exchange_hash_.size(), secret_.size());
}

const_span kex::session_id() const {
	return session_id_;
}

ssh_public_key kex::server_host_key() const {
	return load_ssh_public_key(server_host_key_, context_.ccontext(), context_.call_context(), conf_.host_key);
}

std::optional<crypto_pair> kex::construct_in_crypto_pair() {
	return construct_crypto_pair(cipher_dir::decrypt, conf_.in, side_ == transport_side::client ? "BDF" : "ACE");
}

std::optional<crypto_pair> kex::construct_out_crypto_pair() {
	return construct_crypto_pair(cipher_dir::encrypt, conf_.out, side_ == transport_side::client ? "ACE" : "BDF");
}

std::optional<crypto_pair> kex::construct_crypto_pair(cipher_dir dir, crypto_configuration::type const& conf, char const* letters) {
	auto hash = context_.ccontext().construct_hash(hash_type_, context_.call_context());
	if(!hash) {
		return std::nullopt;
	}

	auto iv = derive_crypto_material(*hash, cipher_iv_size(conf.cipher), letters[0]);
	auto key = derive_crypto_material(*hash, cipher_key_size(conf.cipher), letters[1]);

	crypto_pair res;
	res.cipher = context_.ccontext().construct_cipher(conf.cipher, dir, key, iv, context_.call_context());
	if(!res.cipher) {
		context_.logger().log(logger::error, "SSH Failed to construct cipher [type={}]", to_string(conf.cipher));
		return std::nullopt;
	}

	if(!res.cipher->is_aead()) {
		auto mac_key = derive_crypto_material(*hash, mac_key_size(conf.mac), letters[2]);
		res.mac = context_.ccontext().construct_mac(conf.mac, mac_key, context_.call_context());
		if(!res.mac) {
			context_.logger().log(logger::error, "SSH Failed to construct mac [type={}]", to_string(conf.mac));
			return std::nullopt;
		}
	}

	return res;
}

/*
	K1 = HASH(K || H || X || session_id)   (X is "A".."F")
	K2 = HASH(K || H || K1)
	K3 = HASH(K || H || K1 || K2)
	...
	key = K1 || K2 || K3 || ...
*/
byte_vector kex::derive_crypto_material(hash& h, std::size_t size, char letter) {
	hash_binout hbout(h);
	ssh_bf_binout_writer w(hbout);

	w.write(const_mpint_span{secret_});
	w.write(const_span(exchange_hash_));
	w.write(std::uint8_t(letter));
	w.write(const_span(session_id_));
	byte_vector res = h.digest();

	while(res.size() < size) {
		w.write(const_mpint_span{secret_});
		w.write(const_span(exchange_hash_));
		w.write(const_span(res));
		auto d = h.digest();
		res.insert(res.end(), d.begin(), d.end());
	}

	res.resize(size);
	return res;
}

std::optional<kex_method> construct_kex_method(kex_type t, kex_context const& kex_c) {
	auto exchange = kex_c.ccontext().construct_key_exchange(kex_exchange_type(t), kex_c.call_context());
	if(!exchange) {
		kex_c.logger().log(logger::error, "SSH Failed to construct key exchange [kex={}]", to_string(t));
		return std::nullopt;
	}

	using enum kex_type;
	switch(t) {
		case curve25519_sha256: [[fallthrough]];
		case libssh_curve25519_sha256:
			return kex_method{ecdh_method{std::move(exchange)}};
		case dh_group14_sha256: [[fallthrough]];
		case dh_group16_sha512:
			return kex_method{dh_method{std::move(exchange)}};
		case unknown:
			break;
	}
	return std::nullopt;
}

std::unique_ptr<kex> construct_kex(kex_type t, kex_context kex_c) {
	auto method = construct_kex_method(t, kex_c);
	if(!method) {
		return nullptr;
	}
	return std::make_unique<kex>(t, std::move(*method), kex_c);
}

}
