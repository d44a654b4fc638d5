#include "ssh_public_key.hpp"
#include "ssh_binary_util.hpp"
#include "util.hpp"

#include "sshc/common/util.hpp"

namespace securepath::sshc {

ssh_public_key::ssh_public_key(std::shared_ptr<public_key> pkey)
: key_impl_(std::move(pkey))
{
}

key_type ssh_public_key::type() const {
	return key_impl_ ? key_impl_->type() : key_type::unknown;
}

bool ssh_public_key::valid() const {
	return static_cast<bool>(key_impl_);
}

bool ssh_public_key::verify(const_span msg, const_span signature) const {
	auto t = type();
	if(t == key_type::unknown) {
		return false;
	}

	ssh_bf_reader r(signature);
	std::string_view type;
	std::string_view payload;
	if(!r.read(type) || type != to_string(t) || !r.read(payload)) {
		return false;
	}

	return key_impl_->verify(msg, to_span(payload));
}

bool ssh_public_key::serialise(binout& out) const {
	ssh_bf_binout_writer w(out);

	using enum key_type;
	auto t = type();

	if(t == ssh_ed25519) {
		ed25519_public_key_data data;
		return key_impl_->fill_data(data)
			&& w.write(key_format_name(t))
			&& w.write(to_string_view(data.pubkey));
	} else if(same_key_format(t, ssh_rsa)) {
		rsa_public_key_data data{{}, {}, t};
		return key_impl_->fill_data(data)
			&& w.write(key_format_name(t))
			&& w.write(data.e)
			&& w.write(data.n);
	}
	return false;
}

std::string ssh_public_key::fingerprint(crypto_context const& crypto, crypto_call_context const& call) const {
	std::string res;
	if(valid()) {
		auto sha256 = crypto.construct_hash(hash_type::sha2_256, call);
		if(sha256) {
			hash_binout bo(*sha256);
			if(serialise(bo)) {
				res = "SHA256:" + encode_base64(sha256->digest());
			}
		}
	}
	return res;
}

static ssh_public_key load_ed25519_public_key(ssh_bf_reader& r, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh ed25519 public key");
	std::string_view pubkey;
	if(r.read(pubkey)) {
		if(pubkey.size() == ed25519_key_size) {
			ed25519_public_key_data data{to_span(pubkey)};
			return ssh_public_key(crypto.construct_public_key(data, call));
		} else {
			call.log.log(logger::debug_trace, "ssh ed25519 public key size not correct");
		}
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh ed25519 public key");
	}
	return {};
}

static ssh_public_key load_rsa_public_key(ssh_bf_reader& r, key_type algorithm, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh rsa public key [algorithm={}]", to_string(algorithm));
	std::string_view e, n;
	if(r.read(e) && r.read(n)) {
		return ssh_public_key(crypto.construct_public_key(rsa_public_key_data{to_umpint(e), to_umpint(n), algorithm}, call));
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh rsa public key");
	}
	return {};
}

ssh_public_key load_ssh_public_key(const_span data, crypto_context const& crypto, crypto_call_context const& call, key_type algorithm) {
	ssh_bf_reader r(data);
	std::string_view type;
	if(r.read(type)) {
		// with an algorithm given the blob must be of its key format
		if(algorithm != key_type::unknown && type != key_format_name(algorithm)) {
			call.log.log(logger::debug_trace, "Public key type does not match the algorithm [type={}, algorithm={}]", type, to_string(algorithm));
			return {};
		}
		if(type == "ssh-ed25519") {
			return load_ed25519_public_key(r, crypto, call);
		} else if(type == "ssh-rsa") {
			if(algorithm == key_type::unknown) {
				algorithm = key_type::rsa_sha2_256;
			}
			return load_rsa_public_key(r, algorithm, crypto, call);
		} else {
			call.log.log(logger::debug_trace, "Invalid type: {}", type);
		}
	}
	return {};
}

ssh_public_key load_base64_ssh_public_key(std::string_view s, crypto_context const& crypto, crypto_call_context const& call) {
	return load_ssh_public_key(decode_base64(s), crypto, call);
}

byte_vector to_byte_vector(ssh_public_key const& k) {
	byte_vector v;
	byte_vector_binout s(v);
	return k.serialise(s) ? v : byte_vector{};
}

}
