#include "agent_client.hpp"

#include "sshc/core/ssh_binary_util.hpp"
#include "sshc/crypto/private_key.hpp"

#include <cstring>

namespace securepath::sshc {

std::uint32_t agent_sign_flags(key_type t) {
	switch(t) {
		case key_type::rsa_sha2_256: return ssh_agent_rsa_sha2_256;
		case key_type::rsa_sha2_512: return ssh_agent_rsa_sha2_512;
		default: return 0;
	}
}

namespace {

/// private key held by the agent, every signature is a round trip to it
class agent_private_key : public private_key {
public:
	agent_private_key(std::shared_ptr<agent_client> agent, byte_vector blob, ssh_public_key pub, std::size_t sig_size)
	: agent_(std::move(agent))
	, blob_(std::move(blob))
	, pub_(std::move(pub))
	, sig_size_(sig_size)
	{
	}

	key_type type() const override {
		return pub_.type();
	}

	std::shared_ptr<sshc::public_key> public_key() const override {
		return pub_.crypto_key();
	}

	std::size_t signature_size() const override {
		return sig_size_;
	}

	bool sign(const_span in, span out) const override {
		if(out.size() < sig_size_) {
			return false;
		}
		auto blob = agent_->sign(blob_, in, agent_sign_flags(type()));
		if(!blob) {
			return false;
		}

		// the agent answers with the ssh signature blob, we give out the raw signature
		ssh_bf_reader r(*blob);
		std::string_view sig_type;
		std::string_view sig;
		if(!r.read(sig_type) || sig_type != to_string(type()) || !r.read(sig) || sig.size() > sig_size_) {
			return false;
		}

		// rsa signatures are padded to the modulus size
		std::size_t padding = sig_size_ - sig.size();
		std::memset(out.data(), 0, padding);
		std::memcpy(out.data() + padding, sig.data(), sig.size());
		return true;
	}

	// the private part never leaves the agent
	bool fill_data(private_key_data&) const override {
		return false;
	}

private:
	std::shared_ptr<agent_client> agent_;
	byte_vector blob_;
	ssh_public_key pub_;
	std::size_t sig_size_;
};

std::optional<std::size_t> signature_size(const_span blob, key_type t) {
	if(t == key_type::ssh_ed25519) {
		return ed25519_key_size*2;
	}
	if(same_key_format(t, key_type::ssh_rsa)) {
		ssh_bf_reader r(blob);
		std::string_view format, e, n;
		if(r.read(format) && r.read(e) && r.read(n)) {
			return mpint_digits(to_umpint(n)).size();
		}
	}
	return std::nullopt;
}

byte_vector to_byte_vector(std::string_view s) {
	const_span v = to_span(s);
	return byte_vector(v.begin(), v.end());
}

}

agent_client::agent_client(logger& log, std::unique_ptr<byte_stream> stream, std::chrono::milliseconds timeout)
: log_(log)
, stream_(std::move(stream))
, timeout_(timeout)
{
}

std::optional<std::vector<agent_identity>> agent_client::request_identities() {
	byte_vector req{std::byte{ssh_agentc_request_identities}};
	auto reply = transact(req);
	if(!reply) {
		return std::nullopt;
	}

	ssh_bf_reader r(*reply);
	std::uint8_t type{};
	std::uint32_t count{};
	if(!r.read(type) || type != ssh_agent_identities_answer || !r.read(count)) {
		log_.log(logger::error, "Invalid identities answer from agent [type={}]", type);
		return std::nullopt;
	}

	std::vector<agent_identity> res;
	for(std::uint32_t i = 0; i != count; ++i) {
		std::string_view blob;
		std::string_view comment;
		if(!r.read(blob) || !r.read(comment)) {
			log_.log(logger::error, "Invalid identities answer from agent [count={}]", count);
			return std::nullopt;
		}
		res.push_back(agent_identity{to_byte_vector(blob), std::string(comment)});
	}

	log_.log(logger::debug, "Agent has {} identities", res.size());
	return res;
}

std::optional<byte_vector> agent_client::sign(const_span key_blob, const_span data, std::uint32_t flags) {
	byte_vector req;
	ssh_bf_writer w(req);
	if(!w.write(std::uint8_t{ssh_agentc_sign_request})
		|| !w.write(to_string_view(key_blob))
		|| !w.write(to_string_view(data))
		|| !w.write(flags))
	{
		return std::nullopt;
	}

	auto reply = transact(req);
	if(!reply) {
		return std::nullopt;
	}

	ssh_bf_reader r(*reply);
	std::uint8_t type{};
	if(!r.read(type)) {
		return std::nullopt;
	}
	if(type == ssh_agent_failure) {
		log_.log(logger::info, "Agent refused to sign");
		return std::nullopt;
	}

	std::string_view sig;
	if(type != ssh_agent_sign_response || !r.read(sig)) {
		log_.log(logger::error, "Invalid sign response from agent [type={}]", type);
		return std::nullopt;
	}
	return to_byte_vector(sig);
}

std::vector<ssh_private_key> agent_client::signing_keys(crypto_context const& crypto, crypto_call_context const& call) {
	std::vector<ssh_private_key> res;
	auto ids = request_identities();
	if(!ids) {
		return res;
	}

	for(auto& id : *ids) {
		auto pub = load_ssh_public_key(id.key_blob, crypto, call);
		auto size = pub.valid() ? signature_size(id.key_blob, pub.type()) : std::nullopt;
		if(!size) {
			log_.log(logger::debug, "Skipping agent key we don't support [comment={}]", id.comment);
			continue;
		}
		auto key = std::make_shared<agent_private_key>(shared_from_this(), std::move(id.key_blob), std::move(pub), *size);
		res.emplace_back(std::move(key), id.comment);
	}
	return res;
}

std::optional<byte_vector> agent_client::transact(byte_vector const& request) {
	std::lock_guard lock(mutex_);
	if(!stream_) {
		log_.log(logger::error, "Agent connection is closed");
		return std::nullopt;
	}

	std::byte len[4];
	u32ton(std::uint32_t(request.size()), len);

	std::optional<byte_vector> reply;
	if(stream_->send(len) && stream_->send(request) && receive_all(len)) {
		std::uint32_t size = ntou32(len);
		if(size == 0 || size > max_agent_message_size) {
			log_.log(logger::error, "Invalid agent message size [size={}]", size);
		} else {
			byte_vector data(size);
			if(receive_all(data)) {
				reply = std::move(data);
			}
		}
	}

	if(!reply) {
		// the framing is lost, no more requests on this connection
		stream_->close();
		stream_.reset();
	}
	return reply;
}

bool agent_client::receive_all(span out) {
	while(!out.empty()) {
		auto n = stream_->receive(out, timeout_);
		if(!n) {
			log_.log(logger::error, "Agent connection closed");
			return false;
		}
		if(*n == 0) {
			log_.log(logger::error, "Agent did not answer in time");
			return false;
		}
		out = out.subspan(*n);
	}
	return true;
}

}
