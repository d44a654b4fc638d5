#include "ssh_client.hpp"
#include "sshc/core/packet_ser_impl.hpp"
#include "sshc/core/protocol.hpp"
#include "sshc/core/service/names.hpp"

namespace securepath::sshc {

std::string_view to_string(session_state s) {
	using enum session_state;
	switch(s) {
		case connecting: return "connecting";
		case key_exchange: return "key_exchange";
		case authenticating: return "authenticating";
		case authenticated: return "authenticated";
		case rekeying: return "rekeying";
		case closing: return "closing";
		case closed: return "closed";
	};
	return "unknown";
}

ssh_client::ssh_client(client_config const& conf, logger& log, out_buffer& out, crypto_context cc)
: ssh_transport(conf, log, out, std::move(cc))
, config_(conf)
, auth_(*this, conf)
{
}

ssh_client::~ssh_client()
{
}

session_state ssh_client::current_state() const {
	switch(state()) {
		case ssh_state::none:
		case ssh_state::version_exchange:
			return session_state::connecting;
		case ssh_state::kex:
			return rekeying() ? session_state::rekeying : session_state::key_exchange;
		case ssh_state::transport:
			return connection_ ? session_state::authenticated : session_state::authenticating;
		case ssh_state::disconnected:
			return output_pending() ? session_state::closing : session_state::closed;
	};
	return session_state::closed;
}

bool ssh_client::authenticate(auth_credentials creds, std::vector<auth_type> methods) {
	if(state() == ssh_state::disconnected) {
		return false;
	}
	return auth_.authenticate(std::move(creds), std::move(methods));
}

bool ssh_client::authenticated() const {
	return auth_.authenticated();
}

std::string_view ssh_client::methods(method_type t) const {
	auto const& conf = negotiated_configuration();
	if(!conf) {
		return {};
	}
	// we are the client, so out is client to server
	using enum method_type;
	switch(t) {
		case kex: return to_string(conf->kex);
		case host_key: return to_string(conf->host_key);
		case crypt_cs: return to_string(conf->out.cipher);
		case crypt_sc: return to_string(conf->in.cipher);
		case mac_cs: return to_string(conf->out.mac);
		case mac_sc: return to_string(conf->in.mac);
		case comp_cs: return to_string(conf->out.compress);
		case comp_sc: return to_string(conf->in.compress);
	};
	return {};
}

key_type ssh_client::host_key_type() const {
	auto const& conf = negotiated_configuration();
	return conf ? conf->host_key : key_type::unknown;
}

std::string ssh_client::host_key_fingerprint() const {
	auto key = load_ssh_public_key(server_host_key_blob(), crypto(), call_context(), host_key_type());
	return key.fingerprint(crypto(), call_context());
}

void ssh_client::on_state_change(ssh_state old_s, ssh_state new_s) {
	logger_.log(logger::debug, "SSH client state [{}]", to_string(current_state()));
	if(old_s == ssh_state::kex && new_s == ssh_state::transport && !requesting_auth_) {
		// we are done with the first kex, request user auth
		logger_.log(logger::debug_trace, "SSH requesting user auth service");
		requesting_auth_ = send_packet<ser::service_request>(*this, user_auth_service_name);
		if(!requesting_auth_) {
			set_error_and_disconnect(sshc_memory_error);
		}
	}
}

handler_result ssh_client::check_host_key(kex const& k) {
	auto blob = k.server_host_key_blob();

	if(kex_count() > 0) {
		if(!compare_equal(blob, server_host_key_blob())) {
			logger_.log(logger::error, "SSH server host key changed in re-key");
			set_error_and_disconnect(ssh_host_key_not_verifiable, "host key not verifiable");
		}
		return handler_result::handled;
	}

	auto key = k.server_host_key();
	host_key_info info{key.type(), key.fingerprint(crypto(), call_context()), blob};

	host_key_result res = host_key_result::accept;
	if(config_.host_key_check) {
		res = config_.host_key_check(info);
	} else {
		logger_.log(logger::info, "SSH no host key check set, accepting [type={}, fingerprint={}]", to_string(info.type), info.fingerprint);
	}

	if(res == host_key_result::pending) {
		logger_.log(logger::debug, "SSH host key check pending");
		return handler_result::pending;
	}

	if(res == host_key_result::reject) {
		logger_.log(logger::error, "SSH host key rejected [type={}, fingerprint={}]", to_string(info.type), info.fingerprint);
		set_error_and_disconnect(ssh_host_key_not_verifiable, "host key not verifiable");
	}
	return handler_result::handled;
}

handler_result ssh_client::handle_kex_done(kex const& k) {
	auto res = check_host_key(k);
	if(res == handler_result::pending || error() != ssh_noerror) {
		return res;
	}
	return ssh_transport::handle_kex_done(k);
}

handler_result ssh_client::handle_service_accept(const_span payload) {
	logger_.log(logger::debug_trace, "SSH handle_service_accept");

	ser::service_accept::load packet(payload);
	if(!packet) {
		logger_.log(logger::error, "SSH Invalid service accept packet from remote");
		set_error_and_disconnect(sshc_invalid_packet);
		return handler_result::handled;
	}

	auto& [service] = packet;

	if(!requesting_auth_ || auth_accepted_ || service != user_auth_service_name) {
		logger_.log(logger::error, "SSH Received service accept in invalid state [service={}]", service);
		set_error_and_disconnect(ssh_protocol_error, "unexpected service accept");
		return handler_result::handled;
	}

	logger_.log(logger::debug_trace, "SSH user auth service accepted");
	auth_accepted_ = true;
	if(!auth_.init()) {
		logger_.log(logger::error, "SSH Failed to initialise user auth service");
		set_error_and_disconnect(ssh_service_not_available);
	}
	return handler_result::handled;
}

void ssh_client::start_connection() {
	logger_.log(logger::info, "SSH user authenticated, starting {}", connection_service_name);
	connection_ = std::make_unique<ssh_connection>(*this);
	// the service interface is what the transport drives
	ssh_service& service = *connection_;
	if(!service.init()) {
		logger_.log(logger::error, "SSH Failed to initialise connection service");
		set_error_and_disconnect(ssh_service_not_available);
	}
}

handler_result ssh_client::process_auth(ssh_packet_type type, const_span payload) {
	if(!auth_accepted_ || auth_.authenticated()) {
		logger_.log(logger::error, "SSH Received auth packet in wrong state [type={}]", type);
		set_error_and_disconnect(ssh_protocol_error);
		return handler_result::handled;
	}

	auto res = auth_.process(type, payload);
	if(res == handler_result::handled && auth_.state() == service_state::done) {
		start_connection();
	}
	return res;
}

handler_result ssh_client::process_connection(ssh_packet_type type, const_span payload) {
	if(!connection_) {
		logger_.log(logger::error, "SSH Received connection packet before authentication [type={}]", type);
		set_error_and_disconnect(ssh_protocol_error);
		return handler_result::handled;
	}
	return static_cast<ssh_service&>(*connection_).process(type, payload);
}

handler_result ssh_client::handle_transport_packet(ssh_packet_type type, const_span payload) {
	if(type == ssh_service_accept) {
		return handle_service_accept(payload);
	} else if(is_auth_packet(type)) {
		return process_auth(type, payload);
	} else if(is_connection_packet(type)) {
		return process_connection(type, payload);
	}
	return handler_result::unknown;
}

bool ssh_client::flush() {
	return connection_ ? connection_->flush() : false;
}

}
