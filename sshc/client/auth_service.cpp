#include "auth_service.hpp"
#include "sshc/core/auth/auth_protocol.hpp"
#include "sshc/core/packet_ser_impl.hpp"
#include "sshc/core/protocol.hpp"
#include "sshc/core/protocol_helpers.hpp"
#include "sshc/core/transport_base.hpp"

#include <algorithm>

namespace securepath::sshc {

std::string_view to_string(auth_status s) {
	using enum auth_status;
	switch(s) {
		case none: return "none";
		case inprogress: return "inprogress";
		case authenticated: return "authenticated";
		case failed: return "failed";
	};
	return "unknown";
}

client_auth_service::client_auth_service(transport_base& transport, client_config const& c)
: transport_(transport)
, log_(transport_.call_context().log)
, config_(c)
{
}

std::string_view client_auth_service::name() const {
	return user_auth_service_name;
}

service_state client_auth_service::state() const {
	return state_;
}

bool client_auth_service::init() {
	log_.log(logger::debug_trace, "user auth service accepted [queued attempts={}]", attempts_.size());
	state_ = service_state::inprogress;
	if(status_ == auth_status::inprogress && !current_) {
		next();
	}
	return transport_.error() == ssh_noerror;
}

bool client_auth_service::authenticate(auth_credentials creds, std::vector<auth_type> methods) {
	if(status_ == auth_status::inprogress || status_ == auth_status::authenticated) {
		log_.log(logger::error, "cannot start authentication [status={}]", to_string(status_));
		return false;
	}
	if(creds.username.empty() || methods.empty()) {
		log_.log(logger::error, "cannot start authentication without username or methods");
		return false;
	}

	log_.log(logger::debug, "starting authentication [username={}, methods={}, keys={}]", creds.username, to_string(methods), creds.keys.size());

	credentials_ = std::move(creds);
	attempts_.clear();
	failure_.tried.clear();
	failure_.partial.clear();

	for(auto m : methods) {
		if(m == auth_type::public_key) {
			for(auto const& k : credentials_.keys) {
				if(k.valid()) {
					attempts_.push_back(auth_attempt{m, k});
				}
			}
		} else {
			attempts_.push_back(auth_attempt{m});
		}
	}

	status_ = auth_status::inprogress;

	// before the service is accepted, the attempts wait in the queue
	if(state_ == service_state::inprogress) {
		next();
	}
	return true;
}

bool client_auth_service::allowed(auth_type t) const {
	// "none" is always allowed to be asked, it is how the allowed list is queried
	if(!have_allowed_ || t == auth_type::none) {
		return true;
	}
	return std::find(failure_.allowed.begin(), failure_.allowed.end(), to_string(t)) != failure_.allowed.end();
}

void client_auth_service::next() {
	current_.reset();
	while(!attempts_.empty()) {
		auto attempt = std::move(attempts_.front());
		attempts_.pop_front();

		if(!allowed(attempt.type)) {
			log_.log(logger::debug, "skipping auth method not allowed by server [method={}]", to_string(attempt.type));
			continue;
		}

		if(send_attempt(attempt)) {
			failure_.tried.push_back(attempt.type);
			current_ = std::move(attempt);
		} else {
			log_.log(logger::error, "failed to send auth request [method={}]", to_string(attempt.type));
			status_ = auth_status::failed;
		}
		return;
	}

	log_.log(logger::info, "authentication failed, no more methods to try [tried={}]", to_string(failure_.tried));
	status_ = auth_status::failed;
}

bool client_auth_service::send_attempt(auth_attempt& a) {
	auto const& user = credentials_.username;
	auto const& service = config_.service;

	switch(a.type) {
		case auth_type::none:
			log_.log(logger::debug_trace, "sending no auth [username={}, service={}]", user, service);
			return send_packet<ser::userauth_request>(transport_, user, service, to_string(a.type));
		case auth_type::password:
			log_.log(logger::debug_trace, "sending password auth [username={}, service={}]", user, service);
			return send_packet<ser::userauth_password_request>(transport_, user, service, to_string(a.type), false, credentials_.password);
		case auth_type::public_key:
			return send_pk_query(a.key);
		case auth_type::interactive: {
			log_.log(logger::debug_trace, "sending interactive auth [username={}, service={}]", user, service);
			std::vector<std::string_view> submethods(credentials_.submethods.begin(), credentials_.submethods.end());
			return send_packet<ser::userauth_interactive_request>(transport_, user, service, to_string(a.type), "", submethods);
		}
	};
	return false;
}

bool client_auth_service::send_pk_query(ssh_private_key const& key) {
	auto pk = key.public_key();
	if(!pk.valid()) {
		log_.log(logger::error, "could not construct public key from the private key");
		return false;
	}

	log_.log(logger::debug_trace, "sending pk auth query [username={}, service={}, key={}]"
		, credentials_.username, config_.service, pk.fingerprint(transport_.crypto(), transport_.call_context()));

	return send_packet<ser::userauth_pk_request>(
		transport_,
		credentials_.username,
		config_.service,
		to_string(auth_type::public_key),
		false,
		to_string(pk.type()),
		to_string_view(to_byte_vector(pk)));
}

bool client_auth_service::send_pk_signed(ssh_private_key const& key) {
	auto pk = key.public_key();
	auto ser_pubkey = to_byte_vector(pk);

	byte_vector request;
	bool ret = ser::serialise_to_vector<ser::userauth_pk_request>(
		request,
		credentials_.username,
		config_.service,
		to_string(auth_type::public_key),
		true,
		to_string(key.type()),
		to_string_view(ser_pubkey));

	if(!ret) {
		return false;
	}

	// signed data is the session id as string followed by the request
	byte_vector signed_data;
	ssh_bf_writer w(signed_data);
	ret = w.write(to_string_view(transport_.session_id())) && w.write(const_span(request));
	if(!ret) {
		return false;
	}

	auto sig = key.sign(signed_data);
	++signature_count_;
	if(sig.empty()) {
		log_.log(logger::error, "failed to sign auth request");
		return false;
	}

	ssh_bf_writer sig_w(request, request.size());
	if(!sig_w.write(to_string_view(sig))) {
		return false;
	}

	log_.log(logger::debug_trace, "sending signed pk auth [username={}, service={}]", credentials_.username, config_.service);
	return send_payload(transport_, request);
}

bool client_auth_service::send_interactive_response(std::vector<std::string> const& results) {
	byte_vector response;

	bool ret = ser::serialise_to_vector<ser::userauth_info_response>(response, std::uint32_t(results.size()));

	if(ret) {
		ssh_bf_writer res_w(response, response.size());
		for(auto&& v : results) {
			if(!res_w.write(std::string_view(v))) {
				return false;
			}
		}
		ret = send_payload(transport_, response);
	}
	return ret;
}

void client_auth_service::protocol_error(std::string_view message) {
	log_.log(logger::error, "{}", message);
	state_ = service_state::error;
	set_error(ssh_protocol_error, std::string(message));
	transport_.set_error_and_disconnect(ssh_protocol_error, message);
}

void client_auth_service::handle_banner(const_span payload) {
	ser::userauth_banner::load packet(payload);
	if(packet) {
		auto& [msg, lang] = packet;
		log_.log(logger::debug, "received auth banner [size={}]", msg.size());
		if(config_.on_banner) {
			config_.on_banner(msg, lang);
		}
	} else {
		protocol_error("Invalid banner packet from server");
	}
}

void client_auth_service::handle_success() {
	log_.log(logger::info, "auth succeeded [username={}, service={}, method={}]"
		, credentials_.username, config_.service, to_string(current_->type));
	status_ = auth_status::authenticated;
	state_ = service_state::done;
	current_.reset();
	attempts_.clear();
	// nothing of the credentials is needed any more
	credentials_ = auth_credentials{credentials_.username};
}

void client_auth_service::handle_failure(const_span payload) {
	ser::userauth_failure::load packet(payload);
	if(!packet) {
		protocol_error("Invalid auth failure packet from server");
		return;
	}

	auto& [methods, partial_success] = packet;

	std::string can_continue;
	to_string_list(methods, can_continue);
	log_.log(logger::debug, "auth method failed [method={}, partial={}, can continue={}]"
		, to_string(current_->type), partial_success, can_continue);

	if(partial_success) {
		failure_.partial.push_back(current_->type);
	}

	failure_.allowed.assign(methods.begin(), methods.end());
	have_allowed_ = true;

	// a key that was rejected by the query is dropped here and never signed
	next();
}

void client_auth_service::handle_pk_ok(const_span payload) {
	ser::userauth_pk_ok::load packet(payload);
	if(!packet) {
		protocol_error("Invalid pk auth ok packet from server");
		return;
	}

	auto& [alg, blob] = packet;
	auto& key = current_->key;
	auto ser_pubkey = to_byte_vector(key.public_key());

	if(alg != to_string(key.type()) || !compare_equal(to_span(blob), ser_pubkey)) {
		protocol_error("pk auth ok does not match the queried key");
		return;
	}

	log_.log(logger::debug, "public key accepted by server, signing");
	current_->signature_sent = true;
	if(!send_pk_signed(key)) {
		log_.log(logger::error, "failed to send signed auth request");
		next();
	}
}

void client_auth_service::handle_change_password(const_span payload) {
	ser::userauth_password_changereq::load packet(payload);
	if(!packet) {
		protocol_error("Invalid password change request from server");
		return;
	}
	// changing password is not supported, count it as failed attempt
	log_.log(logger::info, "server requires password change, trying next method");
	next();
}

handler_result client_auth_service::handle_interactive_request(const_span payload) {
	ser::userauth_info_request::load packet(payload);
	if(!packet) {
		protocol_error("Invalid interactive request packet from server");
		return handler_result::handled;
	}

	auto& [name, instruction, lang, prompt_count] = packet;

	interactive_request req{std::string(name), std::string(instruction)};

	for(std::uint32_t i = 0; i != prompt_count; ++i) {
		std::string_view text;
		bool echo{};

		if(!packet.reader().read(text) || !packet.reader().read(echo)) {
			protocol_error("Invalid interactive request packet from server (prompts)");
			return handler_result::handled;
		}

		req.prompts.push_back(interactive_prompt{echo, std::string(text)});
	}

	log_.log(logger::debug, "interactive request from server [prompts={}]", req.prompts.size());

	std::vector<std::string> results;
	auto res = config_.on_interactive ? config_.on_interactive(req, results) : interactive_result::cancelled;

	if(res == interactive_result::pending) {
		return handler_result::pending;
	}

	if(res == interactive_result::cancelled || results.size() != req.prompts.size()) {
		// the response is required even when cancelled, with zero entries
		results.clear();
	}

	if(!send_interactive_response(results)) {
		transport_.set_error_and_disconnect(sshc_invalid_data);
	}
	return handler_result::handled;
}

handler_result client_auth_service::process(ssh_packet_type t, const_span payload) {
	log_.log(logger::debug_trace, "client_auth_service::process [type={}]", t);

	if(t == ssh_userauth_banner) {
		handle_banner(payload);
		return handler_result::handled;
	}

	if(!current_) {
		protocol_error("Received auth packet without request");
		return handler_result::handled;
	}

	auto const& cur = *current_;
	if(t == ssh_userauth_success) {
		handle_success();
	} else if(t == ssh_userauth_failure) {
		handle_failure(payload);
	} else if(cur.type == auth_type::public_key && t == ssh_packet_type(ssh_auth_pk_ok) && !cur.signature_sent) {
		handle_pk_ok(payload);
	} else if(cur.type == auth_type::password && t == ssh_packet_type(ssh_auth_password_changereq)) {
		handle_change_password(payload);
	} else if(cur.type == auth_type::interactive && t == ssh_userauth_info_request) {
		return handle_interactive_request(payload);
	} else {
		protocol_error("Unexpected auth packet from server");
	}

	return handler_result::handled;
}

}
