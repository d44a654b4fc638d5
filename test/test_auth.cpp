#include "configs.hpp"
#include "crypto.hpp"
#include "util.hpp"
#include "test/util/test_server.hpp"

#include "sshc/common/util.hpp"
#include "sshc/core/ssh_public_key.hpp"

/* Tested:
	+ password, right and wrong
	+ public key, the rejected key is never signed
	+ keyboard-interactive with answers, without callback and pending
	+ banner
	+ none to query the allowed methods
	+ methods the server does not allow are skipped
	+ failed episode is not fatal and can be retried
*/

namespace securepath::sshc::test {
namespace {

auth_credentials credentials(std::string user, std::string password = {}) {
	auth_credentials c;
	c.username = std::move(user);
	c.password = std::move(password);
	return c;
}

byte_vector public_blob(ssh_private_key const& k) {
	return to_byte_vector(k.public_key());
}

}

TEST_CASE("password auth", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.add_password("test", "some");

	REQUIRE(client.authenticate_password("test", "some"));
	CHECK(client.auth().status() == auth_status::inprogress);

	CHECK(run(client, server));

	CHECK(client.authenticated());
	CHECK(client.auth().status() == auth_status::authenticated);
	CHECK(client.current_state() == session_state::authenticated);
	CHECK(client.connection() != nullptr);
	CHECK(server.authenticated());
	CHECK(server.authenticated_user() == "test");
	CHECK(server.auth_methods_seen == std::vector<std::string>{"password"});
}

TEST_CASE("wrong password", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.add_password("test", "some");

	REQUIRE(client.authenticate_password("test", "other"));
	CHECK(run(client, server));

	CHECK(!client.authenticated());
	CHECK(client.auth().status() == auth_status::failed);
	CHECK(client.current_state() == session_state::authenticating);
	CHECK(client.connection() == nullptr);
	CHECK(client.auth().failure().tried == std::vector<auth_type>{auth_type::password});
	CHECK(client.auth().failure().partial.empty());
	CHECK(client.auth().allowed_methods() == server.auth_data.methods);

	// the failure is not fatal for the connection
	CHECK(client.state() == ssh_state::transport);
	CHECK(client.error() == ssh_noerror);

	SECTION("retry") {
		REQUIRE(client.authenticate_password("test", "some"));
		CHECK(run(client, server));
		CHECK(client.authenticated());
		CHECK(server.auth_request_count == 2);
	}
}

TEST_CASE("authenticate input checks", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.add_password("test", "some");

	CHECK(!client.authenticate(credentials(""), {auth_type::password}));
	CHECK(!client.authenticate(credentials("test"), {}));
	CHECK(client.auth().status() == auth_status::none);

	REQUIRE(client.authenticate_password("test", "some"));
	// one episode at a time
	CHECK(!client.authenticate_password("test", "some"));

	CHECK(run(client, server));
	CHECK(client.authenticated());
	CHECK(!client.authenticate_password("test", "some"));
}

TEST_CASE("public key auth", "[unit][crypto][auth]") {
	crypto_test_context ctx;
	auto ed_key = ctx.test_ed25519_private_key();
	auto rsa_key = ctx.test_rsa_private_key();

	test_server server;
	test_client client;

	auth_credentials creds = credentials("test");
	creds.keys = {ed_key, rsa_key};

	SECTION("first key accepted") {
		server.auth_data.add_key(public_blob(ed_key));
		REQUIRE(client.authenticate(creds, {auth_type::public_key}));
		CHECK(run(client, server));

		CHECK(client.authenticated());
		CHECK(server.pk_query_count == 1);
		CHECK(server.pk_signed_count == 1);
		CHECK(server.pk_verified_count == 1);
		CHECK(client.auth().signature_count() == 1);
	}
	SECTION("rejected key is not signed") {
		server.auth_data.add_key(public_blob(rsa_key));
		REQUIRE(client.authenticate(creds, {auth_type::public_key}));
		CHECK(run(client, server));

		CHECK(client.authenticated());
		CHECK(server.pk_query_count == 2);
		CHECK(server.pk_signed_count == 1);
		CHECK(server.pk_verified_count == 1);
		CHECK(client.auth().signature_count() == 1);
	}
	SECTION("no key accepted") {
		REQUIRE(client.authenticate(creds, {auth_type::public_key}));
		CHECK(run(client, server));

		CHECK(!client.authenticated());
		CHECK(client.auth().status() == auth_status::failed);
		CHECK(client.auth().failure().tried == std::vector<auth_type>{auth_type::public_key, auth_type::public_key});
		CHECK(server.pk_query_count == 2);
		CHECK(server.pk_signed_count == 0);
		CHECK(client.auth().signature_count() == 0);
	}
}

TEST_CASE("methods in order until one succeeds", "[unit][crypto][auth]") {
	crypto_test_context ctx;
	auto key = ctx.test_ed25519_private_key();

	test_server server;
	test_client client;
	server.auth_data.add_password("test", "some");

	auth_credentials creds = credentials("test", "some");
	creds.keys = {key};

	REQUIRE(client.authenticate(creds, {auth_type::public_key, auth_type::password}));
	CHECK(run(client, server));

	CHECK(client.authenticated());
	CHECK(server.auth_methods_seen == std::vector<std::string>{"publickey", "password"});
	CHECK(client.auth().signature_count() == 0);
}

TEST_CASE("none auth gives allowed methods", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.methods = {"publickey", "password"};

	REQUIRE(client.authenticate(credentials("test"), {auth_type::none}));
	CHECK(run(client, server));

	CHECK(client.auth().status() == auth_status::failed);
	CHECK(client.auth().allowed_methods() == std::vector<std::string>{"publickey", "password"});
}

TEST_CASE("none auth accepted", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.accept_none = true;

	REQUIRE(client.authenticate(credentials("test"), {auth_type::none}));
	CHECK(run(client, server));
	CHECK(client.authenticated());
	CHECK(server.authenticated_user() == "test");
}

TEST_CASE("methods not allowed by server are skipped", "[unit][crypto][auth]") {
	crypto_test_context ctx;

	test_server server;
	test_client client;
	server.auth_data.methods = {"password"};
	server.auth_data.add_password("test", "some");
	server.auth_data.add_key(public_blob(ctx.test_ed25519_private_key()));

	auth_credentials creds = credentials("test", "some");
	creds.keys = {ctx.test_ed25519_private_key()};

	REQUIRE(client.authenticate(creds, {auth_type::none, auth_type::public_key, auth_type::interactive, auth_type::password}));
	CHECK(run(client, server));

	CHECK(client.authenticated());
	CHECK(server.auth_methods_seen == std::vector<std::string>{"none", "password"});
	CHECK(server.pk_query_count == 0);
	CHECK(client.auth().signature_count() == 0);
}

TEST_CASE("auth banner", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.banner = "Welcome to the test server\r\n";
	server.auth_data.add_password("test", "some");

	std::vector<std::string> banners;
	client.on_banner = [&](std::string_view msg, std::string_view) {
		banners.emplace_back(msg);
	};

	REQUIRE(client.authenticate_password("test", "some"));
	CHECK(run(client, server));

	CHECK(client.authenticated());
	CHECK(banners == std::vector<std::string>{"Welcome to the test server\r\n"});
}

TEST_CASE("keyboard-interactive auth", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.interactive.prompts = {{false, "Password: "}, {true, "Code: "}};
	server.auth_data.answers = {"secret", "1234"};

	std::vector<interactive_request> requests;
	interactive_result result = interactive_result::data;
	client.on_interactive = [&](interactive_request const& req, std::vector<std::string>& answers) {
		requests.push_back(req);
		if(result == interactive_result::data) {
			answers = {"secret", "1234"};
		}
		return result;
	};

	auth_credentials creds = credentials("test");
	creds.submethods = {"pam"};

	SECTION("answered") {
		REQUIRE(client.authenticate(creds, {auth_type::interactive}));
		CHECK(run(client, server));

		CHECK(client.authenticated());
		REQUIRE(requests.size() == 1);
		CHECK(requests[0].name == "test");
		CHECK(requests[0].instruction == "answer the questions");
		REQUIRE(requests[0].prompts.size() == 2);
		CHECK(requests[0].prompts[0].text == "Password: ");
		CHECK(!requests[0].prompts[0].echo);
		CHECK(requests[0].prompts[1].text == "Code: ");
		CHECK(requests[0].prompts[1].echo);
		CHECK(server.interactive_answers == server.auth_data.answers);
	}
	SECTION("cancelled") {
		result = interactive_result::cancelled;
		REQUIRE(client.authenticate(creds, {auth_type::interactive}));
		CHECK(run(client, server));

		CHECK(!client.authenticated());
		CHECK(client.auth().status() == auth_status::failed);
		CHECK(server.interactive_answers.empty());
	}
	SECTION("pending") {
		result = interactive_result::pending;
		REQUIRE(client.authenticate(creds, {auth_type::interactive}));
		CHECK(run(client, server));
		CHECK(!client.authenticated());
		CHECK(client.auth().status() == auth_status::inprogress);
		CHECK(client.process(server.out_buf) == transport_op::pending_action);

		result = interactive_result::data;
		CHECK(run(client, server));
		CHECK(client.authenticated());
		CHECK(requests.size() == 3);
	}
}

TEST_CASE("keyboard-interactive without callback", "[unit][auth]") {
	test_server server;
	test_client client;
	server.auth_data.interactive.prompts = {{false, "Password: "}};
	server.auth_data.answers = {"secret"};

	REQUIRE(client.authenticate(credentials("test"), {auth_type::interactive}));
	CHECK(run(client, server));

	CHECK(!client.authenticated());
	CHECK(client.auth().status() == auth_status::failed);
	// the prompts were answered with zero responses
	CHECK(server.interactive_answers.empty());
	CHECK(server.auth_request_count == 1);
}

}
