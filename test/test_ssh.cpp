#include "configs.hpp"
#include "util.hpp"
#include "test/util/test_server.hpp"

#include "sshc/core/packet_ser_impl.hpp"

namespace securepath::sshc::test {
namespace {

struct config_pair {
	client_config client;
	ssh_config server;
};

config_pair test_config_pair(int i) {
	switch(i) {
		case 1: return {test_client_aes_ctr_config(), test_server_aes_ctr_config()};
		case 2: return {test_client_dh_kex_config(), test_server_dh_kex_config()};
	}
	return {test_client_config(), test_server_config()};
}

}

TEST_CASE("ssh test", "[unit]") {
	auto i = GENERATE(range(0, 3));
	auto conf = test_config_pair(i);
	test_server server(test_log(), conf.server);
	test_client client(test_log(), conf.client);
	server.auth_data.add_password("test", "some");

	CHECK(client.current_state() == session_state::connecting);
	REQUIRE(client.authenticate_password("test", "some"));

	CHECK(run(client, server));

	CHECK(client.state() == ssh_state::transport);
	CHECK(server.state() == ssh_state::transport);
	CHECK(client.current_state() == session_state::authenticated);
	CHECK(client.authenticated());
	CHECK(server.authenticated());
	CHECK(client.remote_version().ssh == "2.0");
	CHECK(client.remote_version().software == "sshc_test_server");

	client.send_ignore(10);
	server.send_ignore(25);
	CHECK(run(client, server));
	CHECK(client.error() == ssh_noerror);
}

TEST_CASE("ssh negotiated methods", "[unit]") {
	test_server server(test_log(), test_server_aes_ctr_config());
	test_client client(test_log(), test_client_aes_ctr_config());

	CHECK(client.methods(method_type::kex).empty());
	CHECK(run(client, server));

	CHECK(client.methods(method_type::kex) == "curve25519-sha256");
	CHECK(client.methods(method_type::host_key) == "ssh-ed25519");
	CHECK(client.methods(method_type::crypt_cs) == "aes256-ctr");
	CHECK(client.methods(method_type::crypt_sc) == "aes256-ctr");
	CHECK(client.methods(method_type::mac_cs) == "hmac-sha2-256");
	CHECK(client.methods(method_type::mac_sc) == "hmac-sha2-256");
	CHECK(client.methods(method_type::comp_cs) == "none");
	CHECK(client.methods(method_type::comp_sc) == "none");
}

TEST_CASE("ssh server with unsupported version", "[unit]") {
	auto s = test_server_config();
	s.my_version.ssh = "1.0";
	test_server server(test_log(), std::move(s));
	test_client client;

	CHECK(!run(client, server));

	CHECK(client.state() == ssh_state::disconnected);
	CHECK(client.current_state() == session_state::closed);
	CHECK(client.error() == ssh_protocol_version_not_supported);
	CHECK(kind_of(client.error()) == error_kind::disconnected);
	CHECK(client.kex_count() == 0);
}

TEST_CASE("ssh server with compatibility version", "[unit]") {
	auto s = test_server_config();
	s.my_version.ssh = "1.99";
	test_server server(test_log(), std::move(s));
	test_client client;

	CHECK(run(client, server));
	CHECK(client.state() == ssh_state::transport);
}

TEST_CASE("ssh no common kex", "[unit]") {
	auto s = test_server_config();
	s.algorithms.kexes = {kex_type::dh_group14_sha256};
	test_server server(test_log(), std::move(s));
	auto c = test_client_config();
	c.algorithms.kexes = {kex_type::curve25519_sha256};
	test_client client(test_log(), std::move(c));

	CHECK(!run(client, server));

	CHECK(client.state() == ssh_state::disconnected);
	CHECK(server.state() == ssh_state::disconnected);
	CHECK(kind_of(client.error()) == error_kind::kex_failure);
	CHECK(kind_of(server.error()) == error_kind::kex_failure);
	CHECK(!client.error_message().empty());
}

TEST_CASE("ssh no common cipher", "[unit]") {
	auto s = test_server_config();
	s.algorithms.client_server_ciphers = {cipher_type::aes_128_ctr};
	test_server server(test_log(), std::move(s));
	test_client client;

	CHECK(!run(client, server));
	CHECK(client.state() == ssh_state::disconnected);
	CHECK(kind_of(client.error()) == error_kind::kex_failure);
}

TEST_CASE("ssh auth service not available", "[unit]") {
	test_server server;
	server.services.clear();
	test_client client;

	CHECK(!run(client, server));

	CHECK(client.state() == ssh_state::disconnected);
	CHECK(client.error() == ssh_service_not_available);
	CHECK(server.error() == ssh_service_not_available);
	REQUIRE(client.remote_disconnect());
	CHECK(client.remote_disconnect()->code == ssh_service_not_available);
}

TEST_CASE("ssh disconnect by client", "[unit]") {
	test_server server;
	test_client client;
	REQUIRE(run(client, server));

	client.disconnect(ssh_disconnect_by_application, "bye");
	CHECK(client.state() == ssh_state::disconnected);
	CHECK(!run(client, server));

	CHECK(client.current_state() == session_state::closed);
	CHECK(server.state() == ssh_state::disconnected);
	REQUIRE(server.remote_disconnect());
	CHECK(server.remote_disconnect()->code == ssh_disconnect_by_application);
	CHECK(server.remote_disconnect()->description == "bye");
	CHECK(client.process(server.out_buf) == transport_op::disconnected);
}

TEST_CASE("ssh unknown packet is answered with unimplemented", "[unit]") {
	test_server server;
	test_client client;
	REQUIRE(run(client, server));

	byte_vector payload{std::byte{200}, std::byte{1}, std::byte{2}};
	REQUIRE(server.send_raw_payload(payload));
	CHECK(run(client, server));

	CHECK(client.error() == ssh_noerror);
	CHECK(server.error() == ssh_noerror);
	CHECK(client.state() == ssh_state::transport);
}

TEST_CASE("ssh corrupted packet on the wire", "[unit]") {
	test_server server;
	test_client client;
	REQUIRE(run(client, server));

	server.send_ignore(50);
	REQUIRE(!server.out_buf.empty());
	server.out_buf.corrupt(server.out_buf.used_size() - 1);

	CHECK(!run(client, server));
	CHECK(client.state() == ssh_state::disconnected);
	CHECK(client.error() == ssh_mac_error);
	CHECK(kind_of(client.error()) == error_kind::frame_error);
	CHECK(server.error() == ssh_mac_error);
}

}
