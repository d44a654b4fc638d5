#include "log.hpp"
#include "sshc/core/kexinit.hpp"
#include "sshc/core/supported_algorithms.hpp"
#include <catch2/catch.hpp>

#include <type_traits>
#include <utility>

namespace securepath::sshc::test {
namespace {

supported_algorithms const t1
	{{kex_type::curve25519_sha256}
	,{key_type::ssh_ed25519}
	,{cipher_type::openssh_aes_256_gcm}
	,{cipher_type::openssh_aes_256_gcm}
	,{mac_type::hmac_sha2_256}
	,{mac_type::hmac_sha2_256}};

supported_algorithms const t1_1
	{{kex_type::curve25519_sha256}
	,{key_type::rsa_sha2_256, key_type::ssh_ed25519}
	,{cipher_type::openssh_aes_256_gcm}
	,{cipher_type::openssh_aes_256_gcm}
	,{mac_type::hmac_sha2_256}
	,{mac_type::hmac_sha2_256}};

supported_algorithms const t2
	{{kex_type::dh_group14_sha256}
	,{key_type::ssh_ed25519}
	,{cipher_type::openssh_aes_256_gcm}
	,{cipher_type::openssh_aes_256_gcm}
	,{mac_type::hmac_sha2_256}
	,{mac_type::hmac_sha2_256}};

supported_algorithms const t2_1
	{{kex_type::dh_group14_sha256, kex_type::curve25519_sha256, kex_type::dh_group16_sha512}
	,{key_type::rsa_sha2_256, key_type::rsa_sha2_512, key_type::ssh_ed25519}
	,{cipher_type::aes_256_ctr, cipher_type::openssh_aes_256_gcm}
	,{cipher_type::openssh_aes_256_gcm, cipher_type::aes_256_ctr}
	,{mac_type::hmac_sha2_256, mac_type::hmac_sha2_512}
	,{mac_type::hmac_sha2_512, mac_type::hmac_sha2_256}};

supported_algorithms const t2_1_inv
	{{kex_type::dh_group16_sha512, kex_type::curve25519_sha256, kex_type::dh_group14_sha256}
	,{key_type::ssh_ed25519, key_type::rsa_sha2_512, key_type::rsa_sha2_256}
	,{cipher_type::openssh_aes_256_gcm, cipher_type::aes_256_ctr}
	,{cipher_type::aes_256_ctr, cipher_type::openssh_aes_256_gcm}
	,{mac_type::hmac_sha2_512, mac_type::hmac_sha2_256}
	,{mac_type::hmac_sha2_256, mac_type::hmac_sha2_512}};

supported_algorithms const t3
	{{kex_type::dh_group14_sha256}
	,{key_type::ssh_ed25519}
	,{cipher_type::aes_256_ctr}
	,{cipher_type::aes_256_ctr}
	,{mac_type::hmac_sha2_512}
	,{mac_type::hmac_sha2_512}};

supported_algorithms const t3_1
	{{kex_type::dh_group14_sha256}
	,{key_type::ssh_ed25519}
	,{cipher_type::aes_256_ctr}
	,{cipher_type::aes_256_ctr}
	,{mac_type::hmac_sha2_256}
	,{mac_type::hmac_sha2_256}};

crypto_configuration const result1
	{kex_type::curve25519_sha256
	,key_type::ssh_ed25519
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}};

crypto_configuration const result2
	{kex_type::dh_group14_sha256
	,key_type::ssh_ed25519
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}};

crypto_configuration const result2_1
	{kex_type::dh_group14_sha256
	,key_type::rsa_sha2_256
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}
	,{cipher_type::aes_256_ctr, mac_type::hmac_sha2_256, compress_type::none}};

crypto_configuration const result2_inv_1
	{kex_type::dh_group16_sha512
	,key_type::ssh_ed25519
	,{cipher_type::aes_256_ctr, mac_type::hmac_sha2_256, compress_type::none}
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}};

crypto_configuration const result2_inv_2
	{kex_type::dh_group16_sha512
	,key_type::ssh_ed25519
	,{cipher_type::openssh_aes_256_gcm, mac_type::implicit, compress_type::none}
	,{cipher_type::aes_256_ctr, mac_type::hmac_sha2_256, compress_type::none}};


struct test_config {
	transport_side my_side;
	supported_algorithms my_algos;
	supported_algorithms remote_algos;
	crypto_configuration result;
	bool correct_guess{};
};

test_config const test_configs[] =
	{
		{transport_side::client, t1, t1, result1, true},
		{transport_side::server, t1, t1, result1, true},
		{transport_side::client, t1, {}, {}},
		{transport_side::client, {}, t1, {}},
/*4*/	{transport_side::client, {}, {}, {}},
		{transport_side::server, t1, {}, {}},
		{transport_side::server, {}, t1, {}},
		{transport_side::server, {}, {}, {}},
		{transport_side::client, t1, t1_1, result1, false},
/*9*/	{transport_side::server, t1, t1_1, result1, false},
		{transport_side::client, t1_1, t1, result1, false},
		{transport_side::server, t1_1, t1, result1, false},
		{transport_side::client, t1, t2, {}},
		{transport_side::server, t1, t2, {}},
/*14*/	{transport_side::client, t2, t2_1, result2, false},
		{transport_side::server, t2, t2_1, result2, false},
		{transport_side::client, t2_1, t2, result2, false},
		{transport_side::server, t2_1, t2, result2, false},
		{transport_side::client, t2_1, t2_1, result2_1, true},
/*19*/	{transport_side::client, t2_1, t2_1_inv, result2_1, false},
		{transport_side::server, t2_1, t2_1_inv, result2_inv_2, false},
		{transport_side::client, t2_1_inv, t2_1_inv, result2_inv_1, true},
		{transport_side::server, t2_1_inv, t2_1_inv, result2_inv_2, true},
		{transport_side::client, t3, t3_1, {}},
/*24*/	{transport_side::server, t3, t3_1, {}},
		{transport_side::client, t3_1, t3, {}},
		{transport_side::server, t3_1, t3, {}},
		{transport_side::client, t3, t3, {kex_type::dh_group14_sha256, key_type::ssh_ed25519
			, {cipher_type::aes_256_ctr, mac_type::hmac_sha2_512, compress_type::none}
			, {cipher_type::aes_256_ctr, mac_type::hmac_sha2_512, compress_type::none}}, true}
	};

}

TEST_CASE("kexinit agreement", "[unit]") {
	auto i = GENERATE(range(0, int(sizeof(test_configs)/sizeof(test_config))));

	INFO("The test conf index is " << i);

	test_config const& conf = test_configs[i];

	bool const client = conf.my_side == transport_side::client;
	kexinit_agreement kagree(test_log(), client ? conf.my_algos : conf.remote_algos);
	supported_algorithms const& server = client ? conf.remote_algos : conf.my_algos;
	if(conf.result.valid()) {
		REQUIRE(kagree.agree(server));
		CHECK(kagree.was_guess_correct() == conf.correct_guess);
		auto res = kagree.agreed_configuration();
		// the responder sees the directions the other way around
		if(!client) {
			std::swap(res.in, res.out);
		}
		CHECK(res == conf.result);
	} else {
		REQUIRE(!kagree.agree(server));
		CHECK(!kagree.failed_category().empty());
	}
}

TEST_CASE("kexinit agreement failed category", "[unit]") {
	{
		kexinit_agreement kagree(test_log(), t1);
		CHECK(!kagree.agree(t2));
		CHECK(kagree.failed_category() == "kex/host_key");
	}
	{
		kexinit_agreement kagree(test_log(), t3);
		CHECK(!kagree.agree(t3_1));
		CHECK(kagree.failed_category() == "client->server mac");
	}
	{
		supported_algorithms other = t3;
		other.client_server_ciphers = cipher_list{cipher_type::aes_128_ctr};
		kexinit_agreement kagree(test_log(), t3);
		CHECK(!kagree.agree(other));
		CHECK(kagree.failed_category() == "client->server cipher");
	}
}

TEST_CASE("negotiate picks the first common initiator name", "[unit]") {
	using list = std::vector<std::string_view>;

	CHECK(negotiate({"A", "B", "C"}, {"C", "B"}) == "B");
	CHECK(negotiate({"C", "B"}, {"A", "B", "C"}) == "C");
	CHECK(negotiate({"A"}, {"B"}) == std::nullopt);
	CHECK(negotiate(list{}, {"B"}) == std::nullopt);
	CHECK(negotiate({"A"}, list{}) == std::nullopt);

	CHECK(negotiate({"aes256-gcm@openssh.com", "aes128-gcm@openssh.com"}, {"aes128-gcm@openssh.com", "chacha20-poly1305@openssh.com"})
		== "aes128-gcm@openssh.com");
}

// the agreement keeps a reference to our algorithms, temporaries are rejected
static_assert(!std::is_constructible_v<kexinit_agreement, logger&, supported_algorithms>);
static_assert(std::is_constructible_v<kexinit_agreement, logger&, supported_algorithms const&>);

TEST_CASE("kexinit agreement with peer offering unknown algorithms", "[unit]") {
	// what we would parse from a peer that prefers algorithms we don't implement
	supported_algorithms remote;
	remote.kexes = algo_list_from_string_list<kex_type>({"sntrup761x25519-sha512@openssh.com", "curve25519-sha256"});
	remote.host_keys = algo_list_from_string_list<key_type>({"ecdsa-sha2-nistp256", "ssh-ed25519"});
	remote.client_server_ciphers = algo_list_from_string_list<cipher_type>({"chacha20-poly1305@openssh.com", "aes128-gcm@openssh.com"});
	remote.server_client_ciphers = remote.client_server_ciphers;
	remote.client_server_macs = algo_list_from_string_list<mac_type>({"umac-128-etm@openssh.com", "hmac-sha2-512"});
	remote.server_client_macs = remote.client_server_macs;

	supported_algorithms const mine = all_supported_algorithms();
	kexinit_agreement kagree(test_log(), mine);
	REQUIRE(kagree.agree(remote));
	auto conf = kagree.agreed_configuration();
	CHECK(conf.kex == kex_type::curve25519_sha256);
	CHECK(conf.host_key == key_type::ssh_ed25519);
	CHECK(conf.out.cipher == cipher_type::openssh_aes_128_gcm);
	CHECK(conf.out.mac == mac_type::implicit);
	CHECK(conf.in.cipher == cipher_type::openssh_aes_128_gcm);
}

}
