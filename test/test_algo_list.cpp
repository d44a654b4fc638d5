
#include "log.hpp"
#include "sshc/common/algo_list.hpp"
#include "sshc/core/supported_algorithms.hpp"

#include <catch2/catch.hpp>

namespace securepath::sshc::test {
namespace {
enum class test_algos {
	test1,
	test2,
	test3
};

std::string_view to_string(test_algos t) {
	using enum test_algos;
	if(t == test1) return "test1";
	if(t == test2) return "test2";
	if(t == test3) return "test3";
	return "unknown";
}

}

TEST_CASE("algo_list", "[unit]") {
	using enum test_algos;
	{
		algo_list<test_algos> list;
		CHECK(list.name_list().empty());
		CHECK(list.name_list_string() == "");

		list.add_back(test1);
		CHECK(list.name_list_string() == "test1");
		list.add_back(test2);
		CHECK(list.name_list_string() == "test1,test2");
		list.add_front(test3);
		CHECK(list.name_list_string() == "test3,test1,test2");
		list.remove(test1);
		CHECK(list.name_list_string() == "test3,test2");

		CHECK(list.front() == test3);
	}
	{
		algo_list<test_algos> list({test1,test2,test3});
		CHECK(list.name_list() == std::vector<std::string_view>({"test1", "test2", "test3"}));
		CHECK(list.name_list_string() == "test1,test2,test3");
	}
	{
		algo_list<test_algos> list({test3,test1});
		CHECK(list.name_list() == std::vector<std::string_view>({"test3", "test1"}));
		CHECK(list.name_list_string() == "test3,test1");
	}
}

TEST_CASE("algo_list from peer names", "[unit]") {
	auto list = algo_list_from_string_list<cipher_type>({"chacha20-poly1305@openssh.com", "aes128-ctr", "aes256-gcm@openssh.com", "aes128-ctr"});
	CHECK(list.name_list_string() == "aes128-ctr,aes256-gcm@openssh.com");
	CHECK(list.supports(cipher_type::aes_128_ctr));
	CHECK(!list.supports(cipher_type::aes_256_ctr));
}

TEST_CASE("supported algorithm preference", "[unit]") {
	auto algs = all_supported_algorithms();
	CHECK(algs.valid());
	CHECK(algs.preference(method_type::kex) == "curve25519-sha256,curve25519-sha256@libssh.org,diffie-hellman-group16-sha512,diffie-hellman-group14-sha256");
	CHECK(algs.preference(method_type::comp_cs) == "none");

	CHECK(algs.set_preference(method_type::crypt_cs, "foo,aes128-ctr,aes256-ctr"));
	CHECK(algs.preference(method_type::crypt_cs) == "aes128-ctr,aes256-ctr");
	CHECK(algs.preference(method_type::crypt_sc) == "aes256-gcm@openssh.com,aes128-gcm@openssh.com,aes256-ctr,aes128-ctr");

	// nothing we implement
	CHECK(!algs.set_preference(method_type::mac_sc, "hmac-md5,umac-64@openssh.com"));
	CHECK(algs.preference(method_type::mac_sc) == "hmac-sha2-256,hmac-sha2-512");

	algs.host_keys.clear();
	CHECK(!algs.valid());
}

}
