#include "configs.hpp"
#include "crypto.hpp"
#include "util.hpp"
#include "test/util/memory_stream.hpp"

#include "sshc/client/session.hpp"
#include "sshc/common/util.hpp"
#include "sshc/core/ssh_public_key.hpp"

#include <algorithm>
#include <thread>

namespace securepath::sshc::test {
namespace {

template<typename Pred>
bool wait_for(Pred&& p, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
	auto end = std::chrono::steady_clock::now() + timeout;
	while(!p()) {
		if(std::chrono::steady_clock::now() >= end) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	return true;
}

std::string read_all(session& s, channel_id id, bool err = false) {
	std::string res;
	byte_vector buf(7);
	for(;;) {
		std::size_t size{};
		op_result r = err ? s.read_stderr(id, buf, size) : s.read(id, buf, size);
		REQUIRE(r);
		if(!size) {
			break;
		}
		res.append(to_string_view(const_span(buf.data(), size)));
	}
	return res;
}

struct connected_session {
	connected_session() {
		responder.with_server([](test_server& srv) {
			srv.auth_data.add_password("test", "some");
		});
		REQUIRE(s.handshake());
		REQUIRE(s.userauth_password("test", "some"));
	}

	test_responder responder;
	session s{test_client_config(), test_log(), responder.client_stream()};
};

}

TEST_CASE("session handshake and auth", "[unit][connection]") {
	test_responder responder;
	responder.with_server([](test_server& srv) {
		srv.auth_data.add_password("test", "some");
	});
	session s(test_client_config(), test_log(), responder.client_stream());

	CHECK(s.state() == session_state::connecting);
	CHECK(!s.host_key());

	// configuration can be changed until the handshake
	CHECK(s.set_version_software("sshc_session_test"));
	CHECK(s.method_pref(method_type::kex, "curve25519-sha256"));
	CHECK(!s.method_pref(method_type::kex, "unknown-kex"));

	REQUIRE(s.handshake());
	CHECK(!s.set_version_software("other"));
	CHECK(!s.method_pref(method_type::kex, "diffie-hellman-group14-sha256"));

	CHECK(s.state() == session_state::authenticating);
	CHECK(s.remote_banner() == "SSH-2.0-sshc_test_server");
	CHECK(s.methods(method_type::kex) == "curve25519-sha256");
	CHECK(s.methods(method_type::host_key) == "ssh-ed25519");

	auto key = s.host_key();
	REQUIRE(key);
	CHECK(key->type == key_type::ssh_ed25519);
	CHECK(key->fingerprint == ed25519_fprint);
	CHECK(compare_equal(key->blob, decode_base64(ed25519_pubkey)));

	std::string methods;
	REQUIRE(s.auth_methods("test", methods));
	CHECK(methods == "publickey,password,keyboard-interactive");

	op_result wrong = s.userauth_password("test", "wrong");
	CHECK(wrong.kind == error_kind::auth_failure);
	CHECK(wrong.code == sshc_auth_failed);
	CHECK(!s.authenticated());

	REQUIRE(s.userauth_password("test", "some"));
	CHECK(s.authenticated());
	CHECK(s.state() == session_state::authenticated);
	CHECK(s.last_error());

	op_result again = s.userauth_password("test", "some");
	CHECK(again.kind == error_kind::invalid_state);
}

TEST_CASE("session supported algorithms", "[unit]") {
	auto kexes = session::supported_algs(method_type::kex);
	CHECK(std::find(kexes.begin(), kexes.end(), "curve25519-sha256") != kexes.end());
	CHECK(std::find(kexes.begin(), kexes.end(), "diffie-hellman-group14-sha256") != kexes.end());
}

TEST_CASE("session public key auth", "[unit][crypto][connection]") {
	crypto_test_context ctx;
	auto key = ctx.test_ed25519_private_key();

	test_responder responder;
	responder.with_server([&](test_server& srv) {
		srv.auth_data.add_key(to_byte_vector(key.public_key()));
	});
	session s(test_client_config(), test_log(), responder.client_stream());

	REQUIRE(s.handshake());
	REQUIRE(s.userauth_publickey("test", key));
	CHECK(s.authenticated());
}

TEST_CASE("session exec", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.exec_reply = test_exec_reply{"hello world\n", "some warning\n", 3};
	});

	channel_id id{};
	REQUIRE(c.s.channel_session(id));
	CHECK(id == 1);

	REQUIRE(c.s.env(id, "LANG", "C"));
	REQUIRE(c.s.exec(id, "echo hello world"));

	CHECK(read_all(c.s, id) == "hello world\n");
	CHECK(read_all(c.s, id, true) == "some warning\n");

	REQUIRE(c.s.wait_closed(id));
	CHECK(c.s.exit_status(id) == 3u);
	CHECK(!c.s.exit_signal(id));

	REQUIRE(c.s.channel_free(id));
	// freed channel reads as end of stream
	byte_vector buf(10);
	std::size_t size = 5;
	CHECK(c.s.read(id, buf, size));
	CHECK(size == 0);
	CHECK(!c.s.exit_status(id));

	channel_id next{};
	REQUIRE(c.s.channel_session(next));
	CHECK(next == id + 1);
}

TEST_CASE("session channel data both ways", "[unit][connection]") {
	connected_session c;

	channel_id id{};
	REQUIRE(c.s.channel_session(id));
	REQUIRE(c.s.shell(id));

	std::string data(100000, 'x');
	REQUIRE(c.s.write(id, to_span(data)));
	REQUIRE(c.s.write_stderr(id, to_span(std::string_view("err"))));
	REQUIRE(c.s.send_eof(id));

	CHECK(wait_for([&] {
		return c.responder.with_server([](test_server& srv) {
			auto ch = srv.last_channel();
			return ch && ch->eof_received;
		});
	}));

	c.responder.with_server([&](test_server& srv) {
		auto ch = srv.last_channel();
		REQUIRE(ch);
		CHECK(ch->data.size() == data.size());
		CHECK(to_string_view(ch->ext_data) == "err");
		CHECK(ch->requests == std::vector<std::string>{"shell"});
		srv.send_data(ch->id, "reply");
		srv.send_close(ch->id);
	});

	CHECK(read_all(c.s, id) == "reply");
	REQUIRE(c.s.wait_closed(id));

	// writing to closed channel
	op_result w = c.s.write(id, to_span(std::string_view("late")));
	CHECK(w.kind == error_kind::invalid_state);
}

TEST_CASE("session request refused", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.refuse_requests = {"subsystem"};
	});

	channel_id id{};
	REQUIRE(c.s.channel_session(id));

	op_result r = c.s.subsystem(id, "sftp");
	CHECK(r.kind == error_kind::request_failure);
	CHECK(r.code == sshc_request_failed);

	// the channel is still usable
	REQUIRE(c.s.request_pty(id, pty_settings{}));
	REQUIRE(c.s.window_change(id, 120, 40, 0, 0));
	REQUIRE(c.s.close(id));
	REQUIRE(c.s.wait_closed(id));
}

TEST_CASE("session open refused", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.refuse_open = true;
	});

	channel_id id{};
	op_result r = c.s.channel_session(id);
	CHECK(r.kind == error_kind::open_failure);
	CHECK(r.code == sshc_open_failed);
	CHECK(c.s.last_error());
}

TEST_CASE("session calls before authentication", "[unit][connection]") {
	test_responder responder;
	session s(test_client_config(), test_log(), responder.client_stream());

	channel_id id{};
	// not started
	CHECK(s.channel_session(id).kind == error_kind::invalid_state);

	REQUIRE(s.handshake());
	CHECK(s.channel_session(id).kind == error_kind::invalid_state);
	CHECK(s.exec(5, "ls").kind == error_kind::invalid_state);
}

TEST_CASE("session read timeout and cancel", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.exec_reply = test_exec_reply{"done\n"};
	});

	channel_id id{};
	REQUIRE(c.s.channel_session(id));

	byte_vector buf(100);
	std::size_t size{};

	SECTION("timeout") {
		c.s.set_timeout(std::chrono::milliseconds(50));
		CHECK(c.s.timeout() == std::chrono::milliseconds(50));

		op_result r = c.s.read(id, buf, size);
		CHECK(r.kind == error_kind::timeout);
		CHECK(r.code == sshc_timeout);
		CHECK(size == 0);
		c.s.set_timeout(std::chrono::milliseconds(0));
	}
	SECTION("cancelled") {
		cancel_token token;
		std::thread t([token]() mutable {
			std::this_thread::sleep_for(std::chrono::milliseconds(30));
			token.cancel();
		});
		op_result r = c.s.read(id, buf, size, token);
		t.join();
		CHECK(r.kind == error_kind::cancelled);
		CHECK(r.code == sshc_cancelled);
	}

	// the channel stays usable
	CHECK(c.s.last_error());
	REQUIRE(c.s.exec(id, "true"));
	CHECK(read_all(c.s, id) == "done\n");
}

TEST_CASE("session write cancelled while waiting for window", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.window_size = 1024;
		srv.auto_adjust = false;
	});

	channel_id id{};
	REQUIRE(c.s.channel_session(id));

	std::string data(5000, 'a');
	cancel_token token;
	std::thread t([token]() mutable {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		token.cancel();
	});
	op_result r = c.s.write(id, to_span(data), token);
	t.join();
	CHECK(r.kind == error_kind::cancelled);

	// the part that fit in the window was sent, the rest dropped
	CHECK(wait_for([&] {
		return c.responder.with_server([](test_server& srv) {
			return srv.last_channel()->data.size() == 1024;
		});
	}));

	c.responder.with_server([](test_server& srv) {
		srv.send_window_adjust(srv.last_channel()->id, 1024);
	});
	REQUIRE(c.s.write(id, to_span(std::string_view("more"))));
	CHECK(wait_for([&] {
		return c.responder.with_server([](test_server& srv) {
			return srv.last_channel()->data.size() == 1028;
		});
	}));
}

TEST_CASE("session write dropped by close", "[unit][connection]") {
	connected_session c;
	c.responder.with_server([](test_server& srv) {
		srv.window_size = 1024;
		srv.auto_adjust = false;
	});

	channel_id id{};
	REQUIRE(c.s.channel_session(id));

	std::thread t([&] {
		wait_for([&] {
			return c.responder.with_server([](test_server& srv) {
				return srv.last_channel()->data.size() == 1024;
			});
		});
		c.responder.with_server([](test_server& srv) {
			srv.send_close(srv.last_channel()->id);
		});
	});

	std::string data(5000, 'a');
	op_result r = c.s.write(id, to_span(data));
	t.join();
	CHECK(r.kind == error_kind::invalid_state);
	REQUIRE(c.s.wait_closed(id));
}

TEST_CASE("session connection lost", "[unit][connection]") {
	connected_session c;

	channel_id id1{}, id2{};
	REQUIRE(c.s.channel_session(id1));
	REQUIRE(c.s.channel_session(id2));

	op_result r1, r2;
	std::thread t1([&] {
		byte_vector buf(10);
		std::size_t size{};
		r1 = c.s.read(id1, buf, size);
	});
	std::thread t2([&] {
		byte_vector buf(10);
		std::size_t size{};
		r2 = c.s.read(id2, buf, size);
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	c.responder.cut();
	t1.join();
	t2.join();

	// every pending call gets the same terminal error
	CHECK(r1.kind == error_kind::disconnected);
	CHECK(r1.code == ssh_connection_lost);
	CHECK(r2.kind == r1.kind);
	CHECK(r2.code == r1.code);

	// and so do later ones
	op_result r3 = c.s.write(id1, to_span(std::string_view("x")));
	CHECK(r3.code == ssh_connection_lost);
	CHECK(c.s.last_error().code == ssh_connection_lost);
	CHECK(c.s.state() == session_state::closed);
}

TEST_CASE("session disconnect", "[unit][connection]") {
	test_responder responder;
	{
		session s(test_client_config(), test_log(), responder.client_stream());
		REQUIRE(s.handshake());

		SECTION("explicit") {
			REQUIRE(s.disconnect(ssh_disconnect_by_application, "bye"));
			CHECK(s.state() == session_state::closed);

			op_result r = s.handshake();
			CHECK(r.kind == error_kind::disconnected);
		}
		SECTION("destroyed") {}
	}

	CHECK(wait_for([&] {
		return responder.with_server([](test_server& srv) {
			return srv.remote_disconnect().has_value();
		});
	}));
	responder.with_server([](test_server& srv) {
		CHECK(srv.remote_disconnect()->code == ssh_disconnect_by_application);
	});
}

}
