#ifndef SSHC_CORE_KEX_KEX_PACKETS_HEADER
#define SSHC_CORE_KEX_KEX_PACKETS_HEADER

#include "sshc/core/packet_ser.hpp"

namespace securepath::sshc {

// both exchange families use the same message numbers from the method specific range
enum kex_packet_type : std::uint8_t {
	ssh_kex_ecdh_init = 30,
	ssh_kex_ecdh_reply = 31,
	ssh_kexdh_init = 30,
	ssh_kexdh_reply = 31
};

namespace ser {

/*
	byte     SSH_MSG_KEX_ECDH_INIT
	string   Q_C, client's ephemeral public key octet string
*/
using kex_ecdh_init = ssh_packet_ser
<
	ssh_kex_ecdh_init,
	string
>;

/*
	byte     SSH_MSG_KEX_ECDH_REPLY
	string   K_S, server's public host key
	string   Q_S, server's ephemeral public key octet string
	string   the signature on the exchange hash
*/
using kex_ecdh_reply = ssh_packet_ser
<
	ssh_kex_ecdh_reply,
	string,
	string,
	string
>;

/*
	byte     SSH_MSG_KEXDH_INIT
	mpint    e = g^x mod p
*/
using kexdh_init = ssh_packet_ser
<
	ssh_kexdh_init,
	mpint
>;

/*
	byte     SSH_MSG_KEXDH_REPLY
	string   server public host key and certificates (K_S)
	mpint    f = g^y mod p
	string   signature of H
*/
using kexdh_reply = ssh_packet_ser
<
	ssh_kexdh_reply,
	string,
	mpint,
	string
>;

}
}

#endif
