#ifndef SSHC_CORE_CONSTANTS_HEADER
#define SSHC_CORE_CONSTANTS_HEADER

#include <cstddef>
#include <cstdint>

namespace securepath::sshc {

std::size_t constexpr packet_length_size = 4;
std::size_t constexpr padding_size = 1;
// header size = packet_length 4 bytes + padding length 1 byte
std::size_t constexpr packet_header_size = packet_length_size + padding_size;
std::size_t constexpr maximum_padding_size = 255;

// minimum "block" size, the length of header+payload must be multiple of the "block" size (even for stream ciphers).
std::size_t constexpr minimum_block_size = 8;

// at least 4 bytes of padding is always required per SSH specification
std::size_t constexpr minimum_padding_size = 4;

// smallest packet_length field value that can hold the padding length byte and minimum padding
std::size_t constexpr minimum_packet_length = padding_size + minimum_padding_size;

// size of the kex init cookie
std::size_t constexpr cookie_size = 16;

// identification line including CR LF
std::size_t constexpr maximum_version_line_size = 255;

}

#endif
