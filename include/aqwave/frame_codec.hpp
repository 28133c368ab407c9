#pragma once

#include "aqwave/codes.hpp"
#include "aqwave/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aqwave {

// Build the 3-byte command frame [0x7D, 0x81, cmd]
std::array<uint8_t, COMMAND_FRAME_LEN> encode_command(Cmd cmd);

// Decode a response packet.
//
//   | 00 | 01 | 02 | 03 | 04 | 05 | 06 | 07 | 08 |
//   +----+----+----+----+----+----+----+----+----+
//   |type|sign| d0   d1   d2   d3   d4   d5   d6 |
//
// Bit i of the sign mask set: d_i is unsigned and kept as-is.
// Bit i clear: d_i is signed, value = d_i - 128.
// Throws ContractViolation unless 2 <= len <= 9. Never truncates.
DecodedPacket decode(const uint8_t* data, size_t len);
DecodedPacket decode(const std::vector<uint8_t>& packet);

// Payload as text: each non-zero value becomes one character, zeros dropped
std::string payload_to_string(const DecodedPacket& packet);

// Names for log and error output ("?" for codes outside the known set)
const char* packet_type_name(uint8_t type);
const char* command_name(Cmd cmd);

} // namespace aqwave
