#pragma once

#include "aqwave/codes.hpp"
#include "aqwave/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aqwave {

class Transport;

// Send-command / await-typed-packet exchange on top of a Transport.
// Not reentrant: a second command while an exchange is outstanding makes the
// device interleave bytes. All queries and streams share one session.
class CommandSession {
public:
    explicit CommandSession(Transport& transport);

    CommandSession(const CommandSession&) = delete;
    CommandSession& operator=(const CommandSession&) = delete;

    // Write the 3-byte command frame
    void send_command(Cmd cmd);

    // Read exactly len bytes. Throws TransportTimeout on a short read.
    void read_exact(uint8_t* buf, size_t len);

    // Read exactly len bytes and decode them
    DecodedPacket read_packet(size_t len);

    // Same, and throw UnexpectedPacketType unless the type matches
    DecodedPacket read_packet(size_t len, PacketType expected);

    // send_command + read_packet(response_len, expected)
    DecodedPacket query(Cmd cmd, PacketType expected, size_t response_len);

    // One command, packet_count typed reads, each payload turned into text
    std::vector<std::string> query_strings(Cmd cmd, PacketType expected,
                                           size_t packet_len = STRING_PACKET_LEN,
                                           int packet_count = 1);

    // Single-packet form of query_strings
    std::string query_string(Cmd cmd, PacketType expected,
                             size_t packet_len = STRING_PACKET_LEN);

    // Best-effort flush: read up to max_bytes (a short read is expected),
    // then reset the input buffer. Returns the number of bytes discarded.
    size_t drain(size_t max_bytes);

    Transport& transport() { return transport_; }

private:
    Transport& transport_;

    // Largest single packet; bulk reads go through read_exact
    uint8_t packet_buf_[MAX_PACKET_LEN];
};

} // namespace aqwave
