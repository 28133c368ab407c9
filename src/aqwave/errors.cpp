#include "aqwave/errors.hpp"
#include "aqwave/frame_codec.hpp"

#include <cstdio>
#include <cstring>

namespace aqwave {

static std::string format_contract(size_t length) {
    char buf[96];
    std::snprintf(buf, sizeof(buf),
                  "packet length %zu outside [%zu, %zu]",
                  length, MIN_PACKET_LEN, MAX_PACKET_LEN);
    return buf;
}

static std::string format_type(uint8_t expected, uint8_t actual) {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "expected packet type 0x%02X (%s), got 0x%02X (%s)",
                  expected, packet_type_name(expected),
                  actual, packet_type_name(actual));
    return buf;
}

static std::string format_timeout(size_t expected, size_t transferred) {
    char buf[96];
    std::snprintf(buf, sizeof(buf),
                  "transport timeout: %zu of %zu bytes transferred",
                  transferred, expected);
    return buf;
}

static std::string format_errno(const char* op, int err) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s failed: %s", op, std::strerror(err));
    return buf;
}

ContractViolation::ContractViolation(size_t length)
    : ProtocolError(format_contract(length)), length_(length) {}

UnexpectedPacketType::UnexpectedPacketType(uint8_t expected, uint8_t actual)
    : ProtocolError(format_type(expected, actual)), expected_(expected), actual_(actual) {}

TransportTimeout::TransportTimeout(size_t expected, size_t transferred)
    : ProtocolError(format_timeout(expected, transferred))
    , expected_(expected)
    , transferred_(transferred) {}

TransportError::TransportError(const char* op, int err)
    : ProtocolError(format_errno(op, err)), err_(err) {}

std::string SoftAcknowledgmentMismatch::message() const {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "data stream stopped but acknowledgment was 0x%02X (%s), not 0x%02X (%s)",
                  actual, packet_type_name(actual),
                  expected, packet_type_name(expected));
    return buf;
}

} // namespace aqwave
