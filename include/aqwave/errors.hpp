#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace aqwave {

// Base class for every failure raised by the protocol core.
// None of them are retried: a mismatch aborts the current exchange.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// Packet length outside [2, 9]. Means the transport misread the framing.
class ContractViolation : public ProtocolError {
public:
    explicit ContractViolation(size_t length);

    size_t length() const { return length_; }

private:
    size_t length_;
};

// Decoded type differs from the one the exchange expects
class UnexpectedPacketType : public ProtocolError {
public:
    UnexpectedPacketType(uint8_t expected, uint8_t actual);

    uint8_t expected() const { return expected_; }
    uint8_t actual() const { return actual_; }

private:
    uint8_t expected_;
    uint8_t actual_;
};

// Read or write did not complete before the transport timeout
class TransportTimeout : public ProtocolError {
public:
    TransportTimeout(size_t expected, size_t transferred);

    size_t expected() const { return expected_; }
    size_t transferred() const { return transferred_; }

private:
    size_t expected_;
    size_t transferred_;
};

// Syscall failure on the serial device (errno preserved)
class TransportError : public ProtocolError {
public:
    TransportError(const char* op, int err);

    int error_code() const { return err_; }

private:
    int err_;
};

// Stop acknowledgment was not OK. The stream data was already delivered, so
// this is reported next to a successful completion and never thrown.
struct SoftAcknowledgmentMismatch {
    uint8_t expected;
    uint8_t actual;

    std::string message() const;
};

} // namespace aqwave
