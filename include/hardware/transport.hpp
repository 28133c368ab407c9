#pragma once

#include <cstddef>
#include <cstdint>

namespace aqwave {

// Byte transport to the recorder (USB-serial cable or Bluetooth SPP).
// Opening, closing and line configuration belong to the implementation.
// Single owner: one exchange at a time, no internal locking.
class Transport {
public:
    virtual ~Transport() = default;

    // Write all bytes. Throws TransportTimeout / TransportError on failure.
    virtual void write(const uint8_t* data, size_t len) = 0;

    // Block until len bytes arrived or the timeout expired.
    // Returns the number of bytes read; fewer than len only on timeout.
    virtual size_t read(uint8_t* buf, size_t len) = 0;

    // Discard everything received but not yet read
    virtual void reset_input_buffer() = 0;

    virtual double timeout() const = 0;
    virtual void set_timeout(double timeout_sec) = 0;
};

} // namespace aqwave
