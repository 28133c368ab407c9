#pragma once

#include "aqwave/types.hpp"

#include <cstddef>
#include <cstdint>

namespace aqwave {

// Relay protocol constants
constexpr int    BATCH_SIZE        = 10;
constexpr int    FLUSH_TIMEOUT_MS  = 100;
constexpr double SEND_TIMEOUT_SEC  = 2.0;
constexpr int    LISTEN_BACKLOG    = 1;
constexpr int    STREAM_RATE_HZ    = 60;
constexpr int    WIRE_FIELDS       = 5;  // pulse, ppg, ppg_alt, heart_rate, spo2

// Wire sample: timestamp f64 (8) + sample_number u32 (4) + 5 x i32 (20), LE
constexpr size_t WIRE_SAMPLE_SIZE = 8 + 4 + WIRE_FIELDS * 4;

// Pack a sample into dst (at least WIRE_SAMPLE_SIZE bytes). Returns bytes written.
size_t pack_sample(uint8_t* dst, const DataSample& s, uint32_t sample_number);

// Metadata JSON sent once per connection, with trailing '\n'.
// Returns the number of bytes written (snprintf semantics).
int build_metadata_json(char* buf, size_t cap, const DeviceInfo& info);

// Non-blocking send loop with poll(POLLOUT) and MSG_NOSIGNAL.
// Returns true if all data was sent, false on timeout or error.
bool send_all(int fd, const uint8_t* data, size_t len, double timeout_sec);

} // namespace aqwave
