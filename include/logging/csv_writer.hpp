#pragma once

#include "aqwave/types.hpp"
#include "logging/spsc_ring.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <thread>

namespace aqwave {

// Writer thread draining live samples from an SPSC ring into a CSV file.
// Columns: time,pulse,ppg,ppg_alt,heart_rate,spo2
// fopen + 1MB setvbuf, rows formatted with std::to_chars into a fixed buffer.
class CSVWriter {
public:
    CSVWriter(const char* filename, SPSCRing<DataSample>& ring);
    ~CSVWriter();

    CSVWriter(const CSVWriter&) = delete;
    CSVWriter& operator=(const CSVWriter&) = delete;

    bool is_open() const { return file_ != nullptr; }

    void start();

    // Stop the thread, write what is still queued, flush and close
    void stop();

    uint64_t total_written() const { return total_written_; }

    // Format one row (with trailing '\n') into buf. Returns bytes written.
    static size_t format_row(char* buf, size_t cap, const DataSample& s);

private:
    void run();
    size_t drain();

    SPSCRing<DataSample>& ring_;
    FILE* file_;

    std::atomic<bool> running_;
    std::thread thread_;
    uint64_t total_written_;

    static constexpr size_t ROW_BUF_SIZE = 128;
    char row_buf_[ROW_BUF_SIZE];

    char file_buf_[1024 * 1024];
};

// Dump a downloaded recording: index,heart_rate,spo2 (one row per second).
// Returns false if the file cannot be written.
bool write_recording_csv(const char* filename, const RecordedData& data);

} // namespace aqwave
