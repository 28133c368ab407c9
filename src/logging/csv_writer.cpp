#include "logging/csv_writer.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <time.h>

namespace aqwave {

CSVWriter::CSVWriter(const char* filename, SPSCRing<DataSample>& ring)
    : ring_(ring)
    , file_(nullptr)
    , running_(false)
    , total_written_(0)
{
    std::memset(row_buf_, 0, sizeof(row_buf_));

    file_ = std::fopen(filename, "w");
    if (!file_) {
        std::perror(filename);
        return;
    }

    std::setvbuf(file_, file_buf_, _IOFBF, sizeof(file_buf_));
    std::fprintf(file_, "time,pulse,ppg,ppg_alt,heart_rate,spo2\n");
}

CSVWriter::~CSVWriter() {
    stop();
}

size_t CSVWriter::format_row(char* buf, size_t cap, const DataSample& s) {
    char* p = buf;
    char* end = buf + cap - 1;  // room for '\n'

    // to_chars float support varies, timestamp goes through snprintf
    int n = std::snprintf(p, end - p, "%.6f", s.timestamp);
    if (n > 0) p += std::min<size_t>(static_cast<size_t>(n), static_cast<size_t>(end - p));

    const int fields[] = {s.pulse, s.ppg, s.ppg_alt, s.heart_rate, s.spo2};
    for (int v : fields) {
        if (p >= end) break;
        *p++ = ',';
        auto [ptr, ec] = std::to_chars(p, end, v);
        if (ec == std::errc()) {
            p = ptr;
        }
    }
    *p++ = '\n';
    return static_cast<size_t>(p - buf);
}

void CSVWriter::start() {
    if (!file_) return;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&CSVWriter::run, this);
}

void CSVWriter::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }

    if (file_) {
        drain();
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;

        std::printf("  [CSV] %lu samples written\n",
                    static_cast<unsigned long>(total_written_));
    }
}

size_t CSVWriter::drain() {
    size_t rows = 0;
    DataSample sample;
    while (ring_.try_pop(sample)) {
        size_t len = format_row(row_buf_, ROW_BUF_SIZE, sample);
        std::fwrite(row_buf_, 1, len, file_);
        total_written_++;
        rows++;
    }
    return rows;
}

void CSVWriter::run() {
    // 60 Hz input, a 50ms idle nap keeps at most ~3 rows queued
    struct timespec idle_ts = {0, 50'000'000};

    while (running_.load(std::memory_order_acquire)) {
        if (drain() == 0) {
            nanosleep(&idle_ts, nullptr);
        }
    }
}

bool write_recording_csv(const char* filename, const RecordedData& data) {
    FILE* f = std::fopen(filename, "w");
    if (!f) {
        std::perror(filename);
        return false;
    }

    std::fprintf(f, "index,heart_rate,spo2\n");
    size_t rows = std::min(data.heart_rate.size(), data.spo2.size());
    for (size_t i = 0; i < rows; ++i) {
        std::fprintf(f, "%zu,%d,%d\n", i, data.heart_rate[i], data.spo2[i]);
    }

    bool ok = std::ferror(f) == 0;
    if (std::fclose(f) != 0) ok = false;
    return ok;
}

} // namespace aqwave
