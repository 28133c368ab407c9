#pragma once

#include "aqwave/types.hpp"
#include "logging/spsc_ring.hpp"
#include "streaming/protocol.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

// lz4frame.h stays out of the header
typedef struct LZ4F_cctx_s LZ4F_cctx;

namespace aqwave {

// Relays live samples to one TCP client (plotting front end).
// Per connection: one metadata JSON line, then LZ4-compressed batches
//   [uint32 compressed_size][uint32 sample_count][LZ4 frame]
// A new client replaces the current one. Samples queued while nobody is
// connected are discarded.
class StreamingServer {
public:
    explicit StreamingServer(const DeviceInfo& info);
    ~StreamingServer();

    StreamingServer(const StreamingServer&) = delete;
    StreamingServer& operator=(const StreamingServer&) = delete;

    // Called from the acquisition loop, never blocks
    void push_sample(const DataSample& s) {
        if (!ring_.try_push(s)) {
            stream_drops_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Returns false if the socket could not be set up. Port 0 lets the
    // kernel pick one, see port().
    bool start(const char* host, int port);
    void stop();

    // Port actually listened on, 0 before start()
    int port() const { return bound_port_; }

    struct Stats {
        uint64_t samples_sent;
        uint64_t batches_sent;
        uint64_t drops;
        uint64_t reconnects;
        size_t   ring_queued;
        bool     connected;
    };
    Stats get_stats() const;

private:
    void accept_loop();
    void stream_loop();

    // Take over a client handed off by accept_loop and send it the metadata
    void adopt_pending_client();
    // Non-blocking peek for FIN or a socket error, at most once per second
    bool client_alive(double now);
    // Compress the current batch into frame_buf_ and send it
    bool send_batch(int batch_count);
    void drop_client(const char* reason);

    SPSCRing<DataSample, 256> ring_;

    std::thread accept_thread_;
    std::thread stream_thread_;
    std::atomic<bool> stop_flag_;

    // Accept -> stream handoff (fd or -1)
    std::atomic<int> pending_client_fd_;

    int listen_fd_;
    int bound_port_;

    // Stream thread only
    int client_fd_;
    int batch_count_;
    double last_flush_time_;
    double last_alive_check_;
    uint32_t sample_number_;  // per connection

    uint8_t batch_buf_[BATCH_SIZE * WIRE_SAMPLE_SIZE];

    // [uint32 compressed_size][uint32 sample_count][LZ4 frame], sized for a full batch
    std::unique_ptr<uint8_t[]> frame_buf_;
    size_t frame_cap_;

    LZ4F_cctx* lz4_ctx_;

    char metadata_buf_[512];
    int  metadata_len_;

    std::atomic<uint64_t> samples_sent_;
    std::atomic<uint64_t> batches_sent_;
    std::atomic<uint64_t> stream_drops_;
    std::atomic<uint64_t> reconnects_;
    std::atomic<bool>     connected_;
};

} // namespace aqwave
